#pragma once

#include <turnstile/schema/primitives.hpp>

#include <vector>

namespace turnstile::crypto {

/// SHA-256 over the concatenation of `parts`.
schema::hash32_t sha256(const std::vector<schema::bytes_view_t>& parts);

schema::hash32_t sha256(const schema::bytes_view_t& bytes);

}  // namespace turnstile::crypto
