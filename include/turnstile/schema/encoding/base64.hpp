#pragma once
#include <turnstile/schema/primitives.hpp>

#include <optional>
#include <string>
#include <string_view>

namespace turnstile::schema::encoding {

/// RFC 4648 standard alphabet with '=' padding.
std::string encode_base64(const bytes_view_t& bytes);

/// Strict decode: padded input only, no whitespace, no URL-safe alphabet.
std::optional<bytes_t> decode_base64(std::string_view text);

}  // namespace turnstile::schema::encoding
