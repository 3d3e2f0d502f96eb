#pragma once

#include <turnstile/schema/primitives.hpp>

namespace turnstile::crypto {

/// True when the 32 bytes decompress to a point on edwards25519.
/// Program-derived addresses must be off the curve so no private key exists.
bool is_on_curve(const schema::address_t& compressed);

}  // namespace turnstile::crypto
