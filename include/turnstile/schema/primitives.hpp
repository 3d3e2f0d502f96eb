#pragma once
#include <array>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace turnstile::schema {

using bytes_t = std::vector<uint8_t>;
using bytes_view_t = std::span<const uint8_t>;
using hash32_t = std::array<uint8_t, 32>;
// Ed25519 public key or program-derived address.
using address_t = std::array<uint8_t, 32>;
using ed25519_signature_t = std::array<uint8_t, 64>;
using amount_t = uint64_t;

bytes_view_t make_bytes_view(const bytes_t& bytes);
bytes_view_t make_bytes_view(const std::string& bytes);
bytes_view_t make_bytes_view(const std::string_view& bytes);

/// Parse a base-10 unsigned 64-bit integer. Rejects signs, whitespace,
/// fractions and values that overflow.
std::optional<uint64_t> try_parse_u64(std::string_view value);

}  // namespace turnstile::schema

template <class... Ts>
struct overloaded : Ts... {
  using Ts::operator()...;
};
template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;
