#pragma once
#include <turnstile/schema/primitives.hpp>

#include <optional>
#include <string>
#include <string_view>

// Bitcoin-alphabet base58, the textual form of SVM addresses and signatures.
namespace turnstile::schema::encoding {

std::string encode_base58(const bytes_view_t& bytes);
std::optional<bytes_t> decode_base58(std::string_view text);

std::string to_base58(const address_t& address);
/// Decodes and requires exactly 32 bytes.
std::optional<address_t> try_make_address(std::string_view text);

}  // namespace turnstile::schema::encoding
