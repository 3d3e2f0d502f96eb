#pragma once

#include <turnstile/schema/primitives.hpp>

#include <cstdint>
#include <initializer_list>
#include <optional>

namespace turnstile::svm {

struct program_address final {
  schema::address_t address{};
  uint8_t bump{};
};

using program_address_t = program_address;

/// sha256(seeds || program_id || "ProgramDerivedAddress"); nullopt when the
/// digest lands on the curve.
std::optional<schema::address_t> create_program_address(
    std::initializer_list<schema::bytes_view_t> seeds,
    const schema::address_t& program_id);

/// Walks the bump seed from 255 down to 0 and returns the first off-curve
/// address. nullopt only if every bump lands on the curve.
std::optional<program_address_t> find_program_address(
    std::initializer_list<schema::bytes_view_t> seeds,
    const schema::address_t& program_id);

std::optional<schema::address_t> associated_token_address(
    const schema::address_t& owner,
    const schema::address_t& mint,
    const schema::address_t& token_program);

}  // namespace turnstile::svm
