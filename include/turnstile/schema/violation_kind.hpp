#pragma once

#include <turnstile/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

namespace turnstile::schema {

// Why a claim failed structural validation. Logged verbatim, generalised
// in caller-facing messages.
enum class violation_kind : uint16_t {
  malformed_transaction = 1,
  instruction_layout = 2,
  gas_price_out_of_bounds = 3,
  fee_payer_conflict = 4,
  destination_mismatch = 5,
  asset_mismatch = 6,
  amount_mismatch = 7,
  requirement_mismatch = 8,
  unsupported_network = 9,
};

inline constexpr auto kViolationKindMappings = std::array{
    std::pair<std::string_view, violation_kind>{
        "malformed_transaction", violation_kind::malformed_transaction},
    std::pair<std::string_view, violation_kind>{
        "instruction_layout", violation_kind::instruction_layout},
    std::pair<std::string_view, violation_kind>{
        "gas_price_out_of_bounds", violation_kind::gas_price_out_of_bounds},
    std::pair<std::string_view, violation_kind>{
        "fee_payer_conflict", violation_kind::fee_payer_conflict},
    std::pair<std::string_view, violation_kind>{
        "destination_mismatch", violation_kind::destination_mismatch},
    std::pair<std::string_view, violation_kind>{"asset_mismatch",
                                                violation_kind::asset_mismatch},
    std::pair<std::string_view, violation_kind>{
        "amount_mismatch", violation_kind::amount_mismatch},
    std::pair<std::string_view, violation_kind>{
        "requirement_mismatch", violation_kind::requirement_mismatch},
    std::pair<std::string_view, violation_kind>{
        "unsupported_network", violation_kind::unsupported_network},
};

template <>
inline std::optional<violation_kind> try_from_string<violation_kind>(
    const std::string_view value) {
  return lookup_value(kViolationKindMappings, value);
}

inline constexpr std::string_view to_string(const violation_kind value) {
  return name_of(kViolationKindMappings, value);
}

}  // namespace turnstile::schema
