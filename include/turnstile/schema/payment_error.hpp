#pragma once

#include <turnstile/schema/enum_string.hpp>
#include <turnstile/schema/violation_kind.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace turnstile::schema {

enum class payment_stage : uint8_t {
  extraction = 0,
  structural_validation = 1,
  verification = 2,
  settlement = 3,
};

inline constexpr auto kPaymentStageMappings = std::array{
    std::pair<std::string_view, payment_stage>{"extraction",
                                               payment_stage::extraction},
    std::pair<std::string_view, payment_stage>{
        "structural_validation", payment_stage::structural_validation},
    std::pair<std::string_view, payment_stage>{"verification",
                                               payment_stage::verification},
    std::pair<std::string_view, payment_stage>{"settlement",
                                               payment_stage::settlement},
};

inline constexpr std::string_view to_string(const payment_stage value) {
  return name_of(kPaymentStageMappings, value);
}

enum class error_kind : uint8_t {
  no_payment = 0,
  malformed = 1,
  structural_violation = 2,
  offer_expired = 3,
  facilitator_transient = 4,
  facilitator_rejected = 5,
  settlement_failed = 6,
  // The facilitator answered with a 4xx or a body that does not parse.
  facilitator_error = 7,
};

inline constexpr auto kErrorKindMappings = std::array{
    std::pair<std::string_view, error_kind>{"no_payment",
                                            error_kind::no_payment},
    std::pair<std::string_view, error_kind>{"malformed", error_kind::malformed},
    std::pair<std::string_view, error_kind>{
        "structural_violation", error_kind::structural_violation},
    std::pair<std::string_view, error_kind>{"offer_expired",
                                            error_kind::offer_expired},
    std::pair<std::string_view, error_kind>{
        "facilitator_transient", error_kind::facilitator_transient},
    std::pair<std::string_view, error_kind>{
        "facilitator_rejected", error_kind::facilitator_rejected},
    std::pair<std::string_view, error_kind>{"settlement_failed",
                                            error_kind::settlement_failed},
    std::pair<std::string_view, error_kind>{"facilitator_error",
                                            error_kind::facilitator_error},
};

template <>
inline std::optional<error_kind> try_from_string<error_kind>(
    const std::string_view value) {
  return lookup_value(kErrorKindMappings, value);
}

inline constexpr std::string_view to_string(const error_kind value) {
  return name_of(kErrorKindMappings, value);
}

/// Fixed context attached to every failure the orchestrator reports.
///
/// `reason` is internal detail for logs; `caller_message` is what may leave
/// the process.
struct error_context final {
  std::string trace_id;
  payment_stage stage{payment_stage::extraction};
  error_kind kind{error_kind::no_payment};
  std::optional<violation_kind> violation;
  std::string reason;
  std::string caller_message;
};

using error_context_t = error_context;

}  // namespace turnstile::schema
