#pragma once

#include <turnstile/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

namespace turnstile::payment {

enum class payment_state : uint8_t {
  initial = 0,
  no_payment = 1,
  requirement_issued = 2,
  requirement_unavailable = 3,
  malformed = 4,
  payment_offered = 5,
  structurally_valid = 6,
  structurally_invalid = 7,
  offer_expired = 8,
  facilitator_verified = 9,
  facilitator_rejected = 10,
  facilitator_unavailable = 11,
  settled = 12,
  settlement_failed = 13,
  authorized = 14,
};

inline constexpr auto kPaymentStateMappings = std::array{
    std::pair<std::string_view, payment_state>{"initial",
                                               payment_state::initial},
    std::pair<std::string_view, payment_state>{"no_payment",
                                               payment_state::no_payment},
    std::pair<std::string_view, payment_state>{
        "requirement_issued", payment_state::requirement_issued},
    std::pair<std::string_view, payment_state>{
        "requirement_unavailable", payment_state::requirement_unavailable},
    std::pair<std::string_view, payment_state>{"malformed",
                                               payment_state::malformed},
    std::pair<std::string_view, payment_state>{"payment_offered",
                                               payment_state::payment_offered},
    std::pair<std::string_view, payment_state>{
        "structurally_valid", payment_state::structurally_valid},
    std::pair<std::string_view, payment_state>{
        "structurally_invalid", payment_state::structurally_invalid},
    std::pair<std::string_view, payment_state>{"offer_expired",
                                               payment_state::offer_expired},
    std::pair<std::string_view, payment_state>{
        "facilitator_verified", payment_state::facilitator_verified},
    std::pair<std::string_view, payment_state>{
        "facilitator_rejected", payment_state::facilitator_rejected},
    std::pair<std::string_view, payment_state>{
        "facilitator_unavailable", payment_state::facilitator_unavailable},
    std::pair<std::string_view, payment_state>{"settled",
                                               payment_state::settled},
    std::pair<std::string_view, payment_state>{
        "settlement_failed", payment_state::settlement_failed},
    std::pair<std::string_view, payment_state>{"authorized",
                                               payment_state::authorized},
};

inline constexpr std::string_view to_string(const payment_state value) {
  return schema::name_of(kPaymentStateMappings, value);
}

enum class payment_event : uint8_t {
  payment_absent = 0,
  requirement_built = 1,
  requirement_failed = 2,
  payment_malformed = 3,
  payment_extracted = 4,
  structure_accepted = 5,
  structure_rejected = 6,
  offer_stale = 7,
  verify_accepted = 8,
  verify_rejected = 9,
  facilitator_unreachable = 10,
  settle_succeeded = 11,
  settle_failed = 12,
  authorize = 13,
};

inline constexpr auto kPaymentEventMappings = std::array{
    std::pair<std::string_view, payment_event>{"payment_absent",
                                               payment_event::payment_absent},
    std::pair<std::string_view, payment_event>{
        "requirement_built", payment_event::requirement_built},
    std::pair<std::string_view, payment_event>{
        "requirement_failed", payment_event::requirement_failed},
    std::pair<std::string_view, payment_event>{
        "payment_malformed", payment_event::payment_malformed},
    std::pair<std::string_view, payment_event>{
        "payment_extracted", payment_event::payment_extracted},
    std::pair<std::string_view, payment_event>{
        "structure_accepted", payment_event::structure_accepted},
    std::pair<std::string_view, payment_event>{
        "structure_rejected", payment_event::structure_rejected},
    std::pair<std::string_view, payment_event>{"offer_stale",
                                               payment_event::offer_stale},
    std::pair<std::string_view, payment_event>{"verify_accepted",
                                               payment_event::verify_accepted},
    std::pair<std::string_view, payment_event>{"verify_rejected",
                                               payment_event::verify_rejected},
    std::pair<std::string_view, payment_event>{
        "facilitator_unreachable", payment_event::facilitator_unreachable},
    std::pair<std::string_view, payment_event>{
        "settle_succeeded", payment_event::settle_succeeded},
    std::pair<std::string_view, payment_event>{"settle_failed",
                                               payment_event::settle_failed},
    std::pair<std::string_view, payment_event>{"authorize",
                                               payment_event::authorize},
};

inline constexpr std::string_view to_string(const payment_event value) {
  return schema::name_of(kPaymentEventMappings, value);
}

// nullopt for any pair not in the table below; callers treat that as a
// broken invariant.
//
//   initial              --payment_absent-->          no_payment
//   initial              --payment_malformed-->       malformed
//   initial              --payment_extracted-->       payment_offered
//   no_payment           --requirement_built-->       requirement_issued
//   no_payment           --requirement_failed-->      requirement_unavailable
//   payment_offered      --structure_accepted-->      structurally_valid
//   payment_offered      --structure_rejected-->      structurally_invalid
//   structurally_valid   --offer_stale-->             offer_expired
//   structurally_valid   --verify_accepted-->         facilitator_verified
//   structurally_valid   --verify_rejected-->         facilitator_rejected
//   structurally_valid   --facilitator_unreachable--> facilitator_unavailable
//   facilitator_verified --settle_succeeded-->        settled
//   facilitator_verified --settle_failed-->           settlement_failed
//   settled              --authorize-->               authorized
std::optional<payment_state> transition(payment_state from, payment_event event);

bool is_terminal(payment_state state);

constexpr bool permits_execution(const payment_state state) {
  return state == payment_state::authorized;
}

}  // namespace turnstile::payment
