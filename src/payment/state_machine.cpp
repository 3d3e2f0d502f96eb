#include <turnstile/payment/state_machine.hpp>

namespace turnstile::payment {

namespace {

struct edge final {
  payment_state from;
  payment_event event;
  payment_state to;
};

using enum payment_state;
using enum payment_event;

constexpr auto kTransitions = std::array{
    edge{initial, payment_absent, no_payment},
    edge{initial, payment_malformed, malformed},
    edge{initial, payment_extracted, payment_offered},
    edge{no_payment, requirement_built, requirement_issued},
    edge{no_payment, requirement_failed, requirement_unavailable},
    edge{payment_offered, structure_accepted, structurally_valid},
    edge{payment_offered, structure_rejected, structurally_invalid},
    edge{structurally_valid, offer_stale, offer_expired},
    edge{structurally_valid, verify_accepted, facilitator_verified},
    edge{structurally_valid, verify_rejected, facilitator_rejected},
    edge{structurally_valid, facilitator_unreachable, facilitator_unavailable},
    edge{facilitator_verified, settle_succeeded, settled},
    edge{facilitator_verified, settle_failed, settlement_failed},
    edge{settled, authorize, authorized},
};

}  // namespace

std::optional<payment_state> transition(const payment_state from,
                                        const payment_event event) {
  for (const auto& e : kTransitions) {
    if (e.from == from && e.event == event) {
      return e.to;
    }
  }
  return std::nullopt;
}

bool is_terminal(const payment_state state) {
  for (const auto& e : kTransitions) {
    if (e.from == state) {
      return false;
    }
  }
  return true;
}

}  // namespace turnstile::payment
