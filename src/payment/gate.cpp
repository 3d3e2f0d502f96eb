#include <turnstile/payment/gate.hpp>

#include <boost/uuid/random_generator.hpp>
#include <boost/uuid/uuid_io.hpp>

#include <spdlog/spdlog.h>

#include <utility>

namespace turnstile::payment {

payment_gate::payment_gate(
    gate_settings_t settings,
    const registry::network_registry_t& registry,
    const requirement_builder& builder,
    std::shared_ptr<const facilitator::facilitator_client> client)
    : settings_{std::move(settings)},
      registry_{registry},
      builder_{builder},
      client_{std::move(client)} {}

std::string payment_gate::make_trace_id() {
  thread_local auto generator = boost::uuids::random_generator{};
  return boost::uuids::to_string(generator());
}

boost::asio::awaitable<payment_decision_t> payment_gate::authorize(
    protected_call_t call,
    std::stop_token cancellation) const {
  auto trace_id = make_trace_id();
  if (!settings_.payments_enabled) {
    spdlog::debug("[{}] payments disabled, {} runs unpaid", trace_id,
                  call.resource_id);
    co_return payment_authorized_t{.trace_id = std::move(trace_id),
                                   .transaction_ref = {},
                                   .chain_id = {},
                                   .payer = std::nullopt};
  }
  if (call.network.empty()) {
    call.network = settings_.default_network;
  }

  auto orchestrator = payment_orchestrator{std::move(trace_id), registry_,
                                           builder_, *client_,
                                           std::move(cancellation)};
  co_return co_await orchestrator.process(call);
}

}  // namespace turnstile::payment
