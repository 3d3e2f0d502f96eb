#pragma once

#include <turnstile/facilitator/client.hpp>
#include <turnstile/payment/decision.hpp>
#include <turnstile/payment/orchestrator.hpp>
#include <turnstile/payment/requirement_builder.hpp>
#include <turnstile/registry/network_registry.hpp>

#include <utility>  // needed before boost/asio/awaitable.hpp
#include <boost/asio/awaitable.hpp>

#include <memory>
#include <stop_token>
#include <string>

namespace turnstile::payment {

struct gate_settings final {
  bool payments_enabled{};
  std::string default_network;
};

using gate_settings_t = gate_settings;

/// Transport-facing entry point. Checks the runtime switch once, assigns a
/// trace id and runs a fresh orchestrator for every call.
class payment_gate final {
 public:
  payment_gate(gate_settings_t settings,
               const registry::network_registry_t& registry,
               const requirement_builder& builder,
               std::shared_ptr<const facilitator::facilitator_client> client);

  /// With payments disabled every call is authorised without a receipt
  /// (empty `transaction_ref`).
  boost::asio::awaitable<payment_decision_t> authorize(
      protected_call_t call,
      std::stop_token cancellation = {}) const;

  bool payments_enabled() const { return settings_.payments_enabled; }

  /// Random (v4) uuid, the correlation id for one claim's log lines and
  /// facilitator requests.
  static std::string make_trace_id();

 private:
  gate_settings_t settings_;
  const registry::network_registry_t& registry_;
  const requirement_builder& builder_;
  std::shared_ptr<const facilitator::facilitator_client> client_;
};

}  // namespace turnstile::payment
