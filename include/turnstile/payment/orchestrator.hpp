#pragma once

#include <turnstile/facilitator/client.hpp>
#include <turnstile/payment/decision.hpp>
#include <turnstile/payment/extractor.hpp>
#include <turnstile/payment/requirement_builder.hpp>
#include <turnstile/payment/state_machine.hpp>
#include <turnstile/registry/network_registry.hpp>

#include <utility>  // needed before boost/asio/awaitable.hpp
#include <boost/asio/awaitable.hpp>

#include <nlohmann/json.hpp>

#include <chrono>
#include <stop_token>
#include <string>
#include <vector>

namespace turnstile::payment {

struct protected_call final {
  std::string resource_id;
  // Chain the requirements are issued on when no payment is offered.
  std::string network;
  // The request's `_meta` object; may be null.
  nlohmann::json meta;
  std::chrono::steady_clock::time_point received_at{
      std::chrono::steady_clock::now()};
};

using protected_call_t = protected_call;

/// Per-request payment flow:
///   extraction -> structural validation -> facilitator verify
///   -> facilitator settle -> authorisation.
/// One instance serves exactly one call and shares no mutable state with any
/// other. `cancellation` is consulted once, right before settlement starts.
class payment_orchestrator final {
 public:
  payment_orchestrator(std::string trace_id,
                       const registry::network_registry_t& registry,
                       const requirement_builder& builder,
                       const facilitator::facilitator_client& client,
                       std::stop_token cancellation = {});

  boost::asio::awaitable<payment_decision_t> process(
      const protected_call_t& call);

  boost::asio::awaitable<payment_decision_t> process(
      const protected_call_t& call,
      extraction_result_t extracted);

  const std::string& trace_id() const { return trace_id_; }
  payment_state state() const { return history_.back(); }
  const std::vector<payment_state>& history() const { return history_; }

 private:
  void advance(payment_event event);

  payment_decision_t issue_requirements(const protected_call_t& call);
  payment_decision_t reject(schema::payment_stage stage,
                            schema::error_kind kind,
                            std::string reason,
                            std::string caller_message,
                            std::optional<schema::violation_kind> violation =
                                std::nullopt) const;
  payment_decision_t fail(schema::payment_stage stage,
                          schema::error_kind kind,
                          std::string reason,
                          std::string caller_message) const;

  std::string trace_id_;
  const registry::network_registry_t& registry_;
  const requirement_builder& builder_;
  const facilitator::facilitator_client& client_;
  std::stop_token cancellation_;
  std::vector<payment_state> history_{payment_state::initial};
};

}  // namespace turnstile::payment
