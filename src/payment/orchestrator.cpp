#include <turnstile/common/critical.hpp>
#include <turnstile/payment/orchestrator.hpp>
#include <turnstile/svm/exact_validator.hpp>

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <utility>

namespace turnstile::payment {

namespace {

using schema::error_kind;
using schema::payment_stage;

constexpr auto kStructuralCallerMessage = std::string_view{
    "Invalid payment: transaction does not satisfy the payment requirements"};
constexpr auto kSettlementCallerMessage =
    std::string_view{"Payment could not be settled"};
constexpr auto kUnavailableCallerMessage =
    std::string_view{"Payment facilitator unavailable"};

struct structural_verdict final {
  std::optional<schema::payment_requirement_t> issued;
  std::optional<std::string> payer_hint;
  std::optional<svm::violation_t> violation;
};

}  // namespace

payment_orchestrator::payment_orchestrator(
    std::string trace_id,
    const registry::network_registry_t& registry,
    const requirement_builder& builder,
    const facilitator::facilitator_client& client,
    std::stop_token cancellation)
    : trace_id_{std::move(trace_id)},
      registry_{registry},
      builder_{builder},
      client_{client},
      cancellation_{std::move(cancellation)} {}

void payment_orchestrator::advance(const payment_event event) {
  const auto from = state();
  auto to = transition(from, event);
  if (!to) {
    common::critical(trace_id_,
                     fmt::format("invalid payment transition {} --{}-->",
                                 to_string(from), to_string(event)));
  }
  spdlog::debug("[{}] {} --{}--> {}", trace_id_, to_string(from),
                to_string(event), to_string(*to));
  history_.push_back(*to);
}

payment_decision_t payment_orchestrator::reject(
    const payment_stage stage,
    const error_kind kind,
    std::string reason,
    std::string caller_message,
    const std::optional<schema::violation_kind> violation) const {
  return payment_rejected_t{schema::error_context_t{
      .trace_id = trace_id_,
      .stage = stage,
      .kind = kind,
      .violation = violation,
      .reason = std::move(reason),
      .caller_message = std::move(caller_message),
  }};
}

payment_decision_t payment_orchestrator::fail(const payment_stage stage,
                                              const error_kind kind,
                                              std::string reason,
                                              std::string caller_message) const {
  return payment_failed_t{schema::error_context_t{
      .trace_id = trace_id_,
      .stage = stage,
      .kind = kind,
      .violation = std::nullopt,
      .reason = std::move(reason),
      .caller_message = std::move(caller_message),
  }};
}

payment_decision_t payment_orchestrator::issue_requirements(
    const protected_call_t& call) {
  auto built = builder_.build(call.resource_id, call.network);
  if (auto* error = std::get_if<schema::structural_error>(&built)) {
    advance(payment_event::requirement_failed);
    spdlog::error("[{}] cannot issue requirements for {} on {}: {}", trace_id_,
                  call.resource_id, call.network, error->reason);
    return fail(payment_stage::extraction, error_kind::no_payment,
                error->reason, "Payment requirements unavailable");
  }
  advance(payment_event::requirement_built);
  auto& body = std::get<schema::payment_required_t>(built);
  spdlog::info("[{}] payment required for {} ({} option(s))", trace_id_,
               call.resource_id, body.accepts.size());
  auto context = schema::error_context_t{
      .trace_id = trace_id_,
      .stage = payment_stage::extraction,
      .kind = error_kind::no_payment,
      .violation = std::nullopt,
      .reason = "no payment offered",
      .caller_message = body.error.value_or("Payment required"),
  };
  return payment_required_t{.body = std::move(body),
                            .context = std::move(context)};
}

boost::asio::awaitable<payment_decision_t> payment_orchestrator::process(
    const protected_call_t& call) {
  co_return co_await process(call, extract(call.meta, call.received_at));
}

boost::asio::awaitable<payment_decision_t> payment_orchestrator::process(
    const protected_call_t& call,
    extraction_result_t extracted) {
  if (state() != payment_state::initial) {
    common::critical(trace_id_, "payment orchestrator reused for a second call");
  }

  // Extraction.
  if (std::holds_alternative<payment_absent_t>(extracted)) {
    advance(payment_event::payment_absent);
    co_return issue_requirements(call);
  }
  if (auto* malformed = std::get_if<payment_malformed_t>(&extracted)) {
    advance(payment_event::payment_malformed);
    spdlog::warn("[{}] malformed payment for {}: {}", trace_id_,
                 call.resource_id, malformed->reason);
    co_return reject(payment_stage::extraction, error_kind::malformed,
                     malformed->reason,
                     fmt::format("Invalid payment: {}", malformed->reason));
  }
  advance(payment_event::payment_extracted);
  const auto& claim = std::get<schema::payment_claim_t>(extracted);
  spdlog::info("[{}] payment offered for {} on {}", trace_id_,
               call.resource_id, claim.accepted.network);

  // Structural validation. Pure, runs to completion without suspending.
  auto verdict = [&]() -> structural_verdict {
    using enum schema::violation_kind;
    auto chain = schema::validate_chain_id(claim.accepted.network);
    if (auto* error = std::get_if<schema::structural_error>(&chain)) {
      return {.violation = svm::violation_t{unsupported_network,
                                            error->reason}};
    }
    const auto* policy =
        registry_.lookup_policy(std::get<schema::chain_id_t>(chain));
    if (policy == nullptr) {
      return {.violation = svm::violation_t{
                  unsupported_network,
                  fmt::format("network {} is not configured",
                              claim.accepted.network)}};
    }
    auto issued = builder_.requirements(call.resource_id, *policy);
    auto match = std::ranges::find_if(issued, [&](const auto& requirement) {
      return requirement.same_terms(claim.accepted);
    });
    if (match == std::end(issued)) {
      return {.violation = svm::violation_t{
                  requirement_mismatch,
                  "accepted requirement is not one this resource offers"}};
    }
    auto validated = svm::validate_exact(claim, *policy);
    if (auto* violation = std::get_if<svm::violation_t>(&validated)) {
      return {.violation = std::move(*violation)};
    }
    return {.issued = std::move(*match),
            .payer_hint =
                std::get<svm::exact_transfer_t>(validated).payer_hint};
  }();

  if (verdict.violation) {
    advance(payment_event::structure_rejected);
    spdlog::warn("[{}] structural violation {}: {}", trace_id_,
                 schema::to_string(verdict.violation->kind),
                 verdict.violation->detail);
    co_return reject(payment_stage::structural_validation,
                     error_kind::structural_violation,
                     std::move(verdict.violation->detail),
                     std::string{kStructuralCallerMessage},
                     verdict.violation->kind);
  }
  advance(payment_event::structure_accepted);
  const auto& requirement = *verdict.issued;
  spdlog::info("[{}] payment structurally valid, payer {}", trace_id_,
               *verdict.payer_hint);

  // Offer staleness.
  const auto age = std::chrono::steady_clock::now() - claim.received_at;
  if (age > std::chrono::seconds{requirement.max_timeout_seconds}) {
    advance(payment_event::offer_stale);
    const auto age_ms =
        std::chrono::duration_cast<std::chrono::milliseconds>(age).count();
    spdlog::warn("[{}] payment offer expired after {}ms (limit {}s)", trace_id_,
                 age_ms, requirement.max_timeout_seconds);
    co_return reject(payment_stage::structural_validation,
                     error_kind::offer_expired,
                     fmt::format("offer is {}ms old", age_ms),
                     "Invalid payment: payment offer expired");
  }

  // Verification.
  auto verified = co_await client_.verify(claim, requirement, trace_id_);
  if (auto* failure = std::get_if<facilitator::facilitator_failure_t>(&verified)) {
    advance(payment_event::facilitator_unreachable);
    spdlog::error("[{}] verify failed after {} attempt(s): {}", trace_id_,
                  failure->attempts, failure->detail);
    co_return fail(payment_stage::verification,
                   failure->retryable ? error_kind::facilitator_transient
                                      : error_kind::facilitator_error,
                   std::move(failure->detail),
                   std::string{kUnavailableCallerMessage});
  }
  auto& verify_outcome = std::get<schema::verify_outcome_t>(verified);
  if (!verify_outcome.is_valid) {
    advance(payment_event::verify_rejected);
    auto reason =
        verify_outcome.reason.value_or("Payment verification failed");
    spdlog::warn("[{}] facilitator rejected payment: {}", trace_id_, reason);
    auto caller_message = fmt::format("Invalid payment: {}", reason);
    co_return reject(payment_stage::verification,
                     error_kind::facilitator_rejected, std::move(reason),
                     std::move(caller_message));
  }
  advance(payment_event::verify_accepted);
  auto payer = verify_outcome.payer ? verify_outcome.payer : verdict.payer_hint;
  spdlog::info("[{}] payment verified, payer {}", trace_id_,
               payer.value_or("unknown"));

  // Settlement. Once started it runs to completion.
  if (cancellation_.stop_requested()) {
    advance(payment_event::settle_failed);
    spdlog::warn("[{}] caller cancelled before settlement", trace_id_);
    co_return fail(payment_stage::settlement, error_kind::settlement_failed,
                   "settlement aborted: caller cancelled",
                   std::string{kSettlementCallerMessage});
  }

  auto settled = co_await client_.settle(claim, requirement, trace_id_);
  if (auto* failure = std::get_if<facilitator::facilitator_failure_t>(&settled)) {
    advance(payment_event::settle_failed);
    spdlog::error("[{}] settle failed after {} attempt(s): {}", trace_id_,
                  failure->attempts, failure->detail);
    co_return fail(payment_stage::settlement,
                   failure->retryable ? error_kind::facilitator_transient
                                      : error_kind::facilitator_error,
                   std::move(failure->detail),
                   std::string{failure->retryable ? kUnavailableCallerMessage
                                                  : kSettlementCallerMessage});
  }
  auto& settlement = std::get<schema::settlement_outcome_t>(settled);
  if (!settlement.settled || !settlement.transaction_ref) {
    advance(payment_event::settle_failed);
    auto reason = settlement.settled
                      ? std::string{"settlement reported without a transaction"}
                      : settlement.error_reason.value_or("settlement failed");
    spdlog::error("[{}] payment settlement failed: {}", trace_id_, reason);
    co_return fail(payment_stage::settlement, error_kind::settlement_failed,
                   std::move(reason), std::string{kSettlementCallerMessage});
  }
  advance(payment_event::settle_succeeded);

  advance(payment_event::authorize);
  auto receipt = payment_authorized_t{
      .trace_id = trace_id_,
      .transaction_ref = *settlement.transaction_ref,
      .chain_id = settlement.chain_id.empty() ? claim.accepted.network
                                              : settlement.chain_id,
      .payer = settlement.payer ? settlement.payer : payer,
  };
  spdlog::info("[{}] payment settled on {}: {}", trace_id_, receipt.chain_id,
               receipt.transaction_ref);
  co_return receipt;
}

}  // namespace turnstile::payment
