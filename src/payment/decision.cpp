#include <turnstile/payment/decision.hpp>
#include <turnstile/schema/encoding/json/payment_requirement.hpp>
#include <turnstile/schema/primitives.hpp>
#include <turnstile/schema/protocol.hpp>

namespace turnstile::payment {

std::optional<int32_t> error_code(const payment_decision_t& decision) {
  return std::visit(
      overloaded{
          [](const payment_required_t&) -> std::optional<int32_t> {
            return schema::kPaymentRequiredCode;
          },
          [](const payment_rejected_t&) -> std::optional<int32_t> {
            return schema::kInvalidPaymentCode;
          },
          [](const payment_failed_t&) -> std::optional<int32_t> {
            return schema::kInternalErrorCode;
          },
          [](const payment_authorized_t&) -> std::optional<int32_t> {
            return std::nullopt;
          },
      },
      decision);
}

std::optional<nlohmann::json> to_jsonrpc_error(
    const payment_decision_t& decision) {
  return std::visit(
      overloaded{
          [](const payment_required_t& value) -> std::optional<nlohmann::json> {
            return nlohmann::json{
                {"code", schema::kPaymentRequiredCode},
                {"message", value.body.error.value_or("Payment required")},
                {"data", value.body},
            };
          },
          [](const payment_rejected_t& value) -> std::optional<nlohmann::json> {
            return nlohmann::json{
                {"code", schema::kInvalidPaymentCode},
                {"message", value.context.caller_message},
            };
          },
          [](const payment_failed_t& value) -> std::optional<nlohmann::json> {
            return nlohmann::json{
                {"code", schema::kInternalErrorCode},
                {"message", value.context.caller_message},
            };
          },
          [](const payment_authorized_t&) -> std::optional<nlohmann::json> {
            return std::nullopt;
          },
      },
      decision);
}

nlohmann::json to_receipt(const payment_authorized_t& receipt) {
  auto j = nlohmann::json{
      {"success", true},
      {"transaction", receipt.transaction_ref},
      {"network", receipt.chain_id},
  };
  if (receipt.payer) {
    j["payer"] = *receipt.payer;
  }
  return j;
}

}  // namespace turnstile::payment
