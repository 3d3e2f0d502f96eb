#include <gtest/gtest.h>
#include <turnstile/payment/decision.hpp>
#include <turnstile/testing/common.hpp>

namespace {

turnstile::schema::error_context_t make_context(
    const turnstile::schema::error_kind kind,
    std::string caller_message) {
  return turnstile::schema::error_context_t{
      .trace_id = "trace-1",
      .stage = turnstile::schema::payment_stage::verification,
      .kind = kind,
      .violation = std::nullopt,
      .reason = "internal detail that must stay internal",
      .caller_message = std::move(caller_message),
  };
}

}  // namespace

TEST(decision, payment_required_carries_requirements_in_data) {
  auto decision = turnstile::payment::payment_decision_t{
      turnstile::payment::payment_required_t{
          .body = turnstile::schema::payment_required_t{
              .x402_version = 2,
              .error = "Payment required to call tool 'search'",
              .resource = {.url = "mcp://tool/search"},
              .accepts = {turnstile::testing::make_requirement()}},
          .context = make_context(turnstile::schema::error_kind::no_payment,
                                  "Payment required")}};
  EXPECT_EQ(turnstile::payment::error_code(decision), -40200);

  auto error = turnstile::payment::to_jsonrpc_error(decision);
  ASSERT_TRUE(error.has_value());
  EXPECT_EQ((*error)["code"], -40200);
  EXPECT_EQ((*error)["message"], "Payment required to call tool 'search'");
  EXPECT_EQ((*error)["data"]["x402Version"], 2);
  EXPECT_EQ((*error)["data"]["resource"]["url"], "mcp://tool/search");
  ASSERT_EQ((*error)["data"]["accepts"].size(), 1u);
  EXPECT_EQ((*error)["data"]["accepts"][0]["amount"], "10000");
}

TEST(decision, rejection_exposes_only_caller_message) {
  auto decision = turnstile::payment::payment_decision_t{
      turnstile::payment::payment_rejected_t{.context = make_context(
          turnstile::schema::error_kind::facilitator_rejected,
          "Invalid payment: insufficient_funds")}};
  EXPECT_EQ(turnstile::payment::error_code(decision), -40201);
  auto error = turnstile::payment::to_jsonrpc_error(decision);
  ASSERT_TRUE(error.has_value());
  EXPECT_EQ((*error)["message"], "Invalid payment: insufficient_funds");
  EXPECT_FALSE(error->contains("data"));
  EXPECT_EQ(error->dump().find("internal detail"), std::string::npos);
}

TEST(decision, failure_maps_to_internal_error) {
  auto decision = turnstile::payment::payment_decision_t{
      turnstile::payment::payment_failed_t{.context = make_context(
          turnstile::schema::error_kind::facilitator_transient,
          "Payment facilitator unavailable")}};
  EXPECT_EQ(turnstile::payment::error_code(decision), -32603);
  auto error = turnstile::payment::to_jsonrpc_error(decision);
  ASSERT_TRUE(error.has_value());
  EXPECT_EQ((*error)["code"], -32603);
  EXPECT_EQ((*error)["message"], "Payment facilitator unavailable");
}

TEST(decision, authorized_has_no_error_and_a_receipt) {
  auto receipt = turnstile::payment::payment_authorized_t{
      .trace_id = "trace-1",
      .transaction_ref = "5VERv8NMvzbJMEkV8xnrLkEaWRtSz9CosKDYjCJjBRnb",
      .chain_id = std::string{turnstile::testing::kSolanaMainnet},
      .payer = std::string{turnstile::testing::kPayTo}};
  auto decision = turnstile::payment::payment_decision_t{receipt};
  EXPECT_FALSE(turnstile::payment::error_code(decision).has_value());
  EXPECT_FALSE(turnstile::payment::to_jsonrpc_error(decision).has_value());

  auto j = turnstile::payment::to_receipt(receipt);
  EXPECT_EQ(j["success"], true);
  EXPECT_EQ(j["transaction"], receipt.transaction_ref);
  EXPECT_EQ(j["network"], receipt.chain_id);
  EXPECT_EQ(j["payer"], receipt.payer.value());

  receipt.payer.reset();
  EXPECT_FALSE(turnstile::payment::to_receipt(receipt).contains("payer"));
}
