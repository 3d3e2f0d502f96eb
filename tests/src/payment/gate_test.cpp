#include <gtest/gtest.h>
#include <turnstile/payment/gate.hpp>
#include <turnstile/testing/scripted_transport.hpp>
#include <turnstile/testing/svm_transaction_builder.hpp>

#include <set>

namespace {

struct gate_fixture final {
  turnstile::registry::network_registry_t registry{
      {turnstile::testing::make_solana_policy()}};
  turnstile::payment::requirement_builder builder{
      registry, turnstile::testing::make_pricing()};
  std::shared_ptr<turnstile::testing::scripted_transport> transport{
      std::make_shared<turnstile::testing::scripted_transport>()};

  turnstile::payment::payment_gate make_gate(const bool enabled) {
    return turnstile::payment::payment_gate{
        turnstile::payment::gate_settings_t{
            .payments_enabled = enabled,
            .default_network = std::string{turnstile::testing::kSolanaMainnet}},
        registry, builder,
        turnstile::testing::make_facilitator_client(transport)};
  }
};

}  // namespace

TEST(payment_gate, disabled_gate_authorizes_without_receipt) {
  auto fixture = gate_fixture{};
  auto gate = fixture.make_gate(false);
  EXPECT_FALSE(gate.payments_enabled());
  auto decision = turnstile::testing::run_awaitable(gate.authorize(
      turnstile::payment::protected_call_t{.resource_id = "search"}));
  ASSERT_TRUE(
      std::holds_alternative<turnstile::payment::payment_authorized_t>(decision));
  const auto& receipt =
      std::get<turnstile::payment::payment_authorized_t>(decision);
  EXPECT_TRUE(receipt.transaction_ref.empty());
  EXPECT_FALSE(receipt.trace_id.empty());
  EXPECT_TRUE(fixture.transport->requests().empty());
}

TEST(payment_gate, enabled_gate_uses_default_network_for_requirements) {
  auto fixture = gate_fixture{};
  auto gate = fixture.make_gate(true);
  auto decision = turnstile::testing::run_awaitable(gate.authorize(
      turnstile::payment::protected_call_t{.resource_id = "search"}));
  ASSERT_TRUE(
      std::holds_alternative<turnstile::payment::payment_required_t>(decision));
  const auto& required =
      std::get<turnstile::payment::payment_required_t>(decision);
  ASSERT_EQ(required.body.accepts.size(), 1u);
  EXPECT_EQ(required.body.accepts[0].network, turnstile::testing::kSolanaMainnet);
  EXPECT_EQ(required.context.trace_id.size(), 36u);
}

TEST(payment_gate, enabled_gate_settles_valid_payment) {
  auto fixture = gate_fixture{};
  fixture.transport->reply(200, R"({"isValid":true})");
  fixture.transport->reply(
      200, R"({"success":true,"transaction":"5VERv8NMvzbJMEkV8xnrLkEaWRtSz9CosKDYjCJjBRnb"})");
  auto gate = fixture.make_gate(true);
  auto decision = turnstile::testing::run_awaitable(gate.authorize(
      turnstile::payment::protected_call_t{
          .resource_id = "search",
          .meta = nlohmann::json{
              {"payment", turnstile::testing::make_claim_json(
                              turnstile::testing::exact_payment{})}}}));
  ASSERT_TRUE(
      std::holds_alternative<turnstile::payment::payment_authorized_t>(decision));
  const auto& receipt =
      std::get<turnstile::payment::payment_authorized_t>(decision);
  EXPECT_EQ(receipt.transaction_ref,
            "5VERv8NMvzbJMEkV8xnrLkEaWRtSz9CosKDYjCJjBRnb");

  auto requests = fixture.transport->requests();
  ASSERT_EQ(requests.size(), 2u);
  EXPECT_EQ(requests[0].headers.at("X-Trace-ID"), receipt.trace_id);
  EXPECT_EQ(requests[1].headers.at("X-Trace-ID"), receipt.trace_id);
}

TEST(payment_gate, each_call_gets_its_own_trace_id) {
  auto ids = std::set<std::string>{};
  for (auto i = 0; i < 64; ++i) {
    ids.insert(turnstile::payment::payment_gate::make_trace_id());
  }
  EXPECT_EQ(ids.size(), 64u);
}
