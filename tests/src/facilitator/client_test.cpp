#include <gtest/gtest.h>
#include <turnstile/facilitator/client.hpp>
#include <turnstile/testing/scripted_transport.hpp>
#include <turnstile/testing/svm_transaction_builder.hpp>

namespace {

struct client_fixture final {
  std::shared_ptr<turnstile::testing::scripted_transport> transport{
      std::make_shared<turnstile::testing::scripted_transport>()};
  turnstile::schema::payment_claim_t claim{
      turnstile::testing::make_claim(turnstile::testing::exact_payment{})};
  turnstile::schema::payment_requirement_t requirement{
      turnstile::testing::make_requirement()};

  turnstile::facilitator::facilitator_result_t<turnstile::schema::verify_outcome_t>
  verify(const uint32_t max_retries = 3) {
    auto client = turnstile::testing::make_facilitator_client(transport, max_retries);
    return turnstile::testing::run_awaitable(
        client->verify(claim, requirement, "trace-verify"));
  }

  turnstile::facilitator::facilitator_result_t<turnstile::schema::settlement_outcome_t>
  settle() {
    auto client = turnstile::testing::make_facilitator_client(transport);
    return turnstile::testing::run_awaitable(
        client->settle(claim, requirement, "trace-settle"));
  }
};

const turnstile::facilitator::facilitator_failure_t* failure_of(
    const auto& result) {
  return std::get_if<turnstile::facilitator::facilitator_failure_t>(&result);
}

}  // namespace

TEST(facilitator_client, verify_posts_claim_and_requirement) {
  auto fixture = client_fixture{};
  fixture.transport->reply(200, R"({"isValid":true,"payer":"PayerAddress"})");
  auto result = fixture.verify();
  ASSERT_TRUE(std::holds_alternative<turnstile::schema::verify_outcome_t>(result));
  const auto& outcome = std::get<turnstile::schema::verify_outcome_t>(result);
  EXPECT_TRUE(outcome.is_valid);
  EXPECT_EQ(outcome.payer, "PayerAddress");

  auto requests = fixture.transport->requests();
  ASSERT_EQ(requests.size(), 1u);
  EXPECT_EQ(requests[0].method, turnstile::facilitator::http_method::post);
  EXPECT_EQ(requests[0].target, "/x402/verify");
  EXPECT_EQ(requests[0].headers.at("X-Trace-ID"), "trace-verify");
  auto body = nlohmann::json::parse(requests[0].body);
  EXPECT_EQ(body["x402Version"], 2);
  EXPECT_EQ(body["paymentPayload"], fixture.claim.wire);
  EXPECT_EQ(body["paymentRequirements"]["amount"], "10000");
  EXPECT_EQ(body["paymentRequirements"]["payTo"],
            std::string{turnstile::testing::kPayTo});
}

TEST(facilitator_client, verify_rejection_is_an_answer_not_a_failure) {
  auto fixture = client_fixture{};
  fixture.transport->reply(200, R"({"isValid":false,"invalidReason":"insufficient_funds"})");
  auto result = fixture.verify();
  ASSERT_TRUE(std::holds_alternative<turnstile::schema::verify_outcome_t>(result));
  EXPECT_FALSE(std::get<turnstile::schema::verify_outcome_t>(result).is_valid);
}

TEST(facilitator_client, retries_transient_failures_until_success) {
  auto fixture = client_fixture{};
  fixture.transport->fail();
  fixture.transport->reply(503, "unavailable");
  fixture.transport->reply(200, R"({"isValid":true})");
  auto result = fixture.verify();
  EXPECT_TRUE(std::holds_alternative<turnstile::schema::verify_outcome_t>(result));
  EXPECT_EQ(fixture.transport->requests().size(), 3u);
}

TEST(facilitator_client, gives_up_after_max_retries) {
  auto fixture = client_fixture{};
  fixture.transport->fail();
  fixture.transport->fail();
  fixture.transport->fail();
  auto result = fixture.verify(3);
  const auto* failure = failure_of(result);
  ASSERT_NE(failure, nullptr);
  EXPECT_TRUE(failure->retryable);
  EXPECT_EQ(failure->attempts, 3u);
  EXPECT_EQ(failure->operation, "verify");
  EXPECT_FALSE(failure->status.has_value());
  EXPECT_EQ(fixture.transport->requests().size(), 3u);
}

TEST(facilitator_client, resolve_deadline_expiry_is_retried) {
  auto fixture = client_fixture{};
  fixture.transport->fail(boost::asio::error::timed_out);
  fixture.transport->fail(boost::asio::error::timed_out);
  fixture.transport->reply(200, R"({"isValid":true})");
  auto result = fixture.verify(3);
  EXPECT_TRUE(std::holds_alternative<turnstile::schema::verify_outcome_t>(result));
  auto timeouts = fixture.transport->timeouts();
  ASSERT_EQ(timeouts.size(), 3u);
  for (const auto timeout : timeouts) {
    EXPECT_EQ(timeout, std::chrono::seconds{5});
  }
}

TEST(facilitator_client, resolve_deadline_expiry_is_transient_when_exhausted) {
  auto fixture = client_fixture{};
  fixture.transport->fail(boost::asio::error::timed_out);
  fixture.transport->fail(boost::asio::error::timed_out);
  auto result = fixture.verify(2);
  const auto* failure = failure_of(result);
  ASSERT_NE(failure, nullptr);
  EXPECT_TRUE(failure->retryable);
  EXPECT_EQ(failure->attempts, 2u);
  EXPECT_EQ(failure->detail,
            boost::system::error_code{boost::asio::error::timed_out}.message());
}

TEST(facilitator_client, waits_for_backoff_between_attempts) {
  auto transport = std::make_shared<turnstile::testing::scripted_transport>();
  transport->fail();
  transport->reply(200, R"({"isValid":true})");
  auto client = turnstile::testing::make_facilitator_client(
      transport, 3, std::chrono::milliseconds{20});
  const auto started = std::chrono::steady_clock::now();
  auto result = turnstile::testing::run_awaitable(client->verify(
      turnstile::testing::make_claim(turnstile::testing::exact_payment{}),
      turnstile::testing::make_requirement(), "trace-backoff"));
  const auto elapsed = std::chrono::steady_clock::now() - started;
  EXPECT_TRUE(std::holds_alternative<turnstile::schema::verify_outcome_t>(result));
  EXPECT_EQ(transport->requests().size(), 2u);
  EXPECT_GE(elapsed, std::chrono::milliseconds{20});
}

TEST(facilitator_client, zero_retries_still_makes_one_attempt) {
  auto fixture = client_fixture{};
  fixture.transport->reply(502, "bad gateway");
  auto result = fixture.verify(0);
  const auto* failure = failure_of(result);
  ASSERT_NE(failure, nullptr);
  EXPECT_EQ(failure->attempts, 1u);
  EXPECT_EQ(failure->status, 502u);
}

TEST(facilitator_client, client_errors_are_not_retried) {
  auto fixture = client_fixture{};
  fixture.transport->reply(400, R"({"error":"bad request"})");
  auto result = fixture.verify();
  const auto* failure = failure_of(result);
  ASSERT_NE(failure, nullptr);
  EXPECT_FALSE(failure->retryable);
  EXPECT_EQ(failure->status, 400u);
  EXPECT_EQ(fixture.transport->requests().size(), 1u);
}

TEST(facilitator_client, malformed_body_is_a_permanent_failure) {
  auto fixture = client_fixture{};
  fixture.transport->reply(200, "<html>not json</html>");
  auto result = fixture.verify();
  const auto* failure = failure_of(result);
  ASSERT_NE(failure, nullptr);
  EXPECT_FALSE(failure->retryable);
  EXPECT_EQ(failure->detail, "malformed facilitator response");
  EXPECT_EQ(failure->attempts, 1u);
}

TEST(facilitator_client, settle_returns_receipt) {
  auto fixture = client_fixture{};
  fixture.transport->reply(
      200, R"({"success":true,"transaction":"5VERv8NMvzbJMEkV8xnrLkEaWRtSz9CosKDYjCJjBRnb","network":"solana:5eykt4UsFv8P8NJdTREpY1vzqKqZKvdp","payer":"PayerAddress"})");
  auto result = fixture.settle();
  ASSERT_TRUE(
      std::holds_alternative<turnstile::schema::settlement_outcome_t>(result));
  const auto& outcome = std::get<turnstile::schema::settlement_outcome_t>(result);
  EXPECT_TRUE(outcome.settled);
  EXPECT_EQ(outcome.transaction_ref,
            "5VERv8NMvzbJMEkV8xnrLkEaWRtSz9CosKDYjCJjBRnb");
  EXPECT_EQ(outcome.chain_id, turnstile::testing::kSolanaMainnet);
  EXPECT_EQ(fixture.transport->count("/x402/settle"), 1u);
}

TEST(facilitator_client, supported_uses_get) {
  auto transport = std::make_shared<turnstile::testing::scripted_transport>();
  transport->reply(
      200,
      R"({"kinds":[{"x402Version":2,"scheme":"exact","network":"solana:5eykt4UsFv8P8NJdTREpY1vzqKqZKvdp","extra":{"feePayer":"Fee"}}],"extensions":[],"signers":{"solana:*":["Fee"]}})");
  auto client = turnstile::testing::make_facilitator_client(transport);
  auto result = turnstile::testing::run_awaitable(client->supported("trace"));
  ASSERT_TRUE(
      std::holds_alternative<turnstile::schema::supported_capabilities_t>(result));
  const auto& capabilities =
      std::get<turnstile::schema::supported_capabilities_t>(result);
  ASSERT_EQ(capabilities.kinds.size(), 1u);
  EXPECT_EQ(capabilities.kinds[0].scheme, "exact");
  EXPECT_EQ(capabilities.kinds[0].extra["feePayer"], "Fee");
  EXPECT_EQ(capabilities.signers.at("solana:*").size(), 1u);

  auto requests = transport->requests();
  ASSERT_EQ(requests.size(), 1u);
  EXPECT_EQ(requests[0].method, turnstile::facilitator::http_method::get);
  EXPECT_EQ(requests[0].target, "/x402/supported");
  EXPECT_TRUE(requests[0].body.empty());
}
