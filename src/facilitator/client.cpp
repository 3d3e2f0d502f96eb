#include <turnstile/facilitator/client.hpp>
#include <turnstile/schema/encoding/json/encoder.hpp>
#include <turnstile/schema/protocol.hpp>

#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/system/system_error.hpp>

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <utility>

namespace turnstile::facilitator {

namespace {

namespace asio = boost::asio;

constexpr auto kVerifyPath = std::string_view{"/verify"};
constexpr auto kSettlePath = std::string_view{"/settle"};
constexpr auto kSupportedPath = std::string_view{"/supported"};

bool is_success(const unsigned status) {
  return status >= 200 && status < 300;
}

bool is_server_error(const unsigned status) {
  return status >= 500 && status < 600;
}

template <typename T>
facilitator_result_t<T> decode_body(const std::string_view operation,
                                    const http_response_t& response,
                                    const std::string_view trace_id,
                                    const uint32_t attempts) {
  auto encoder = schema::encoding::json_encoder_t{};
  auto decoded = encoder.try_decode<T>(response.body);
  if (!decoded) {
    spdlog::debug("[{}] {} response body: {}", trace_id, operation,
                  response.body);
    return facilitator_failure_t{
        .retryable = false,
        .operation = std::string{operation},
        .status = response.status,
        .detail = "malformed facilitator response",
        .attempts = attempts,
    };
  }
  return std::move(*decoded);
}

template <typename T>
facilitator_result_t<T> decode_exchange(
    const std::string_view operation,
    facilitator_result_t<http_response_t> exchanged,
    const std::string_view trace_id,
    const uint32_t attempts) {
  if (auto* failure = std::get_if<facilitator_failure_t>(&exchanged)) {
    return std::move(*failure);
  }
  return decode_body<T>(operation, std::get<http_response_t>(exchanged),
                        trace_id, attempts);
}

}  // namespace

facilitator_client::facilitator_client(client_options_t options,
                                       std::shared_ptr<transport> transport)
    : options_{std::move(options)}, transport_{std::move(transport)} {}

http_request_t facilitator_client::make_payment_request(
    const std::string_view path,
    const schema::payment_claim_t& claim,
    const schema::payment_requirement_t& requirement,
    const std::string_view trace_id) const {
  auto body = nlohmann::json{
      {"x402Version", schema::kX402Version},
      {"paymentPayload", claim},
      {"paymentRequirements", requirement},
  };
  return http_request_t{
      .method = http_method::post,
      .target = options_.endpoint.target(path),
      .headers = {{std::string{schema::kTraceHeader}, std::string{trace_id}}},
      .body = body.dump(),
  };
}

asio::awaitable<facilitator_result_t<schema::verify_outcome_t>>
facilitator_client::verify(const schema::payment_claim_t& claim,
                           const schema::payment_requirement_t& requirement,
                           const std::string_view trace_id) const {
  auto attempts = uint32_t{0};
  auto exchanged = co_await exchange(
      "verify", make_payment_request(kVerifyPath, claim, requirement, trace_id),
      trace_id, attempts);
  co_return decode_exchange<schema::verify_outcome_t>(
      "verify", std::move(exchanged), trace_id, attempts);
}

asio::awaitable<facilitator_result_t<schema::settlement_outcome_t>>
facilitator_client::settle(const schema::payment_claim_t& claim,
                           const schema::payment_requirement_t& requirement,
                           const std::string_view trace_id) const {
  auto attempts = uint32_t{0};
  auto exchanged = co_await exchange(
      "settle", make_payment_request(kSettlePath, claim, requirement, trace_id),
      trace_id, attempts);
  co_return decode_exchange<schema::settlement_outcome_t>(
      "settle", std::move(exchanged), trace_id, attempts);
}

asio::awaitable<facilitator_result_t<schema::supported_capabilities_t>>
facilitator_client::supported(const std::string_view trace_id) const {
  auto request = http_request_t{
      .method = http_method::get,
      .target = options_.endpoint.target(kSupportedPath),
      .headers = {{std::string{schema::kTraceHeader}, std::string{trace_id}}},
      .body = {},
  };
  auto attempts = uint32_t{0};
  auto exchanged =
      co_await exchange("supported", std::move(request), trace_id, attempts);
  co_return decode_exchange<schema::supported_capabilities_t>(
      "supported", std::move(exchanged), trace_id, attempts);
}

asio::awaitable<facilitator_result_t<http_response_t>>
facilitator_client::exchange(const std::string_view operation,
                             http_request_t request,
                             const std::string_view trace_id,
                             uint32_t& attempts) const {
  const auto& retry = options_.retry;
  const auto max_attempts = std::max<uint32_t>(1, retry.max_attempts);
  auto last = facilitator_failure_t{.retryable = true,
                                    .operation = std::string{operation}};

  for (auto attempt = uint32_t{1}; attempt <= max_attempts; ++attempt) {
    attempts = attempt;
    if (attempt > 1) {
      const auto delay = backoff_delay(retry.base_delay, attempt,
                                       sample_jitter(retry.base_delay));
      spdlog::warn("[{}] {} attempt {}/{} after {}ms: {}", trace_id, operation,
                   attempt, max_attempts, delay.count(), last.detail);
      auto timer = asio::steady_timer{co_await asio::this_coro::executor};
      timer.expires_after(delay);
      co_await timer.async_wait(asio::use_awaitable);
    }

    auto response = http_response_t{};
    try {
      response = co_await transport_->send(options_.endpoint, request,
                                           retry.request_timeout);
    } catch (const boost::system::system_error& e) {
      last.status.reset();
      last.detail = e.code().message();
      last.attempts = attempt;
      continue;
    }

    if (is_success(response.status)) {
      co_return response;
    }
    spdlog::debug("[{}] {} status {} body: {}", trace_id, operation,
                  response.status, response.body);
    last.status = response.status;
    last.attempts = attempt;
    if (!is_server_error(response.status)) {
      last.retryable = false;
      last.detail = fmt::format("facilitator returned status {}",
                                response.status);
      co_return last;
    }
    last.detail = fmt::format("facilitator returned status {}", response.status);
  }

  spdlog::error("[{}] {} gave up after {} attempt(s): {}", trace_id, operation,
                last.attempts, last.detail);
  co_return last;
}

}  // namespace turnstile::facilitator
