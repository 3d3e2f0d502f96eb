#pragma once

#include <turnstile/facilitator/endpoint.hpp>
#include <turnstile/facilitator/retry_policy.hpp>
#include <turnstile/facilitator/transport.hpp>
#include <turnstile/schema/facilitator_messages.hpp>
#include <turnstile/schema/payment_claim.hpp>
#include <turnstile/schema/payment_requirement.hpp>

#include <utility>  // needed before boost/asio/awaitable.hpp
#include <boost/asio/awaitable.hpp>

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace turnstile::facilitator {

struct facilitator_failure final {
  // True when every attempt failed transiently (connection, timeout, 5xx).
  bool retryable{};
  std::string operation;
  std::optional<unsigned> status;
  // Internal detail for logs; never shown to callers.
  std::string detail;
  uint32_t attempts{};
};

using facilitator_failure_t = facilitator_failure;

template <typename T>
using facilitator_result_t = std::variant<T, facilitator_failure_t>;

struct client_options final {
  endpoint_t endpoint;
  retry_policy_t retry;
};

using client_options_t = client_options;

/// Immutable handle on the facilitator: base URL, per-attempt timeout and
/// retry budget. Safe to share between concurrent orchestrators.
class facilitator_client final {
 public:
  facilitator_client(client_options_t options,
                     std::shared_ptr<transport> transport);

  boost::asio::awaitable<facilitator_result_t<schema::verify_outcome_t>> verify(
      const schema::payment_claim_t& claim,
      const schema::payment_requirement_t& requirement,
      std::string_view trace_id) const;

  boost::asio::awaitable<facilitator_result_t<schema::settlement_outcome_t>>
  settle(const schema::payment_claim_t& claim,
         const schema::payment_requirement_t& requirement,
         std::string_view trace_id) const;

  boost::asio::awaitable<facilitator_result_t<schema::supported_capabilities_t>>
  supported(std::string_view trace_id) const;

  const client_options_t& options() const { return options_; }

 private:
  boost::asio::awaitable<facilitator_result_t<http_response_t>> exchange(
      std::string_view operation,
      http_request_t request,
      std::string_view trace_id,
      uint32_t& attempts) const;

  http_request_t make_payment_request(
      std::string_view path,
      const schema::payment_claim_t& claim,
      const schema::payment_requirement_t& requirement,
      std::string_view trace_id) const;

  client_options_t options_;
  std::shared_ptr<transport> transport_;
};

}  // namespace turnstile::facilitator
