#pragma once

#include <turnstile/facilitator/transport.hpp>

#include <boost/asio/ssl/context.hpp>

namespace turnstile::facilitator {

/// Beast HTTP/1.1 over TLS, one connection per exchange. The deadline covers
/// a whole attempt, from name resolution to the end of the response.
class https_transport final : public transport {
 public:
  https_transport();
  explicit https_transport(boost::asio::ssl::context context);

  boost::asio::awaitable<http_response_t> send(
      const endpoint_t& endpoint,
      http_request_t request,
      std::chrono::seconds timeout) override;

 private:
  boost::asio::ssl::context ssl_context_;
};

}  // namespace turnstile::facilitator
