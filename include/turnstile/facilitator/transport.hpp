#pragma once

#include <turnstile/facilitator/endpoint.hpp>

#include <utility>  // needed before boost/asio/awaitable.hpp
#include <boost/asio/awaitable.hpp>

#include <chrono>
#include <map>
#include <string>

namespace turnstile::facilitator {

enum class http_method : uint8_t { get, post };

struct http_request final {
  http_method method{http_method::get};
  std::string target;
  std::map<std::string, std::string> headers;
  std::string body;
};

using http_request_t = http_request;

struct http_response final {
  unsigned status{};
  std::string body;
};

using http_response_t = http_response;

/// One request/response exchange with the facilitator. Connection failures
/// and timeouts are thrown as boost::system::system_error; any HTTP status
/// is a normal return.
class transport {
 public:
  virtual ~transport() = default;

  virtual boost::asio::awaitable<http_response_t> send(
      const endpoint_t& endpoint,
      http_request_t request,
      std::chrono::seconds timeout) = 0;
};

}  // namespace turnstile::facilitator
