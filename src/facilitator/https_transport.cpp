#include <turnstile/facilitator/https_transport.hpp>

#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/ssl/error.hpp>
#include <boost/asio/ssl/host_name_verification.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/version.hpp>

#include <openssl/err.h>
#include <openssl/ssl.h>

#include <spdlog/spdlog.h>

#include <chrono>
#include <memory>
#include <utility>

namespace turnstile::facilitator {

namespace {

namespace asio = boost::asio;
namespace beast = boost::beast;
namespace http = beast::http;

constexpr auto kUserAgent = "turnstile/" BOOST_BEAST_VERSION_STRING;

asio::ssl::context make_default_context() {
  auto context = asio::ssl::context{asio::ssl::context::tls_client};
  context.set_default_verify_paths();
  context.set_verify_mode(asio::ssl::verify_peer);
  return context;
}

http::verb to_verb(const http_method method) {
  switch (method) {
    case http_method::get:
      return http::verb::get;
    case http_method::post:
      return http::verb::post;
  }
  return http::verb::get;
}

}  // namespace

https_transport::https_transport() : ssl_context_{make_default_context()} {}

https_transport::https_transport(asio::ssl::context context)
    : ssl_context_{std::move(context)} {}

asio::awaitable<http_response_t> https_transport::send(
    const endpoint_t& endpoint,
    http_request_t request,
    const std::chrono::seconds timeout) {
  auto executor = co_await asio::this_coro::executor;
  auto resolver = std::make_shared<asio::ip::tcp::resolver>(executor);
  auto stream = beast::ssl_stream<beast::tcp_stream>{executor, ssl_context_};

  if (!SSL_set_tlsext_host_name(stream.native_handle(), endpoint.host.c_str())) {
    throw boost::system::system_error{
        beast::error_code{static_cast<int>(::ERR_get_error()),
                          asio::error::get_ssl_category()}};
  }
  stream.set_verify_callback(asio::ssl::host_name_verification{endpoint.host});

  // One deadline covers the whole attempt, name resolution included.
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  auto resolve_timer = asio::steady_timer{executor};
  resolve_timer.expires_at(deadline);
  resolve_timer.async_wait([resolver](const beast::error_code& ec) {
    if (!ec) {
      resolver->cancel();
    }
  });
  auto resolve_ec = beast::error_code{};
  const auto results = co_await resolver->async_resolve(
      endpoint.host, endpoint.port,
      asio::redirect_error(asio::use_awaitable, resolve_ec));
  resolve_timer.cancel();
  if (resolve_ec == asio::error::operation_aborted) {
    throw boost::system::system_error{asio::error::timed_out,
                                      "resolve " + endpoint.host};
  }
  if (resolve_ec) {
    throw boost::system::system_error{resolve_ec, "resolve " + endpoint.host};
  }

  beast::get_lowest_layer(stream).expires_at(deadline);
  co_await beast::get_lowest_layer(stream).async_connect(results,
                                                         asio::use_awaitable);
  co_await stream.async_handshake(asio::ssl::stream_base::client,
                                  asio::use_awaitable);

  auto req = http::request<http::string_body>{to_verb(request.method),
                                              request.target, 11};
  req.set(http::field::host, endpoint.host);
  req.set(http::field::user_agent, kUserAgent);
  req.set(http::field::accept, "application/json");
  for (const auto& [name, value] : request.headers) {
    req.set(name, value);
  }
  if (request.method == http_method::post) {
    req.set(http::field::content_type, "application/json");
    req.body() = std::move(request.body);
  }
  req.prepare_payload();

  co_await http::async_write(stream, req, asio::use_awaitable);

  auto buffer = beast::flat_buffer{};
  auto res = http::response<http::string_body>{};
  co_await http::async_read(stream, buffer, res, asio::use_awaitable);

  auto ec = beast::error_code{};
  co_await stream.async_shutdown(asio::redirect_error(asio::use_awaitable, ec));
  if (ec && ec != asio::ssl::error::stream_truncated &&
      ec != asio::error::eof) {
    spdlog::debug("tls shutdown with {}: {}", endpoint.host, ec.message());
  }

  co_return http_response_t{.status = res.result_int(),
                            .body = std::move(res.body())};
}

}  // namespace turnstile::facilitator
