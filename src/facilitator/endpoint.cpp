#include <turnstile/facilitator/endpoint.hpp>
#include <turnstile/schema/primitives.hpp>

#include <spdlog/fmt/fmt.h>

#include <algorithm>
#include <cctype>

namespace turnstile::facilitator {

namespace {

constexpr auto kHttpsScheme = std::string_view{"https://"};

bool iequals_prefix(const std::string_view value, const std::string_view prefix) {
  if (value.size() < prefix.size()) {
    return false;
  }
  return std::equal(std::begin(prefix), std::end(prefix), std::begin(value),
                    [](const char a, const char b) {
                      return std::tolower(static_cast<unsigned char>(a)) ==
                             std::tolower(static_cast<unsigned char>(b));
                    });
}

}  // namespace

std::string endpoint::target(const std::string_view path) const {
  return fmt::format("{}{}", base_path, path);
}

std::string endpoint::url() const {
  // IPv6 literals keep their brackets.
  const auto authority = host.find(':') == std::string::npos
                             ? host
                             : fmt::format("[{}]", host);
  if (port == "443") {
    return fmt::format("https://{}{}", authority, base_path);
  }
  return fmt::format("https://{}:{}{}", authority, port, base_path);
}

std::optional<endpoint_t> parse_https_url(const std::string_view url,
                                          std::string& error) {
  if (!iequals_prefix(url, kHttpsScheme)) {
    error = "facilitator url must use https://";
    return std::nullopt;
  }
  auto rest = url.substr(kHttpsScheme.size());
  if (rest.find_first_of("?#") != std::string_view::npos) {
    error = "facilitator url must not carry a query or fragment";
    return std::nullopt;
  }

  const auto slash = rest.find('/');
  auto authority = rest.substr(0, slash);
  auto path = slash == std::string_view::npos ? std::string_view{}
                                              : rest.substr(slash);
  if (authority.find('@') != std::string_view::npos) {
    error = "facilitator url must not carry credentials";
    return std::nullopt;
  }

  auto out = endpoint_t{};
  auto port = std::string_view{};
  if (authority.starts_with('[')) {
    const auto close = authority.find(']');
    if (close == std::string_view::npos) {
      error = "unterminated IPv6 literal in facilitator url";
      return std::nullopt;
    }
    out.host = std::string{authority.substr(1, close - 1)};
    auto tail = authority.substr(close + 1);
    if (!tail.empty()) {
      if (!tail.starts_with(':')) {
        error = "unexpected characters after IPv6 literal";
        return std::nullopt;
      }
      port = tail.substr(1);
    }
  } else {
    const auto colon = authority.rfind(':');
    out.host = std::string{authority.substr(0, colon)};
    if (colon != std::string_view::npos) {
      port = authority.substr(colon + 1);
    }
  }

  if (out.host.empty()) {
    error = "facilitator url has no host";
    return std::nullopt;
  }
  if (!port.empty() || authority.ends_with(':')) {
    auto number = schema::try_parse_u64(port);
    if (!number || *number == 0 || *number > 65535) {
      error = fmt::format("invalid port '{}' in facilitator url", port);
      return std::nullopt;
    }
    out.port = std::to_string(*number);
  }

  while (path.ends_with('/')) {
    path.remove_suffix(1);
  }
  out.base_path = std::string{path};
  return out;
}

}  // namespace turnstile::facilitator
