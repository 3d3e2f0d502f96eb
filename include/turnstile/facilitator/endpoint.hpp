#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace turnstile::facilitator {

/// A parsed `https://host[:port][/path]` facilitator base URL.
struct endpoint final {
  std::string host;
  std::string port{"443"};
  // Without trailing '/'; empty for the root.
  std::string base_path;

  std::string target(std::string_view path) const;
  std::string url() const;

  bool operator==(const endpoint&) const = default;
};

using endpoint_t = endpoint;

/// HTTPS only. Plain `http://`, user-info, query strings and fragments are
/// rejected with a reason in `error`.
std::optional<endpoint_t> parse_https_url(std::string_view url,
                                          std::string& error);

}  // namespace turnstile::facilitator
