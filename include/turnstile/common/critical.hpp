#pragma once

#include <csignal>
#include <exception>
#include <string_view>

#include <spdlog/spdlog.h>

namespace turnstile::common {

/// Report a broken internal invariant and terminate the process.
[[noreturn]] inline void critical(const std::string_view message) {
  spdlog::critical("{}", message);
  spdlog::shutdown();
  std::raise(SIGTERM);
  std::terminate();
}

/// Same as above, tagged with the trace identifier of the claim in flight.
[[noreturn]] inline void critical(const std::string_view trace_id,
                                  const std::string_view message) {
  spdlog::critical("[{}] {}", trace_id, message);
  spdlog::shutdown();
  std::raise(SIGTERM);
  std::terminate();
}

}  // namespace turnstile::common
