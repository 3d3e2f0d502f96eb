#pragma once

#include <chrono>
#include <cstdint>

namespace turnstile::facilitator {

inline constexpr auto kDefaultRequestTimeout = std::chrono::seconds{30};
inline constexpr auto kDefaultMaxRetries = uint32_t{3};
inline constexpr auto kDefaultRetryBaseDelay = std::chrono::milliseconds{100};

struct retry_policy final {
  // Total attempts for one facilitator call, the first included.
  uint32_t max_attempts{kDefaultMaxRetries};
  std::chrono::milliseconds base_delay{kDefaultRetryBaseDelay};
  // Applies to each attempt separately.
  std::chrono::seconds request_timeout{kDefaultRequestTimeout};
};

using retry_policy_t = retry_policy;

/// `max_retries` configured by the operator; at least one attempt is made.
retry_policy_t make_retry_policy(uint32_t max_retries,
                                 std::chrono::milliseconds base_delay,
                                 std::chrono::seconds request_timeout);

/// Delay before `attempt` (1-based): zero for the first, otherwise
/// base * 2^(attempt - 2) + jitter. `jitter` is expected in [0, base).
std::chrono::milliseconds backoff_delay(std::chrono::milliseconds base,
                                        uint32_t attempt,
                                        std::chrono::milliseconds jitter);

std::chrono::milliseconds sample_jitter(std::chrono::milliseconds base);

}  // namespace turnstile::facilitator
