#include <turnstile/facilitator/retry_policy.hpp>

#include <algorithm>
#include <random>

namespace turnstile::facilitator {

namespace {

// Keeps the doubling well inside the range of milliseconds.
constexpr auto kMaxDoublings = uint32_t{20};

}  // namespace

retry_policy_t make_retry_policy(const uint32_t max_retries,
                                 const std::chrono::milliseconds base_delay,
                                 const std::chrono::seconds request_timeout) {
  return retry_policy_t{
      .max_attempts = std::max<uint32_t>(1, max_retries),
      .base_delay = base_delay,
      .request_timeout = request_timeout,
  };
}

std::chrono::milliseconds backoff_delay(const std::chrono::milliseconds base,
                                        const uint32_t attempt,
                                        const std::chrono::milliseconds jitter) {
  if (attempt <= 1) {
    return std::chrono::milliseconds{0};
  }
  const auto doublings = std::min(attempt - 2, kMaxDoublings);
  return base * (int64_t{1} << doublings) + jitter;
}

std::chrono::milliseconds sample_jitter(const std::chrono::milliseconds base) {
  if (base.count() <= 0) {
    return std::chrono::milliseconds{0};
  }
  thread_local auto engine = std::mt19937_64{std::random_device{}()};
  auto distribution =
      std::uniform_int_distribution<int64_t>{0, base.count() - 1};
  return std::chrono::milliseconds{distribution(engine)};
}

}  // namespace turnstile::facilitator
