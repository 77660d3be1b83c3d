#ifndef ARBITER_PROCESS_RETRY_POLICY_HPP
#define ARBITER_PROCESS_RETRY_POLICY_HPP
/**
 * @file RetryPolicy.hpp
 * @brief Bounded retry with exponential backoff for control-plane operations.
 *
 * One policy is shared by every Process Switcher call site so that attempts
 * and delays are configured in one place.
 */

#include <chrono>      // std::chrono::milliseconds
#include <cstdint>     // std::uint32_t
#include <string_view> // std::string_view
#include <thread>      // std::this_thread::sleep_for

#include <spdlog/spdlog.h>

namespace arbiter {

namespace process {

/* ----------------------------- RetryPolicy ----------------------------- */

/**
 * @brief Attempts and backoff schedule.
 *
 * Delay before attempt n (n >= 2) is baseDelay * multiplier^(n-2):
 * with the defaults, 2 s then 4 s.
 */
struct RetryPolicy {
  std::uint32_t maxAttempts{3};
  std::chrono::milliseconds baseDelay{2000};
  double multiplier{2.0};

  /// @brief Delay slept after a failed attempt (1-based).
  [[nodiscard]] std::chrono::milliseconds delayAfter(std::uint32_t attempt) const noexcept {
    double ms = static_cast<double>(baseDelay.count());
    for (std::uint32_t i = 1; i < attempt; ++i) {
      ms *= multiplier;
    }
    return std::chrono::milliseconds{static_cast<std::chrono::milliseconds::rep>(ms)};
  }
};

/**
 * @brief Run op until it returns true or attempts are exhausted.
 * @param policy Attempts and delays. maxAttempts == 0 is treated as 1.
 * @param what   Operation name for log lines.
 * @param op     Callable returning bool.
 * @return Result of the last attempt.
 */
template <typename Op>
[[nodiscard]] bool retry(const RetryPolicy& policy, std::string_view what, Op&& op) {
  const std::uint32_t ATTEMPTS = policy.maxAttempts == 0 ? 1 : policy.maxAttempts;
  for (std::uint32_t attempt = 1; attempt <= ATTEMPTS; ++attempt) {
    if (op()) {
      if (attempt > 1) {
        spdlog::info("{} succeeded on attempt {}/{}", what, attempt, ATTEMPTS);
      }
      return true;
    }
    if (attempt == ATTEMPTS) {
      break;
    }
    const auto DELAY = policy.delayAfter(attempt);
    spdlog::warn("{} failed (attempt {}/{}), retrying in {} ms", what, attempt, ATTEMPTS,
                 DELAY.count());
    std::this_thread::sleep_for(DELAY);
  }
  spdlog::error("{} failed after {} attempts", what, ATTEMPTS);
  return false;
}

} // namespace process

} // namespace arbiter

#endif // ARBITER_PROCESS_RETRY_POLICY_HPP
