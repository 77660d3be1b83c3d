#ifndef ARBITER_HELPERS_FORMAT_HPP
#define ARBITER_HELPERS_FORMAT_HPP
/**
 * @file Format.hpp
 * @brief Human-readable formatting for memory sizes and durations.
 *
 * @note NOT RT-SAFE: All functions return std::string. Use for logs and CLI output.
 */

#include <chrono>  // std::chrono::duration
#include <cstdint> // std::uint64_t
#include <string>  // std::string

#include <fmt/core.h>
#include <fmt/format.h>

namespace arbiter {
namespace helpers {
namespace format {

/* ----------------------------- API ----------------------------- */

/**
 * @brief Format a megabyte count (MiB) using the largest fitting unit.
 * @param mb Size in MiB.
 * @return e.g. "512 MiB", "7.5 GiB".
 */
[[nodiscard]] inline std::string megabytes(std::uint64_t mb) {
  static constexpr std::uint64_t MIB_PER_GIB = 1024ULL;
  if (mb >= MIB_PER_GIB) {
    return fmt::format("{:.1f} GiB", static_cast<double>(mb) / static_cast<double>(MIB_PER_GIB));
  }
  return fmt::format("{} MiB", mb);
}

/**
 * @brief Format a duration as seconds with two decimals.
 * @return e.g. "1.25s".
 */
template <typename Rep, typename Period>
[[nodiscard]] inline std::string seconds(std::chrono::duration<Rep, Period> d) {
  const double SECS = std::chrono::duration<double>(d).count();
  return fmt::format("{:.2f}s", SECS);
}

/**
 * @brief Shorten an opaque id for log lines.
 * @return First 8 characters of id.
 */
[[nodiscard]] inline std::string shortId(const std::string& id) { return id.substr(0, 8); }

} // namespace format
} // namespace helpers
} // namespace arbiter

#endif // ARBITER_HELPERS_FORMAT_HPP
