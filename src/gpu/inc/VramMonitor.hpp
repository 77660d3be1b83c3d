#ifndef ARBITER_GPU_VRAM_MONITOR_HPP
#define ARBITER_GPU_VRAM_MONITOR_HPP
/**
 * @file VramMonitor.hpp
 * @brief VRAM usage reporting and headroom prediction for the GPU arbiter.
 * @note Thread-safe: probes are queried under an internal mutex.
 *
 * Fail-open contract: when no telemetry backend answers, isAvailable()
 * returns true. Losing the ability to observe VRAM must not block GPU work.
 */

#include "src/gpu/inc/VramProbe.hpp"
#include "src/gpu/inc/VramUsage.hpp"

#include <chrono>   // std::chrono::milliseconds
#include <cstdint>  // std::uint64_t
#include <memory>   // std::unique_ptr
#include <mutex>    // std::mutex
#include <optional> // std::optional
#include <vector>   // std::vector

namespace arbiter {

namespace gpu {

/* ----------------------------- VramMonitorConfig ----------------------------- */

/**
 * @brief Monitor settings.
 */
struct VramMonitorConfig {
  bool enabled{true};                           ///< False: report available, never gate
  int deviceIndex{0};                           ///< GPU ordinal to watch
  double usageCeilingPercent{90.0};             ///< At or above this usage, not available
  std::uint64_t minFreeMb{2048};                ///< Default headroom when none requested
  std::chrono::milliseconds pollInterval{1000}; ///< waitForAvailable() poll period
};

/* ----------------------------- VramMonitor ----------------------------- */

/**
 * @brief Read-only VRAM probe with graceful degradation.
 */
class VramMonitor {
public:
  /**
   * @param config Settings.
   * @param probes Backends in preference order; the first that answers wins.
   */
  VramMonitor(VramMonitorConfig config, std::vector<std::unique_ptr<VramProbe>> probes);

  VramMonitor(const VramMonitor&) = delete;
  VramMonitor& operator=(const VramMonitor&) = delete;

  /**
   * @brief Current usage.
   * @return available == false when no backend answered. When monitoring is
   *         disabled: zeros, available == true, source Disabled.
   */
  [[nodiscard]] UsageSnapshot getUsage() noexcept;

  /**
   * @brief Predict whether an allocation of requiredMb would fit.
   * @param requiredMb Requested headroom; config minFreeMb when empty.
   * @return true if telemetry is unavailable or disabled. Otherwise false when
   *         usage is at or above the ceiling or free memory is below the request.
   */
  [[nodiscard]] bool isAvailable(std::optional<std::uint64_t> requiredMb = std::nullopt) noexcept;

  /**
   * @brief Poll isAvailable() every pollInterval until true or timeout.
   * @return false on timeout.
   * @note Blocks the calling thread.
   */
  [[nodiscard]] bool waitForAvailable(std::chrono::milliseconds timeout,
                                      std::optional<std::uint64_t> requiredMb = std::nullopt);

  /// @brief Compute processes on the watched GPU (empty when unknown).
  [[nodiscard]] std::vector<GpuProcessUsage> gpuProcesses() noexcept;

  /// @brief True if at least one backend initialized.
  [[nodiscard]] bool hasBackend() const noexcept;

  [[nodiscard]] const VramMonitorConfig& config() const noexcept { return config_; }

private:
  VramMonitorConfig config_;
  std::vector<std::unique_ptr<VramProbe>> probes_;
  mutable std::mutex mutex_;
};

} // namespace gpu

} // namespace arbiter

#endif // ARBITER_GPU_VRAM_MONITOR_HPP
