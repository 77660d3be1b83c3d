#ifndef ARBITER_GPU_VRAM_USAGE_HPP
#define ARBITER_GPU_VRAM_USAGE_HPP
/**
 * @file VramUsage.hpp
 * @brief Typed results of a VRAM telemetry query.
 * @note All sizes are MiB. Numeric fields are meaningless when available is false.
 */

#include <cstdint>     // std::uint64_t, std::uint32_t
#include <string>      // std::string
#include <string_view> // std::string_view

namespace arbiter {

namespace gpu {

/* ----------------------------- TelemetrySource ----------------------------- */

/**
 * @brief Which backend produced a snapshot.
 */
enum class TelemetrySource : std::uint8_t {
  Unavailable = 0, ///< No backend could be reached
  Disabled,        ///< Monitoring switched off by configuration
  Nvml,            ///< NVIDIA Management Library
  NvidiaSmi,       ///< nvidia-smi CLI
  Fixed,           ///< Injected values (tests, simulations)
};

/// @brief Stable lowercase name ("nvml", "nvidia-smi", ...).
[[nodiscard]] std::string_view toString(TelemetrySource source) noexcept;

/* ----------------------------- UsageSnapshot ----------------------------- */

/**
 * @brief GPU memory usage at one instant.
 */
struct UsageSnapshot {
  std::uint64_t usedMb{0};  ///< Used memory
  std::uint64_t totalMb{0}; ///< Total memory
  std::uint64_t freeMb{0};  ///< Free memory
  double usagePercent{0.0}; ///< used / total * 100, rounded to 2 decimals
  bool available{false};    ///< False when no telemetry backend answered
  TelemetrySource source{TelemetrySource::Unavailable};

  /// @brief Build a snapshot from used/total, deriving free and percent.
  [[nodiscard]] static UsageSnapshot fromUsedTotal(std::uint64_t usedMb, std::uint64_t totalMb,
                                                   TelemetrySource source) noexcept;

  /// @brief Human-readable summary.
  [[nodiscard]] std::string toString() const;

  /// @brief Compact JSON object.
  [[nodiscard]] std::string toJson() const;
};

/* ----------------------------- GpuProcessUsage ----------------------------- */

/**
 * @brief A compute process holding GPU memory.
 */
struct GpuProcessUsage {
  std::uint32_t pid{0};
  std::string name;
  std::uint64_t usedMb{0};

  [[nodiscard]] std::string toString() const;
};

} // namespace gpu

} // namespace arbiter

#endif // ARBITER_GPU_VRAM_USAGE_HPP
