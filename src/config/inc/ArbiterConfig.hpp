#ifndef ARBITER_CONFIG_ARBITER_CONFIG_HPP
#define ARBITER_CONFIG_ARBITER_CONFIG_HPP
/**
 * @file ArbiterConfig.hpp
 * @brief Layered configuration for the arbiter and its collaborators.
 *
 * Layers, later wins:
 *   1. Struct defaults
 *   2. KEY=VALUE file (dotenv style: '#' comments, optional quotes,
 *      optional "export " and "ARBITER_" prefixes on keys)
 *   3. Environment variables ARBITER_<KEY>
 *
 * Keys (value types in parentheses, durations in milliseconds):
 *   VRAM_MONITORING_ENABLED (bool)     GPU_DEVICE_INDEX (uint)
 *   VRAM_USAGE_CEILING_PERCENT (real)  VRAM_MIN_FREE_MB (uint)
 *   VRAM_POLL_INTERVAL_MS
 *   PROCESS_MANAGER_API_URL            PROCESS_API_TIMEOUT_MS
 *   PROCESS_SWITCH_TIMEOUT_MS          SERVICE_HEALTH_TIMEOUT_MS
 *   PRIMARY_SERVICE_NAME               SECONDARY_SERVICE_NAME
 *   PRIMARY_HEALTH_URL                 SECONDARY_HEALTH_URL
 *   PROCESS_READY_TIMEOUT_MS           PROCESS_READY_POLL_MS
 *   PROCESS_RESTORE_ON_RELEASE (bool)
 *   RETRY_MAX_ATTEMPTS (uint)          RETRY_BASE_DELAY_MS
 *   RETRY_MULTIPLIER (real)
 *   PRIORITY_PRIMARY (int)             PRIORITY_SECONDARY (int)
 *   PRIORITY_OTHER (int)               GPU_WAIT_TIMEOUT_MS
 *   SWITCH_SETTLE_MS                   QUEUE_RECHECK_MS
 *   ALWAYS_RESTORE_PRIMARY_AFTER_SECONDARY (bool)
 *   LOG_LEVEL
 */

#include "src/arbiter/inc/ResourceManager.hpp"
#include "src/gpu/inc/VramMonitor.hpp"
#include "src/process/inc/HttpServiceControl.hpp"
#include "src/process/inc/ProcessSwitcher.hpp"

#include <functional>  // std::reference_wrapper
#include <optional>    // std::optional
#include <string>      // std::string
#include <string_view> // std::string_view
#include <vector>      // std::vector

namespace arbiter {
namespace config {

/// Prefix of environment variables.
inline constexpr std::string_view ENV_PREFIX = "ARBITER_";

/* ----------------------------- ArbiterConfig ----------------------------- */

struct ArbiterConfig {
  gpu::VramMonitorConfig vram{};
  process::ControlPlaneConfig controlPlane{};
  process::SwitcherConfig switcher{};
  ResourceManagerConfig manager{};
  std::string logLevel{}; ///< Empty: ARBITER_LOG_LEVEL / info

  /// @brief Multi-line human-readable dump.
  [[nodiscard]] std::string toString() const;
};

/* ----------------------------- API ----------------------------- */

using ErrorOut = std::optional<std::reference_wrapper<std::string>>;

/**
 * @brief Set one key. Key match is case-sensitive, without the ARBITER_ prefix.
 * @return false for unknown keys or invalid values.
 */
[[nodiscard]] bool applyValue(ArbiterConfig& cfg, std::string_view key, std::string_view value,
                              ErrorOut error = std::nullopt);

/**
 * @brief Apply KEY=VALUE text.
 * @return false at the first malformed line, unknown key or invalid value.
 */
[[nodiscard]] bool applyText(ArbiterConfig& cfg, std::string_view text,
                             ErrorOut error = std::nullopt);

/**
 * @brief Read and apply a KEY=VALUE file.
 * @return false if the file cannot be read or applyText() fails.
 */
[[nodiscard]] bool loadFromFile(ArbiterConfig& cfg, const std::string& path,
                                ErrorOut error = std::nullopt);

/**
 * @brief Apply every set ARBITER_<KEY> environment variable.
 * @return false at the first invalid value.
 */
[[nodiscard]] bool loadFromEnv(ArbiterConfig& cfg, ErrorOut error = std::nullopt);

/**
 * @brief Defaults, then file (when path is non-empty), then environment.
 */
[[nodiscard]] bool load(ArbiterConfig& cfg, const std::string& path,
                        ErrorOut error = std::nullopt);

/// @brief All recognised keys, without prefix.
[[nodiscard]] std::vector<std::string_view> knownKeys();

} // namespace config
} // namespace arbiter

#endif // ARBITER_CONFIG_ARBITER_CONFIG_HPP
