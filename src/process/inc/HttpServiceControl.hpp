#ifndef ARBITER_PROCESS_HTTP_SERVICE_CONTROL_HPP
#define ARBITER_PROCESS_HTTP_SERVICE_CONTROL_HPP
/**
 * @file HttpServiceControl.hpp
 * @brief ServiceControl over the local process-management HTTP API.
 *
 * Endpoints (relative to controlPlaneUrl):
 *   GET  /                          liveness
 *   GET  /process/status            {"ollama":{"running","pid"},"comfyui":{...},"current_service"}
 *   POST /process/switch?service=N  {"success","switch_time",...}
 *   POST /process/stop?service=N
 *   POST /process/start?service=N
 *
 * Service health is probed directly on each service's own API.
 */

#include "src/process/inc/ServiceControl.hpp"

#include <array>       // std::array
#include <chrono>      // std::chrono::milliseconds
#include <optional>    // std::optional
#include <string>      // std::string
#include <string_view> // std::string_view

namespace arbiter {

namespace process {

/* ----------------------------- ControlPlaneConfig ----------------------------- */

/**
 * @brief Endpoints, wire names and timeouts.
 *
 * Arrays are indexed by ServiceType (Primary, Secondary, Other).
 */
struct ControlPlaneConfig {
  std::string controlPlaneUrl{};                    ///< Empty: control plane disabled
  std::chrono::milliseconds apiTimeout{5000};       ///< Liveness, status, stop, start
  std::chrono::milliseconds switchTimeout{120000};  ///< POST /process/switch
  std::chrono::milliseconds healthTimeout{2000};    ///< Direct service probes
  std::array<std::string, 3> serviceNames{"ollama", "comfyui", "other"};
  std::array<std::string, 3> healthUrls{"http://127.0.0.1:11434/api/tags",
                                        "http://127.0.0.1:8188/system_stats", ""};

  [[nodiscard]] const std::string& serviceName(ServiceType type) const noexcept {
    return serviceNames[static_cast<std::size_t>(type)];
  }
  [[nodiscard]] const std::string& healthUrl(ServiceType type) const noexcept {
    return healthUrls[static_cast<std::size_t>(type)];
  }

  /// @brief Map a wire name back to a ServiceType.
  [[nodiscard]] std::optional<ServiceType> serviceFromName(std::string_view name) const noexcept;
};

/* ----------------------------- HttpServiceControl ----------------------------- */

class HttpServiceControl final : public ServiceControl {
public:
  explicit HttpServiceControl(ControlPlaneConfig config);

  [[nodiscard]] bool apiAvailable() noexcept override;
  [[nodiscard]] SwitchResult switchService(ServiceType type) noexcept override;
  [[nodiscard]] bool stopService(ServiceType type) noexcept override;
  [[nodiscard]] bool startService(ServiceType type) noexcept override;
  [[nodiscard]] ControlPlaneStatus status() noexcept override;

  /**
   * @brief GET the service's health URL.
   * @return true on HTTP 200. A type with no health URL has nothing to probe
   *         and reports healthy.
   */
  [[nodiscard]] bool serviceHealthy(ServiceType type) noexcept override;

  [[nodiscard]] const ControlPlaneConfig& config() const noexcept { return config_; }

private:
  [[nodiscard]] std::string endpoint(std::string_view path) const;
  [[nodiscard]] std::string serviceEndpoint(std::string_view path, ServiceType type) const;

  ControlPlaneConfig config_;
};

/**
 * @brief Interpret a /process/status body.
 * @note Exposed for tests. Missing fields leave defaults in place.
 */
[[nodiscard]] ControlPlaneStatus parseControlPlaneStatus(std::string_view body,
                                                         const ControlPlaneConfig& config);

/**
 * @brief Interpret a /process/switch body.
 * @note Exposed for tests. A body without "success" is treated as success when
 *       the HTTP status was 2xx; switch_time is reported in seconds.
 */
[[nodiscard]] SwitchResult parseSwitchResponse(std::string_view body);

} // namespace process

} // namespace arbiter

#endif // ARBITER_PROCESS_HTTP_SERVICE_CONTROL_HPP
