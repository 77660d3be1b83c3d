#ifndef ARBITER_PROCESS_SERVICE_CONTROL_HPP
#define ARBITER_PROCESS_SERVICE_CONTROL_HPP
/**
 * @file ServiceControl.hpp
 * @brief Typed interface to the control plane that starts and stops GPU services.
 *
 * Every call returns a result struct; none throws. Implementations translate
 * whatever the transport returns into these types at the boundary.
 */

#include "src/process/inc/ServiceType.hpp"

#include <optional> // std::optional
#include <string>   // std::string

namespace arbiter {

namespace process {

/* ----------------------------- Result Types ----------------------------- */

/**
 * @brief Outcome of a switch request.
 */
struct SwitchResult {
  bool success{false};
  double switchTimeMs{0.0}; ///< Time the control plane reported (or measured) for the switch
  std::string message;      ///< Error or informational text

  [[nodiscard]] std::string toString() const;
};

/**
 * @brief Per-service process state.
 */
struct ServiceProcessState {
  bool running{false};
  std::optional<int> pid;
};

/**
 * @brief Snapshot of the control plane's view.
 */
struct ControlPlaneStatus {
  bool reachable{false};
  ServiceProcessState primary{};
  ServiceProcessState secondary{};
  std::optional<ServiceType> currentService; ///< Empty when none or unknown

  [[nodiscard]] std::string toString() const;
  [[nodiscard]] std::string toJson() const;
};

/* ----------------------------- ServiceControl ----------------------------- */

/**
 * @brief Control-plane and health-probe operations for managed services.
 * @note Implementations must be safe to call from multiple threads.
 */
class ServiceControl {
public:
  virtual ~ServiceControl() = default;

  /// @brief True if the control plane itself answers.
  [[nodiscard]] virtual bool apiAvailable() noexcept = 0;

  /// @brief Ask the control plane to make type the active service.
  [[nodiscard]] virtual SwitchResult switchService(ServiceType type) noexcept = 0;

  /// @brief Ask the control plane to stop type.
  [[nodiscard]] virtual bool stopService(ServiceType type) noexcept = 0;

  /// @brief Ask the control plane to start type.
  [[nodiscard]] virtual bool startService(ServiceType type) noexcept = 0;

  /// @brief Process state as the control plane reports it.
  [[nodiscard]] virtual ControlPlaneStatus status() noexcept = 0;

  /// @brief Probe the service's own API directly, bypassing the control plane.
  [[nodiscard]] virtual bool serviceHealthy(ServiceType type) noexcept = 0;
};

} // namespace process

} // namespace arbiter

#endif // ARBITER_PROCESS_SERVICE_CONTROL_HPP
