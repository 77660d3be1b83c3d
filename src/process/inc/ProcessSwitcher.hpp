#ifndef ARBITER_PROCESS_PROCESS_SWITCHER_HPP
#define ARBITER_PROCESS_PROCESS_SWITCHER_HPP
/**
 * @file ProcessSwitcher.hpp
 * @brief Keeps the wanted GPU service running and its competitor stopped.
 *
 * All operations are best-effort: failures are retried with backoff and
 * finally reported as false, never thrown. When the control plane cannot be
 * reached, a switch degrades to a direct health probe of the target service.
 *
 * @note Thread-safe for state queries. Mutating operations are expected to be
 *       serialized by the caller (the Resource Manager promotes one request at
 *       a time).
 */

#include "src/process/inc/RetryPolicy.hpp"
#include "src/process/inc/ServiceControl.hpp"
#include "src/process/inc/ServiceType.hpp"

#include <chrono>   // std::chrono::milliseconds
#include <memory>   // std::unique_ptr
#include <mutex>    // std::mutex
#include <optional> // std::optional

namespace arbiter {

namespace process {

/* ----------------------------- SwitcherConfig ----------------------------- */

struct SwitcherConfig {
  RetryPolicy retry{};                               ///< Applied to every control-plane mutation
  std::chrono::milliseconds readinessTimeout{30000}; ///< Wait for health after a switch
  std::chrono::milliseconds readinessPoll{2000};     ///< Health poll period
  bool restoreOnRelease{true};                       ///< False: restorePrevious() is a no-op
};

/* ----------------------------- ProcessSwitcher ----------------------------- */

class ProcessSwitcher {
public:
  ProcessSwitcher(SwitcherConfig config, std::unique_ptr<ServiceControl> control);

  ProcessSwitcher(const ProcessSwitcher&) = delete;
  ProcessSwitcher& operator=(const ProcessSwitcher&) = delete;

  /**
   * @brief Make type the active service.
   *
   * Idempotent: when type is already active and answers its health probe,
   * returns true without contacting the control plane (unless forceRestart).
   * With forceRestart the service is stopped first so that it reloads.
   *
   * @return true if type is believed active and reachable afterwards.
   */
  [[nodiscard]] bool switchTo(ServiceType type, bool forceRestart = false);

  /// @brief Non-mutating health probe of the service's own API.
  [[nodiscard]] bool checkAvailable(ServiceType type) noexcept;

  /// @brief True if the control plane answers.
  [[nodiscard]] bool checkApiAvailable() noexcept;

  /// @brief Stop type through the control plane.
  [[nodiscard]] bool stop(ServiceType type);

  /// @brief Start type through the control plane and wait for it to answer.
  [[nodiscard]] bool start(ServiceType type);

  /**
   * @brief Re-activate the service that was active before the first switch
   *        since the last restoration.
   * @return true if restored, nothing to restore, or restoration disabled.
   */
  [[nodiscard]] bool restorePrevious();

  /// @brief switchTo(Primary), logged as a restoration.
  [[nodiscard]] bool ensurePrimaryActive();

  /**
   * @brief Poll the health probe until it answers or timeout elapses.
   * @return true for Other (nothing to wait for).
   */
  [[nodiscard]] bool waitForServiceReady(ServiceType type, std::chrono::milliseconds timeout);

  /// @brief Locally believed active service.
  [[nodiscard]] std::optional<ServiceType> currentService() const;

  /// @brief Service active immediately before the last switch.
  [[nodiscard]] std::optional<ServiceType> previousService() const;

  /// @brief Service restorePrevious() would re-activate.
  [[nodiscard]] std::optional<ServiceType> restoreTarget() const;

  /// @brief Active service as the control plane reports it.
  [[nodiscard]] std::optional<ServiceType> queryCurrentService() noexcept;

  /// @brief Full control-plane status.
  [[nodiscard]] ControlPlaneStatus controlPlaneStatus() noexcept;

  [[nodiscard]] const SwitcherConfig& config() const noexcept { return config_; }

private:
  void rememberRestoreTarget();
  void markActive(ServiceType type);

  SwitcherConfig config_;
  std::unique_ptr<ServiceControl> control_;

  mutable std::mutex mutex_;
  std::optional<ServiceType> current_;
  std::optional<ServiceType> previous_;
  std::optional<ServiceType> restoreTarget_;
};

} // namespace process

} // namespace arbiter

#endif // ARBITER_PROCESS_PROCESS_SWITCHER_HPP
