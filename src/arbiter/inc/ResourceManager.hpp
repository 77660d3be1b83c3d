#ifndef ARBITER_ARBITER_RESOURCE_MANAGER_HPP
#define ARBITER_ARBITER_RESOURCE_MANAGER_HPP
/**
 * @file ResourceManager.hpp
 * @brief Priority-queued, single-lease arbiter for the shared GPU.
 *
 * Exactly one Lease is outstanding at any instant. Waiting requests are
 * served by priority, then arrival order. Before a lease is granted the
 * requested service is switched in and VRAM headroom is re-checked (skipped
 * in fallback mode, when no telemetry backend answers). After release the
 * restoration policy runs and the next waiter is promoted.
 *
 * Queue and lease state live under one mutex. Process switching, settle
 * delays and VRAM checks run outside it, one admission at a time.
 *
 * @note A new arrival takes the GPU directly only when it is free and nobody
 *       is queued; otherwise it joins the queue.
 */

#include "src/arbiter/inc/Errors.hpp"
#include "src/arbiter/inc/GpuRequest.hpp"
#include "src/arbiter/inc/Lease.hpp"
#include "src/arbiter/inc/RequestQueue.hpp"
#include "src/gpu/inc/VramMonitor.hpp"
#include "src/process/inc/ProcessSwitcher.hpp"
#include "src/process/inc/ServiceType.hpp"

#include <array>              // std::array
#include <atomic>             // std::atomic
#include <chrono>             // std::chrono::milliseconds, std::chrono::steady_clock
#include <condition_variable> // std::condition_variable
#include <cstdint>            // std::uint64_t, std::uint8_t
#include <memory>             // std::shared_ptr
#include <mutex>              // std::mutex, std::unique_lock
#include <optional>           // std::optional
#include <string>             // std::string
#include <unordered_map>      // std::unordered_map
#include <vector>             // std::vector

namespace arbiter {

/* ----------------------------- Configuration ----------------------------- */

struct ResourceManagerConfig {
  std::array<int, 3> priorities{5, 10, 1};              ///< Indexed by ServiceType
  std::chrono::milliseconds defaultTimeout{300000};     ///< acquire() wait ceiling
  std::chrono::milliseconds settleDelay{2000};          ///< Pause between switch and VRAM check
  std::chrono::milliseconds queueRecheckInterval{1000}; ///< Waiter wake-up period
  bool alwaysRestorePrimaryAfterSecondary{true};
  std::size_t statusQueueLimit{10}; ///< Queue entries listed by status()

  [[nodiscard]] int priorityFor(process::ServiceType type) const noexcept {
    return priorities[static_cast<std::size_t>(type)];
  }
};

/**
 * @brief Per-call acquire() parameters.
 */
struct AcquireOptions {
  std::optional<std::string> requesterId;
  std::optional<std::uint64_t> requiredMemoryMb;
  std::optional<std::chrono::milliseconds> timeout; ///< defaultTimeout when empty
  bool forceRestart{false};
};

/* ----------------------------- Status ----------------------------- */

struct ArbiterMetrics {
  std::uint64_t totalRequests{0};
  std::uint64_t totalTimeouts{0};
  std::uint64_t totalGrants{0};
  std::uint64_t completedLeases{0};
  double totalWaitSeconds{0.0};
  double totalUsageSeconds{0.0};

  [[nodiscard]] double timeoutRate() const noexcept;
  [[nodiscard]] double avgWaitSeconds() const noexcept;
  [[nodiscard]] double avgUsageSeconds() const noexcept;
};

struct QueuedRequestInfo {
  std::string shortId;
  process::ServiceType serviceType{process::ServiceType::Other};
  int priority{0};
  double waitingSeconds{0.0};
  std::optional<std::string> requesterId;
};

/**
 * @brief Point-in-time view of the arbiter.
 */
struct ArbiterStatus {
  bool locked{false};                                ///< A lease is held or being granted
  std::optional<process::ServiceType> leaseService;  ///< Holder's service
  std::optional<std::string> leaseId;
  double leaseHeldSeconds{0.0};
  std::optional<process::ServiceType> activeService; ///< Switcher's belief
  std::size_t queueLength{0};
  std::vector<QueuedRequestInfo> queue;              ///< First statusQueueLimit entries
  gpu::UsageSnapshot vram{};
  ArbiterMetrics metrics{};
  bool fallbackMode{false};

  [[nodiscard]] std::string toString() const;
  [[nodiscard]] std::string toJson() const;
};

/* ----------------------------- ResourceManager ----------------------------- */

class LeaseGuard;

class ResourceManager {
public:
  /**
   * @param config   Arbitration settings.
   * @param switcher Process lifecycle collaborator (must outlive the manager).
   * @param vram     Telemetry collaborator (must outlive the manager).
   */
  ResourceManager(ResourceManagerConfig config, process::ProcessSwitcher& switcher,
                  gpu::VramMonitor& vram);

  ResourceManager(const ResourceManager&) = delete;
  ResourceManager& operator=(const ResourceManager&) = delete;

  /**
   * @brief Obtain the GPU lease for type, waiting if necessary.
   * @return The granted lease. Pass its id to release().
   * @throws ResourceUnavailableError Control plane and target service both unreachable.
   * @throws TimeoutError Not admitted within the timeout; the request is dequeued.
   */
  [[nodiscard]] std::shared_ptr<Lease> acquire(process::ServiceType type,
                                               const AcquireOptions& opts = {});

  /**
   * @brief acquire() wrapped in a guard that releases on scope exit.
   */
  [[nodiscard]] LeaseGuard acquireScoped(process::ServiceType type,
                                         const AcquireOptions& opts = {});

  /**
   * @brief Give the GPU back, run the restoration policy, promote the next waiter.
   * @note Unknown, stale or already released ids are logged and ignored.
   */
  void release(const std::string& leaseId);

  /**
   * @brief Re-probe telemetry and update fallback mode.
   * @return Fallback mode after the probe.
   */
  bool refreshFallbackMode() noexcept;

  [[nodiscard]] bool fallbackMode() const noexcept { return fallbackMode_.load(); }

  [[nodiscard]] ArbiterStatus status();

  [[nodiscard]] ArbiterMetrics metrics() const;

  [[nodiscard]] std::size_t queueLength() const;

  /// @brief Id of the outstanding lease, if any.
  [[nodiscard]] std::optional<std::string> currentLeaseId() const;

  [[nodiscard]] const ResourceManagerConfig& config() const noexcept { return config_; }

private:
  enum class SlotState : std::uint8_t { Free, Switching, Held };
  enum class WaitState : std::uint8_t { Queued, Admitting, Granted };

  struct Waiter {
    WaitState state{WaitState::Queued};
    bool vramDeferred{false};
    std::shared_ptr<Lease> lease;
  };

  using Lock = std::unique_lock<std::mutex>;

  bool admit(const GpuRequest& request) noexcept;
  std::shared_ptr<Lease> grantLocked(std::shared_ptr<const GpuRequest> request);
  void promoteLocked(Lock& lock);
  void applyRestorationPolicy(process::ServiceType released) noexcept;

  ResourceManagerConfig config_;
  process::ProcessSwitcher& switcher_;
  gpu::VramMonitor& vram_;
  std::atomic<bool> fallbackMode_{false};

  mutable std::mutex mutex_;
  std::condition_variable cv_;
  SlotState slot_{SlotState::Free};
  std::shared_ptr<Lease> currentLease_;
  RequestQueue queue_;
  std::unordered_map<std::string, Waiter> waiters_;
  ArbiterMetrics metrics_{};
  std::uint64_t nextSequence_{0};
  std::chrono::steady_clock::time_point retryAdmissionAt_{}; ///< Backoff after a VRAM deferral
};

/* ----------------------------- LeaseGuard ----------------------------- */

/**
 * @brief Releases its lease exactly once: on release() or destruction.
 */
class LeaseGuard {
public:
  LeaseGuard(ResourceManager& manager, std::shared_ptr<Lease> lease) noexcept
      : manager_(&manager), lease_(std::move(lease)) {}

  ~LeaseGuard();

  LeaseGuard(const LeaseGuard&) = delete;
  LeaseGuard& operator=(const LeaseGuard&) = delete;
  LeaseGuard(LeaseGuard&& other) noexcept;
  LeaseGuard& operator=(LeaseGuard&& other) noexcept;

  /// @brief Release now. Later calls and the destructor do nothing.
  void release();

  /// @note Undefined on a moved-from guard.
  [[nodiscard]] const Lease& lease() const noexcept { return *lease_; }
  [[nodiscard]] bool holds() const noexcept { return lease_ && !lease_->released(); }

private:
  ResourceManager* manager_;
  std::shared_ptr<Lease> lease_;
};

} // namespace arbiter

#endif // ARBITER_ARBITER_RESOURCE_MANAGER_HPP
