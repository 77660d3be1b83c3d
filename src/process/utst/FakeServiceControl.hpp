#ifndef ARBITER_PROCESS_FAKE_SERVICE_CONTROL_HPP
#define ARBITER_PROCESS_FAKE_SERVICE_CONTROL_HPP
/**
 * @file FakeServiceControl.hpp
 * @brief In-memory control plane for unit tests.
 *
 * Models one active service. switchService() makes the target current and
 * healthy; stopService() clears it. Every call is recorded.
 */

#include "src/process/inc/ServiceControl.hpp"

#include <array>    // std::array
#include <atomic>   // std::atomic
#include <cstddef>  // std::size_t
#include <memory>   // std::shared_ptr
#include <mutex>    // std::mutex, std::lock_guard
#include <optional> // std::optional
#include <vector>   // std::vector

namespace arbiter {

namespace process {

namespace test {

struct FakeControlState {
  std::atomic<bool> apiUp{true};
  std::atomic<bool> switchSucceeds{true};
  std::atomic<bool> healthFollowsCurrent{true}; ///< Healthy iff current (else use healthy[])
  std::array<std::atomic<bool>, 3> healthy{};

  mutable std::mutex mutex;
  std::optional<ServiceType> current;
  std::vector<ServiceType> switchCalls;
  std::vector<ServiceType> stopCalls;
  std::vector<ServiceType> startCalls;

  [[nodiscard]] std::size_t switchCount(ServiceType type) const {
    std::lock_guard<std::mutex> lock(mutex);
    std::size_t n = 0;
    for (const ServiceType T : switchCalls) {
      n += (T == type) ? 1 : 0;
    }
    return n;
  }
  [[nodiscard]] std::size_t totalSwitches() const {
    std::lock_guard<std::mutex> lock(mutex);
    return switchCalls.size();
  }
  [[nodiscard]] std::size_t stopCount() const {
    std::lock_guard<std::mutex> lock(mutex);
    return stopCalls.size();
  }
  void setCurrent(std::optional<ServiceType> type) {
    std::lock_guard<std::mutex> lock(mutex);
    current = type;
  }
  [[nodiscard]] std::optional<ServiceType> currentService() const {
    std::lock_guard<std::mutex> lock(mutex);
    return current;
  }
};

class FakeServiceControl final : public ServiceControl {
public:
  explicit FakeServiceControl(std::shared_ptr<FakeControlState> state)
      : state_(std::move(state)) {}

  [[nodiscard]] bool apiAvailable() noexcept override { return state_->apiUp.load(); }

  [[nodiscard]] SwitchResult switchService(ServiceType type) noexcept override {
    std::lock_guard<std::mutex> lock(state_->mutex);
    state_->switchCalls.push_back(type);
    SwitchResult result{};
    if (!state_->apiUp.load() || !state_->switchSucceeds.load()) {
      result.message = "switch refused";
      return result;
    }
    state_->current = type;
    result.success = true;
    result.switchTimeMs = 1.0;
    return result;
  }

  [[nodiscard]] bool stopService(ServiceType type) noexcept override {
    std::lock_guard<std::mutex> lock(state_->mutex);
    state_->stopCalls.push_back(type);
    if (state_->current == type) {
      state_->current.reset();
    }
    return state_->apiUp.load();
  }

  [[nodiscard]] bool startService(ServiceType type) noexcept override {
    std::lock_guard<std::mutex> lock(state_->mutex);
    state_->startCalls.push_back(type);
    state_->current = type;
    return state_->apiUp.load();
  }

  [[nodiscard]] ControlPlaneStatus status() noexcept override {
    ControlPlaneStatus out{};
    if (!state_->apiUp.load()) {
      return out;
    }
    std::lock_guard<std::mutex> lock(state_->mutex);
    out.reachable = true;
    out.currentService = state_->current;
    out.primary.running = state_->current == ServiceType::Primary;
    out.secondary.running = state_->current == ServiceType::Secondary;
    return out;
  }

  [[nodiscard]] bool serviceHealthy(ServiceType type) noexcept override {
    if (type == ServiceType::Other) {
      return true;
    }
    if (state_->healthFollowsCurrent.load()) {
      return state_->currentService() == type;
    }
    return state_->healthy[static_cast<std::size_t>(type)].load();
  }

private:
  std::shared_ptr<FakeControlState> state_;
};

} // namespace test

} // namespace process

} // namespace arbiter

#endif // ARBITER_PROCESS_FAKE_SERVICE_CONTROL_HPP
