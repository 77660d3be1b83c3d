/**
 * @file ProcessSwitcher.cpp
 * @brief Service switching with retry, readiness wait and health-probe fallback.
 */

#include "src/process/inc/ProcessSwitcher.hpp"

#include "src/helpers/inc/Format.hpp"

#include <algorithm>
#include <stdexcept>
#include <thread>
#include <utility>

#include <fmt/core.h>
#include <spdlog/spdlog.h>

namespace arbiter {

namespace process {

using Clock = std::chrono::steady_clock;

ProcessSwitcher::ProcessSwitcher(SwitcherConfig config, std::unique_ptr<ServiceControl> control)
    : config_(config), control_(std::move(control)) {
  if (!control_) {
    throw std::invalid_argument("ProcessSwitcher requires a ServiceControl");
  }
}

/* ----------------------------- State ----------------------------- */

void ProcessSwitcher::markActive(ServiceType type) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (current_ != type) {
    previous_ = current_;
    current_ = type;
  }
  if (restoreTarget_ == current_) {
    restoreTarget_.reset();
  }
}

void ProcessSwitcher::rememberRestoreTarget() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (restoreTarget_) {
      return;
    }
  }
  std::optional<ServiceType> before = queryCurrentService();

  std::lock_guard<std::mutex> lock(mutex_);
  if (!before) {
    before = current_;
  }
  if (!restoreTarget_) {
    restoreTarget_ = before;
  }
}

std::optional<ServiceType> ProcessSwitcher::currentService() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return current_;
}

std::optional<ServiceType> ProcessSwitcher::previousService() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return previous_;
}

std::optional<ServiceType> ProcessSwitcher::restoreTarget() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return restoreTarget_;
}

/* ----------------------------- Probes ----------------------------- */

bool ProcessSwitcher::checkAvailable(ServiceType type) noexcept {
  return control_->serviceHealthy(type);
}

bool ProcessSwitcher::checkApiAvailable() noexcept { return control_->apiAvailable(); }

std::optional<ServiceType> ProcessSwitcher::queryCurrentService() noexcept {
  const ControlPlaneStatus STATUS = control_->status();
  if (!STATUS.reachable) {
    return std::nullopt;
  }
  return STATUS.currentService;
}

ControlPlaneStatus ProcessSwitcher::controlPlaneStatus() noexcept { return control_->status(); }

bool ProcessSwitcher::waitForServiceReady(ServiceType type, std::chrono::milliseconds timeout) {
  if (type == ServiceType::Other) {
    return true;
  }
  const auto START = Clock::now();
  while (true) {
    const auto ELAPSED = Clock::now() - START;
    if (checkAvailable(type)) {
      spdlog::info("{} ready after {}", toString(type), helpers::format::seconds(ELAPSED));
      return true;
    }
    if (ELAPSED >= timeout) {
      spdlog::warn("{} not ready after {}", toString(type), helpers::format::seconds(timeout));
      return false;
    }
    const auto REMAINING =
        timeout - std::chrono::duration_cast<std::chrono::milliseconds>(ELAPSED);
    std::this_thread::sleep_for(std::min(config_.readinessPoll, REMAINING));
  }
}

/* ----------------------------- Switching ----------------------------- */

bool ProcessSwitcher::switchTo(ServiceType type, bool forceRestart) {
  const std::string_view NAME = toString(type);
  if (type == ServiceType::Other) {
    spdlog::debug("No managed process for {}, nothing to switch", NAME);
    return true;
  }

  if (!control_->apiAvailable()) {
    spdlog::warn("Control plane unavailable, probing {} directly", NAME);
    const bool UP = checkAvailable(type);
    if (UP) {
      markActive(type);
    }
    return UP;
  }

  rememberRestoreTarget();

  if (!forceRestart && currentService() == type) {
    if (checkAvailable(type)) {
      spdlog::debug("{} already active", NAME);
      return true;
    }
    spdlog::warn("{} marked active but not answering, switching again", NAME);
  }

  if (forceRestart) {
    spdlog::info("Forcing restart of {}", NAME);
    if (!stop(type)) {
      spdlog::warn("Stop before restart of {} failed, switching anyway", NAME);
    }
  }

  spdlog::info("Switching to {}...", NAME);
  SwitchResult last{};
  const bool OK = retry(config_.retry, fmt::format("switch to {}", NAME), [&] {
    last = control_->switchService(type);
    return last.success;
  });

  if (OK) {
    spdlog::info("Switched to {} ({})", NAME, last.toString());
    markActive(type);
    if (!waitForServiceReady(type, config_.readinessTimeout)) {
      spdlog::warn("{} switched but not ready yet, continuing", NAME);
    }
    return true;
  }

  spdlog::error("Switch to {} failed: {}", NAME, last.message);
  if (checkAvailable(type)) {
    spdlog::info("{} is reachable anyway, using it", NAME);
    markActive(type);
    return true;
  }
  return false;
}

bool ProcessSwitcher::stop(ServiceType type) {
  const std::string_view NAME = toString(type);
  if (!control_->apiAvailable()) {
    spdlog::warn("Control plane unavailable, cannot stop {}", NAME);
    return false;
  }
  const bool OK = retry(config_.retry, fmt::format("stop {}", NAME),
                        [&] { return control_->stopService(type); });
  if (OK) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (current_ == type) {
      previous_ = current_;
      current_.reset();
    }
    spdlog::info("Stopped {}", NAME);
  }
  return OK;
}

bool ProcessSwitcher::start(ServiceType type) {
  const std::string_view NAME = toString(type);
  if (!control_->apiAvailable()) {
    spdlog::warn("Control plane unavailable, cannot start {}", NAME);
    return false;
  }
  const bool OK = retry(config_.retry, fmt::format("start {}", NAME),
                        [&] { return control_->startService(type); });
  if (!OK) {
    return false;
  }
  markActive(type);
  return waitForServiceReady(type, config_.readinessTimeout);
}

bool ProcessSwitcher::restorePrevious() {
  if (!config_.restoreOnRelease) {
    return true;
  }

  ServiceType target{};
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!restoreTarget_) {
      return true;
    }
    if (current_ == restoreTarget_) {
      restoreTarget_.reset();
      return true;
    }
    target = *restoreTarget_;
  }

  spdlog::info("Restoring previous service {}", toString(target));
  const bool OK = switchTo(target);
  if (OK) {
    std::lock_guard<std::mutex> lock(mutex_);
    restoreTarget_.reset();
  } else {
    spdlog::warn("Could not restore {}", toString(target));
  }
  return OK;
}

bool ProcessSwitcher::ensurePrimaryActive() {
  const auto START = Clock::now();
  const bool OK = switchTo(ServiceType::Primary);
  if (OK) {
    spdlog::info("Primary service active ({})", helpers::format::seconds(Clock::now() - START));
  } else {
    spdlog::warn("Could not bring the primary service back");
  }
  return OK;
}

} // namespace process

} // namespace arbiter
