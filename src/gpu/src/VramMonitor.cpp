/**
 * @file VramMonitor.cpp
 * @brief VRAM headroom checks over the configured probes.
 */

#include "src/gpu/inc/VramMonitor.hpp"

#include "src/helpers/inc/Format.hpp"

#include <algorithm>
#include <thread>
#include <utility>

#include <spdlog/spdlog.h>

namespace arbiter {

namespace gpu {

VramMonitor::VramMonitor(VramMonitorConfig config, std::vector<std::unique_ptr<VramProbe>> probes)
    : config_(config), probes_(std::move(probes)) {
  if (!config_.enabled) {
    spdlog::info("VRAM monitoring disabled by configuration");
    return;
  }
  for (const auto& probe : probes_) {
    if (probe->present()) {
      spdlog::info("VRAM telemetry via {} (GPU {})", probe->name(), config_.deviceIndex);
      return;
    }
  }
  spdlog::warn("No VRAM telemetry backend available, VRAM checks will pass unconditionally");
}

UsageSnapshot VramMonitor::getUsage() noexcept {
  if (!config_.enabled) {
    UsageSnapshot snap{};
    snap.available = true;
    snap.source = TelemetrySource::Disabled;
    return snap;
  }

  std::lock_guard<std::mutex> lock(mutex_);
  for (const auto& probe : probes_) {
    if (!probe->present()) {
      continue;
    }
    const UsageSnapshot SNAP = probe->query();
    if (SNAP.available) {
      return SNAP;
    }
    spdlog::debug("VRAM probe {} returned no data, trying next", probe->name());
  }
  return UsageSnapshot{};
}

bool VramMonitor::isAvailable(std::optional<std::uint64_t> requiredMb) noexcept {
  if (!config_.enabled) {
    return true;
  }

  const UsageSnapshot SNAP = getUsage();
  if (!SNAP.available) {
    spdlog::warn("VRAM telemetry unavailable, allowing GPU use");
    return true;
  }

  if (SNAP.usagePercent >= config_.usageCeilingPercent) {
    spdlog::warn("VRAM overloaded: {:.1f}% >= {:.1f}%", SNAP.usagePercent,
                 config_.usageCeilingPercent);
    return false;
  }

  const std::uint64_t NEEDED = requiredMb.value_or(config_.minFreeMb);
  if (SNAP.freeMb < NEEDED) {
    spdlog::warn("Not enough free VRAM: {} < {}", helpers::format::megabytes(SNAP.freeMb),
                 helpers::format::megabytes(NEEDED));
    return false;
  }
  return true;
}

bool VramMonitor::waitForAvailable(std::chrono::milliseconds timeout,
                                   std::optional<std::uint64_t> requiredMb) {
  if (!config_.enabled) {
    return true;
  }

  const auto START = std::chrono::steady_clock::now();
  auto nextProgressLog = START + std::chrono::seconds{10};
  while (true) {
    const auto NOW = std::chrono::steady_clock::now();
    if (isAvailable(requiredMb)) {
      spdlog::info("VRAM available after {}", helpers::format::seconds(NOW - START));
      return true;
    }
    if (NOW - START >= timeout) {
      spdlog::warn("Timed out waiting for VRAM ({})", helpers::format::seconds(timeout));
      return false;
    }
    if (NOW >= nextProgressLog) {
      spdlog::info("Waiting for VRAM... ({}/{}, usage {:.1f}%)",
                   helpers::format::seconds(NOW - START), helpers::format::seconds(timeout),
                   getUsage().usagePercent);
      nextProgressLog = NOW + std::chrono::seconds{10};
    }

    const auto REMAINING =
        timeout - std::chrono::duration_cast<std::chrono::milliseconds>(NOW - START);
    std::this_thread::sleep_for(std::min(config_.pollInterval, REMAINING));
  }
}

std::vector<GpuProcessUsage> VramMonitor::gpuProcesses() noexcept {
  if (!config_.enabled) {
    return {};
  }
  std::lock_guard<std::mutex> lock(mutex_);
  for (const auto& probe : probes_) {
    if (probe->present()) {
      auto procs = probe->processes();
      if (!procs.empty()) {
        return procs;
      }
    }
  }
  return {};
}

bool VramMonitor::hasBackend() const noexcept {
  std::lock_guard<std::mutex> lock(mutex_);
  for (const auto& probe : probes_) {
    if (probe->present()) {
      return true;
    }
  }
  return false;
}

} // namespace gpu

} // namespace arbiter
