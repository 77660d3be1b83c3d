/**
 * @file VramUsage.cpp
 * @brief Snapshot formatting.
 */

#include "src/gpu/inc/VramUsage.hpp"

#include "src/helpers/inc/Format.hpp"

#include <cmath>

#include <fmt/core.h>

namespace arbiter {

namespace gpu {

std::string_view toString(TelemetrySource source) noexcept {
  switch (source) {
  case TelemetrySource::Disabled:
    return "disabled";
  case TelemetrySource::Nvml:
    return "nvml";
  case TelemetrySource::NvidiaSmi:
    return "nvidia-smi";
  case TelemetrySource::Fixed:
    return "fixed";
  case TelemetrySource::Unavailable:
    break;
  }
  return "unavailable";
}

/* ----------------------------- UsageSnapshot ----------------------------- */

UsageSnapshot UsageSnapshot::fromUsedTotal(std::uint64_t usedMb, std::uint64_t totalMb,
                                           TelemetrySource source) noexcept {
  UsageSnapshot snap{};
  snap.usedMb = usedMb;
  snap.totalMb = totalMb;
  snap.freeMb = (totalMb > usedMb) ? totalMb - usedMb : 0;
  if (totalMb > 0) {
    const double PCT = 100.0 * static_cast<double>(usedMb) / static_cast<double>(totalMb);
    snap.usagePercent = std::round(PCT * 100.0) / 100.0;
  }
  snap.available = true;
  snap.source = source;
  return snap;
}

std::string UsageSnapshot::toString() const {
  if (!available) {
    return fmt::format("VRAM telemetry unavailable ({})", gpu::toString(source));
  }
  return fmt::format("VRAM {}/{} used ({:.1f}%), {} free [{}]", helpers::format::megabytes(usedMb),
                     helpers::format::megabytes(totalMb), usagePercent,
                     helpers::format::megabytes(freeMb), gpu::toString(source));
}

std::string UsageSnapshot::toJson() const {
  return fmt::format("{{\"used_mb\": {}, \"total_mb\": {}, \"free_mb\": {}, "
                     "\"usage_percent\": {:.2f}, \"available\": {}, \"method\": \"{}\"}}",
                     usedMb, totalMb, freeMb, usagePercent, available, gpu::toString(source));
}

/* ----------------------------- GpuProcessUsage ----------------------------- */

std::string GpuProcessUsage::toString() const {
  return fmt::format("PID {}: {} ({})", pid, name.empty() ? "?" : name,
                     helpers::format::megabytes(usedMb));
}

} // namespace gpu

} // namespace arbiter
