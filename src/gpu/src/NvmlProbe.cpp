/**
 * @file NvmlProbe.cpp
 * @brief VRAM telemetry via NVML.
 * @note The session is opened once per probe; NVML reference-counts nvmlInit.
 */

#include "src/gpu/inc/VramProbe.hpp"

#include "src/gpu/inc/compat_nvml_detect.hpp"

#include <array>
#include <fstream>
#include <string>

#include <fmt/core.h>
#include <spdlog/spdlog.h>

namespace arbiter {

namespace gpu {

#if COMPAT_NVML_AVAILABLE

namespace {

constexpr std::uint64_t BYTES_PER_MIB = 1024ULL * 1024ULL;

/// Process name from /proc/<pid>/comm; empty if the process is gone or not visible.
std::string processName(std::uint32_t pid) {
  std::ifstream comm(fmt::format("/proc/{}/comm", pid));
  std::string name;
  if (comm) {
    std::getline(comm, name);
  }
  return name;
}

} // namespace

NvmlProbe::NvmlProbe(int deviceIndex) noexcept
    : deviceIndex_(deviceIndex), initialized_(nvmlInit_v2() == NVML_SUCCESS) {
  if (!initialized_) {
    spdlog::debug("NVML init failed, NVML telemetry disabled");
  }
}

NvmlProbe::~NvmlProbe() {
  if (initialized_) {
    nvmlShutdown();
  }
}

UsageSnapshot NvmlProbe::query() noexcept {
  UsageSnapshot snap{};
  if (!initialized_ || deviceIndex_ < 0) {
    return snap;
  }

  nvmlDevice_t device{};
  if (nvmlDeviceGetHandleByIndex_v2(static_cast<unsigned int>(deviceIndex_), &device) !=
      NVML_SUCCESS) {
    return snap;
  }

  nvmlMemory_t mem{};
  const nvmlReturn_t RC = nvmlDeviceGetMemoryInfo(device, &mem);
  if (RC != NVML_SUCCESS || mem.total == 0) {
    spdlog::error("NVML memory query failed for GPU {}: {}", deviceIndex_, nvmlErrorString(RC));
    return snap;
  }

  return UsageSnapshot::fromUsedTotal(mem.used / BYTES_PER_MIB, mem.total / BYTES_PER_MIB,
                                      TelemetrySource::Nvml);
}

std::vector<GpuProcessUsage> NvmlProbe::processes() noexcept {
  std::vector<GpuProcessUsage> out;
  if (!initialized_ || deviceIndex_ < 0) {
    return out;
  }

  nvmlDevice_t device{};
  if (nvmlDeviceGetHandleByIndex_v2(static_cast<unsigned int>(deviceIndex_), &device) !=
      NVML_SUCCESS) {
    return out;
  }

  unsigned int infoCount = 32;
  std::array<nvmlProcessInfo_t, 32> infos{};
  if (nvmlDeviceGetComputeRunningProcesses(device, &infoCount, infos.data()) != NVML_SUCCESS) {
    return out;
  }

  out.reserve(infoCount);
  for (unsigned int i = 0; i < infoCount && i < infos.size(); ++i) {
    GpuProcessUsage proc{};
    proc.pid = infos[i].pid;
    proc.usedMb = infos[i].usedGpuMemory / BYTES_PER_MIB;
    proc.name = processName(proc.pid);
    out.push_back(std::move(proc));
  }
  return out;
}

#else // !COMPAT_NVML_AVAILABLE

NvmlProbe::NvmlProbe(int deviceIndex) noexcept : deviceIndex_(deviceIndex) {}

NvmlProbe::~NvmlProbe() = default;

UsageSnapshot NvmlProbe::query() noexcept { return UsageSnapshot{}; }

std::vector<GpuProcessUsage> NvmlProbe::processes() noexcept { return {}; }

#endif // COMPAT_NVML_AVAILABLE

} // namespace gpu

} // namespace arbiter
