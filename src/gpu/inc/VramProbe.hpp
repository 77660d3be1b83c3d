#ifndef ARBITER_GPU_VRAM_PROBE_HPP
#define ARBITER_GPU_VRAM_PROBE_HPP
/**
 * @file VramProbe.hpp
 * @brief Hardware telemetry backends for VRAM usage.
 * @note Linux-only. NVML when compiled in, nvidia-smi otherwise or as fallback.
 *
 * A probe answers for one GPU index. It never throws: an unreachable backend
 * yields a snapshot with available == false.
 */

#include "src/gpu/inc/VramUsage.hpp"

#include <chrono>      // std::chrono::seconds
#include <memory>      // std::unique_ptr
#include <string>      // std::string
#include <string_view> // std::string_view
#include <vector>      // std::vector

namespace arbiter {

namespace gpu {

/* ----------------------------- VramProbe ----------------------------- */

/**
 * @brief Abstract telemetry backend.
 */
class VramProbe {
public:
  virtual ~VramProbe() = default;

  /// @brief Backend name for logs.
  [[nodiscard]] virtual std::string_view name() const noexcept = 0;

  /// @brief True if the backend could be initialized at all.
  [[nodiscard]] virtual bool present() const noexcept = 0;

  /// @brief Current memory usage; available == false on failure.
  [[nodiscard]] virtual UsageSnapshot query() noexcept = 0;

  /// @brief Compute processes using the GPU; empty on failure.
  [[nodiscard]] virtual std::vector<GpuProcessUsage> processes() noexcept { return {}; }
};

/* ----------------------------- NvmlProbe ----------------------------- */

/**
 * @brief NVML backend holding one session for its lifetime.
 * @note Reports present() == false when NVML is compiled out or nvmlInit fails.
 */
class NvmlProbe final : public VramProbe {
public:
  explicit NvmlProbe(int deviceIndex) noexcept;
  ~NvmlProbe() override;

  NvmlProbe(const NvmlProbe&) = delete;
  NvmlProbe& operator=(const NvmlProbe&) = delete;

  [[nodiscard]] std::string_view name() const noexcept override { return "nvml"; }
  [[nodiscard]] bool present() const noexcept override { return initialized_; }
  [[nodiscard]] UsageSnapshot query() noexcept override;
  [[nodiscard]] std::vector<GpuProcessUsage> processes() noexcept override;

private:
  int deviceIndex_;
  bool initialized_{false};
};

/* ----------------------------- NvidiaSmiProbe ----------------------------- */

/**
 * @brief nvidia-smi CLI backend.
 *
 * Runs `nvidia-smi --query-gpu=memory.used,memory.total` under coreutils
 * `timeout`. Presence is checked once at construction with `--version`.
 */
class NvidiaSmiProbe final : public VramProbe {
public:
  NvidiaSmiProbe(int deviceIndex, std::string executable = "nvidia-smi",
                 std::chrono::seconds timeout = std::chrono::seconds{2});

  [[nodiscard]] std::string_view name() const noexcept override { return "nvidia-smi"; }
  [[nodiscard]] bool present() const noexcept override { return present_; }
  [[nodiscard]] UsageSnapshot query() noexcept override;
  [[nodiscard]] std::vector<GpuProcessUsage> processes() noexcept override;

private:
  [[nodiscard]] std::string command(std::string_view args) const;

  int deviceIndex_;
  std::string executable_;
  std::chrono::seconds timeout_;
  bool present_{false};
};

/* ----------------------------- Parsing ----------------------------- */

/**
 * @brief Parse `memory.used,memory.total` CSV (noheader, nounits).
 * @param csv   Command output, one line per GPU.
 * @param line  Zero-based GPU line to read.
 * @return Snapshot; available == false if the line is missing or malformed.
 */
[[nodiscard]] UsageSnapshot parseSmiMemoryCsv(std::string_view csv, int line = 0) noexcept;

/**
 * @brief Parse `pid,process_name,used_memory` CSV (noheader, nounits).
 * @note Malformed lines are skipped.
 */
[[nodiscard]] std::vector<GpuProcessUsage> parseSmiProcessCsv(std::string_view csv);

/* ----------------------------- Factory ----------------------------- */

/**
 * @brief Backends in preference order: NVML, then nvidia-smi.
 */
[[nodiscard]] std::vector<std::unique_ptr<VramProbe>> makeDefaultProbes(int deviceIndex);

} // namespace gpu

} // namespace arbiter

#endif // ARBITER_GPU_VRAM_PROBE_HPP
