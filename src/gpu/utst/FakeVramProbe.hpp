#ifndef ARBITER_GPU_FAKE_VRAM_PROBE_HPP
#define ARBITER_GPU_FAKE_VRAM_PROBE_HPP
/**
 * @file FakeVramProbe.hpp
 * @brief Scriptable VramProbe for unit tests.
 *
 * State is held behind a shared handle so that a test can keep adjusting
 * readings after the probe has been moved into a VramMonitor.
 */

#include "src/gpu/inc/VramProbe.hpp"

#include <atomic>  // std::atomic
#include <cstdint> // std::uint64_t
#include <memory>  // std::shared_ptr, std::unique_ptr

namespace arbiter {

namespace gpu {

namespace test {

struct FakeVramState {
  std::atomic<bool> present{true};
  std::atomic<bool> answers{true};
  std::atomic<std::uint64_t> usedMb{0};
  std::atomic<std::uint64_t> totalMb{24576};
  std::atomic<int> queries{0};
};

class FakeVramProbe final : public VramProbe {
public:
  explicit FakeVramProbe(std::shared_ptr<FakeVramState> state) : state_(std::move(state)) {}

  [[nodiscard]] std::string_view name() const noexcept override { return "fake"; }
  [[nodiscard]] bool present() const noexcept override { return state_->present.load(); }

  [[nodiscard]] UsageSnapshot query() noexcept override {
    ++state_->queries;
    if (!state_->answers.load()) {
      return UsageSnapshot{};
    }
    return UsageSnapshot::fromUsedTotal(state_->usedMb.load(), state_->totalMb.load(),
                                        TelemetrySource::Fixed);
  }

  [[nodiscard]] std::vector<GpuProcessUsage> processes() noexcept override {
    if (!state_->answers.load()) {
      return {};
    }
    return {GpuProcessUsage{4242, "ollama", state_->usedMb.load()}};
  }

private:
  std::shared_ptr<FakeVramState> state_;
};

/// One-probe list for a VramMonitor.
inline std::vector<std::unique_ptr<VramProbe>> fakeProbes(std::shared_ptr<FakeVramState> state) {
  std::vector<std::unique_ptr<VramProbe>> probes;
  probes.push_back(std::make_unique<FakeVramProbe>(std::move(state)));
  return probes;
}

} // namespace test

} // namespace gpu

} // namespace arbiter

#endif // ARBITER_GPU_FAKE_VRAM_PROBE_HPP
