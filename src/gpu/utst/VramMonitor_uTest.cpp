/**
 * @file VramMonitor_uTest.cpp
 * @brief Unit tests for arbiter::gpu::VramMonitor.
 *
 * Notes:
 *  - Readings come from FakeVramProbe; no GPU is needed.
 *  - Fail-open: unavailable telemetry must never block.
 */

#include "src/gpu/inc/VramMonitor.hpp"
#include "src/gpu/utst/FakeVramProbe.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <memory>
#include <thread>

using arbiter::gpu::TelemetrySource;
using arbiter::gpu::VramMonitor;
using arbiter::gpu::VramMonitorConfig;
using arbiter::gpu::test::FakeVramState;
using arbiter::gpu::test::fakeProbes;

namespace {

VramMonitorConfig fastConfig() {
  VramMonitorConfig cfg{};
  cfg.usageCeilingPercent = 90.0;
  cfg.minFreeMb = 2048;
  cfg.pollInterval = std::chrono::milliseconds{10};
  return cfg;
}

} // namespace

/** @test Readings pass through from the probe. */
TEST(VramMonitorTest, ReportsProbeReadings) {
  auto state = std::make_shared<FakeVramState>();
  state->usedMb = 6144;
  VramMonitor monitor(fastConfig(), fakeProbes(state));
  const auto SNAP = monitor.getUsage();
  EXPECT_TRUE(SNAP.available);
  EXPECT_EQ(SNAP.usedMb, 6144U);
  EXPECT_EQ(SNAP.source, TelemetrySource::Fixed);
  EXPECT_TRUE(monitor.hasBackend());
}

/** @test Free memory above the request is available. */
TEST(VramMonitorTest, AvailableWithHeadroom) {
  auto state = std::make_shared<FakeVramState>();
  state->usedMb = 4096;
  VramMonitor monitor(fastConfig(), fakeProbes(state));
  EXPECT_TRUE(monitor.isAvailable());
  EXPECT_TRUE(monitor.isAvailable(16384));
  EXPECT_FALSE(monitor.isAvailable(20480 + 1));
}

/** @test Usage at the ceiling blocks regardless of free memory. */
TEST(VramMonitorTest, CeilingBlocks) {
  auto state = std::make_shared<FakeVramState>();
  state->totalMb = 100000;
  state->usedMb = 90000;
  VramMonitor monitor(fastConfig(), fakeProbes(state));
  EXPECT_FALSE(monitor.isAvailable(1));
}

/** @test Without a request the configured minimum applies. */
TEST(VramMonitorTest, DefaultMinimumFree) {
  auto state = std::make_shared<FakeVramState>();
  state->totalMb = 24576;
  state->usedMb = 24576 - 1024;
  auto cfg = fastConfig();
  cfg.usageCeilingPercent = 100.0;
  VramMonitor monitor(cfg, fakeProbes(state));
  EXPECT_FALSE(monitor.isAvailable());
  EXPECT_TRUE(monitor.isAvailable(512));
}

/** @test Unavailable telemetry is fail-open. */
TEST(VramMonitorTest, FailOpenWhenProbeSilent) {
  auto state = std::make_shared<FakeVramState>();
  state->answers = false;
  VramMonitor monitor(fastConfig(), fakeProbes(state));
  EXPECT_FALSE(monitor.getUsage().available);
  EXPECT_TRUE(monitor.isAvailable(1U << 20));
}

/** @test No backend at all is fail-open too. */
TEST(VramMonitorTest, FailOpenWithoutBackend) {
  VramMonitor monitor(fastConfig(), {});
  EXPECT_FALSE(monitor.hasBackend());
  EXPECT_FALSE(monitor.getUsage().available);
  EXPECT_TRUE(monitor.isAvailable(8192));
  EXPECT_TRUE(monitor.gpuProcesses().empty());
}

/** @test Disabled monitoring never queries and always passes. */
TEST(VramMonitorTest, DisabledNeverQueries) {
  auto state = std::make_shared<FakeVramState>();
  state->usedMb = state->totalMb.load();
  auto cfg = fastConfig();
  cfg.enabled = false;
  VramMonitor monitor(cfg, fakeProbes(state));
  const auto SNAP = monitor.getUsage();
  EXPECT_TRUE(SNAP.available);
  EXPECT_EQ(SNAP.source, TelemetrySource::Disabled);
  EXPECT_TRUE(monitor.isAvailable(1U << 20));
  EXPECT_EQ(state->queries.load(), 0);
}

/** @test A probe that is not present is skipped. */
TEST(VramMonitorTest, SkipsAbsentProbe) {
  auto absent = std::make_shared<FakeVramState>();
  absent->present = false;
  auto live = std::make_shared<FakeVramState>();
  live->usedMb = 1000;

  std::vector<std::unique_ptr<arbiter::gpu::VramProbe>> probes = fakeProbes(absent);
  probes.push_back(std::make_unique<arbiter::gpu::test::FakeVramProbe>(live));
  VramMonitor monitor(fastConfig(), std::move(probes));

  EXPECT_EQ(monitor.getUsage().usedMb, 1000U);
  EXPECT_EQ(absent->queries.load(), 0);
}

/** @test waitForAvailable returns once memory frees. */
TEST(VramMonitorTest, WaitForAvailableSucceeds) {
  auto state = std::make_shared<FakeVramState>();
  state->usedMb = state->totalMb.load();
  VramMonitor monitor(fastConfig(), fakeProbes(state));

  std::thread freer([state] {
    std::this_thread::sleep_for(std::chrono::milliseconds{50});
    state->usedMb = 0;
  });
  EXPECT_TRUE(monitor.waitForAvailable(std::chrono::seconds{5}));
  freer.join();
}

/** @test waitForAvailable gives up at the timeout. */
TEST(VramMonitorTest, WaitForAvailableTimesOut) {
  auto state = std::make_shared<FakeVramState>();
  state->usedMb = state->totalMb.load();
  VramMonitor monitor(fastConfig(), fakeProbes(state));

  const auto START = std::chrono::steady_clock::now();
  EXPECT_FALSE(monitor.waitForAvailable(std::chrono::milliseconds{100}));
  EXPECT_GE(std::chrono::steady_clock::now() - START, std::chrono::milliseconds{100});
}

/** @test Process list comes from the first present probe. */
TEST(VramMonitorTest, GpuProcesses) {
  auto state = std::make_shared<FakeVramState>();
  state->usedMb = 5000;
  VramMonitor monitor(fastConfig(), fakeProbes(state));
  const auto PROCS = monitor.gpuProcesses();
  ASSERT_EQ(PROCS.size(), 1U);
  EXPECT_EQ(PROCS[0].name, "ollama");
}
