/**
 * @file ProcessSwitcher_uTest.cpp
 * @brief Unit tests for arbiter::process::ProcessSwitcher.
 *
 * Notes:
 *  - FakeServiceControl stands in for the process-management API.
 *  - Retry delays and readiness polls are shortened to milliseconds.
 */

#include "src/process/inc/ProcessSwitcher.hpp"
#include "src/process/utst/FakeServiceControl.hpp"

#include <gtest/gtest.h>

#include <memory>

using arbiter::process::ProcessSwitcher;
using arbiter::process::ServiceType;
using arbiter::process::SwitcherConfig;
using arbiter::process::test::FakeControlState;
using arbiter::process::test::FakeServiceControl;

using namespace std::chrono_literals;

namespace {

SwitcherConfig fastConfig() {
  SwitcherConfig cfg{};
  cfg.retry.maxAttempts = 3;
  cfg.retry.baseDelay = 1ms;
  cfg.readinessTimeout = 50ms;
  cfg.readinessPoll = 5ms;
  return cfg;
}

struct Fixture {
  std::shared_ptr<FakeControlState> state = std::make_shared<FakeControlState>();
  ProcessSwitcher switcher{fastConfig(), std::make_unique<FakeServiceControl>(state)};
};

} // namespace

/** @test A null control is rejected. */
TEST(ProcessSwitcherTest, RequiresControl) {
  EXPECT_THROW(ProcessSwitcher(fastConfig(), nullptr), std::invalid_argument);
}

/** @test Switching makes the target active and remembers what ran before. */
TEST(ProcessSwitcherTest, SwitchRecordsState) {
  Fixture f;
  f.state->setCurrent(ServiceType::Primary);

  EXPECT_TRUE(f.switcher.switchTo(ServiceType::Secondary));
  EXPECT_EQ(f.state->currentService(), ServiceType::Secondary);
  EXPECT_EQ(f.switcher.currentService(), ServiceType::Secondary);
  EXPECT_EQ(f.switcher.restoreTarget(), ServiceType::Primary);
  EXPECT_EQ(f.state->switchCount(ServiceType::Secondary), 1U);
}

/** @test Switching to the already active, healthy service does nothing. */
TEST(ProcessSwitcherTest, SwitchIsIdempotent) {
  Fixture f;
  ASSERT_TRUE(f.switcher.switchTo(ServiceType::Primary));
  ASSERT_TRUE(f.switcher.switchTo(ServiceType::Primary));
  EXPECT_EQ(f.state->switchCount(ServiceType::Primary), 1U);
}

/** @test An active service that stopped answering is switched again. */
TEST(ProcessSwitcherTest, UnhealthyActiveIsSwitchedAgain) {
  Fixture f;
  ASSERT_TRUE(f.switcher.switchTo(ServiceType::Primary));
  f.state->setCurrent(std::nullopt);
  EXPECT_TRUE(f.switcher.switchTo(ServiceType::Primary));
  EXPECT_EQ(f.state->switchCount(ServiceType::Primary), 2U);
}

/** @test forceRestart stops the service before switching. */
TEST(ProcessSwitcherTest, ForceRestart) {
  Fixture f;
  ASSERT_TRUE(f.switcher.switchTo(ServiceType::Primary));
  EXPECT_TRUE(f.switcher.switchTo(ServiceType::Primary, true));
  EXPECT_EQ(f.state->stopCount(), 1U);
  EXPECT_EQ(f.state->switchCount(ServiceType::Primary), 2U);
}

/** @test Other has no process to manage. */
TEST(ProcessSwitcherTest, OtherIsNoOp) {
  Fixture f;
  EXPECT_TRUE(f.switcher.switchTo(ServiceType::Other));
  EXPECT_EQ(f.state->totalSwitches(), 0U);
  EXPECT_TRUE(f.switcher.waitForServiceReady(ServiceType::Other, 0ms));
}

/** @test Failed switches are retried, then fall back to the health probe. */
TEST(ProcessSwitcherTest, RetriesThenFallsBackToHealth) {
  Fixture f;
  f.state->switchSucceeds = false;
  f.state->healthFollowsCurrent = false;

  EXPECT_FALSE(f.switcher.switchTo(ServiceType::Secondary));
  EXPECT_EQ(f.state->switchCount(ServiceType::Secondary), 3U);

  f.state->healthy[1] = true;
  EXPECT_TRUE(f.switcher.switchTo(ServiceType::Secondary));
  EXPECT_EQ(f.switcher.currentService(), ServiceType::Secondary);
}

/** @test Without the control plane a switch is only a health probe. */
TEST(ProcessSwitcherTest, ApiDownProbesHealth) {
  Fixture f;
  f.state->apiUp = false;
  f.state->healthFollowsCurrent = false;

  EXPECT_FALSE(f.switcher.switchTo(ServiceType::Primary));
  f.state->healthy[0] = true;
  EXPECT_TRUE(f.switcher.switchTo(ServiceType::Primary));
  EXPECT_EQ(f.state->totalSwitches(), 0U);
  EXPECT_FALSE(f.switcher.stop(ServiceType::Primary));
  EXPECT_FALSE(f.switcher.start(ServiceType::Primary));
}

/** @test restorePrevious returns to the service active before the first switch. */
TEST(ProcessSwitcherTest, RestorePrevious) {
  Fixture f;
  f.state->setCurrent(ServiceType::Primary);

  ASSERT_TRUE(f.switcher.switchTo(ServiceType::Secondary));
  EXPECT_TRUE(f.switcher.restorePrevious());
  EXPECT_EQ(f.state->currentService(), ServiceType::Primary);
  EXPECT_FALSE(f.switcher.restoreTarget().has_value());

  // Nothing left to restore.
  EXPECT_TRUE(f.switcher.restorePrevious());
  EXPECT_EQ(f.state->switchCount(ServiceType::Primary), 1U);
}

/** @test Restoration can be disabled. */
TEST(ProcessSwitcherTest, RestoreDisabled) {
  auto state = std::make_shared<FakeControlState>();
  state->setCurrent(ServiceType::Primary);
  auto cfg = fastConfig();
  cfg.restoreOnRelease = false;
  ProcessSwitcher switcher(cfg, std::make_unique<FakeServiceControl>(state));

  ASSERT_TRUE(switcher.switchTo(ServiceType::Secondary));
  EXPECT_TRUE(switcher.restorePrevious());
  EXPECT_EQ(state->currentService(), ServiceType::Secondary);
}

/** @test stop clears the local belief; start sets it and waits for health. */
TEST(ProcessSwitcherTest, StopAndStart) {
  Fixture f;
  ASSERT_TRUE(f.switcher.switchTo(ServiceType::Primary));
  EXPECT_TRUE(f.switcher.stop(ServiceType::Primary));
  EXPECT_FALSE(f.switcher.currentService().has_value());
  EXPECT_FALSE(f.switcher.checkAvailable(ServiceType::Primary));

  EXPECT_TRUE(f.switcher.start(ServiceType::Primary));
  EXPECT_EQ(f.switcher.currentService(), ServiceType::Primary);
  EXPECT_TRUE(f.switcher.checkAvailable(ServiceType::Primary));
}

/** @test Control-plane view is exposed. */
TEST(ProcessSwitcherTest, QueryCurrentService) {
  Fixture f;
  f.state->setCurrent(ServiceType::Secondary);
  EXPECT_EQ(f.switcher.queryCurrentService(), ServiceType::Secondary);
  f.state->apiUp = false;
  EXPECT_FALSE(f.switcher.queryCurrentService().has_value());
  EXPECT_FALSE(f.switcher.controlPlaneStatus().reachable);
}
