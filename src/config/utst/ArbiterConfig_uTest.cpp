/**
 * @file ArbiterConfig_uTest.cpp
 * @brief Unit tests for arbiter::config loading.
 *
 * Notes:
 *  - Environment tests set and clear ARBITER_* variables themselves.
 */

#include "src/config/inc/ArbiterConfig.hpp"

#include <gtest/gtest.h>

#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <string>

using arbiter::config::applyText;
using arbiter::config::applyValue;
using arbiter::config::ArbiterConfig;
using arbiter::config::knownKeys;
using arbiter::config::load;
using arbiter::config::loadFromEnv;
using arbiter::config::loadFromFile;
using arbiter::process::ServiceType;

using namespace std::chrono_literals;

namespace {

/// Sets an environment variable for the lifetime of the object.
class ScopedEnv {
public:
  ScopedEnv(const char* name, const char* value) : name_(name) { ::setenv(name, value, 1); }
  ~ScopedEnv() { ::unsetenv(name_); }

  ScopedEnv(const ScopedEnv&) = delete;
  ScopedEnv& operator=(const ScopedEnv&) = delete;

private:
  const char* name_;
};

} // namespace

/* ----------------------------- Defaults ----------------------------- */

/** @test Defaults match the documented behaviour. */
TEST(ArbiterConfigTest, Defaults) {
  const ArbiterConfig CFG{};
  EXPECT_TRUE(CFG.vram.enabled);
  EXPECT_DOUBLE_EQ(CFG.vram.usageCeilingPercent, 90.0);
  EXPECT_EQ(CFG.vram.minFreeMb, 2048U);
  EXPECT_EQ(CFG.manager.priorityFor(ServiceType::Primary), 5);
  EXPECT_EQ(CFG.manager.priorityFor(ServiceType::Secondary), 10);
  EXPECT_EQ(CFG.manager.priorityFor(ServiceType::Other), 1);
  EXPECT_EQ(CFG.manager.defaultTimeout, 300s);
  EXPECT_EQ(CFG.manager.settleDelay, 2s);
  EXPECT_TRUE(CFG.manager.alwaysRestorePrimaryAfterSecondary);
  EXPECT_EQ(CFG.switcher.retry.maxAttempts, 3U);
  EXPECT_EQ(CFG.controlPlane.serviceName(ServiceType::Primary), "ollama");
  EXPECT_EQ(CFG.controlPlane.serviceName(ServiceType::Secondary), "comfyui");
  EXPECT_TRUE(CFG.controlPlane.controlPlaneUrl.empty());
}

/* ----------------------------- applyValue ----------------------------- */

/** @test Typed values land in the right fields. */
TEST(ArbiterConfigTest, ApplyValue) {
  ArbiterConfig cfg{};
  EXPECT_TRUE(applyValue(cfg, "VRAM_USAGE_CEILING_PERCENT", "85.5"));
  EXPECT_TRUE(applyValue(cfg, "PRIORITY_OTHER", "-2"));
  EXPECT_TRUE(applyValue(cfg, "GPU_WAIT_TIMEOUT_MS", "1500"));
  EXPECT_TRUE(applyValue(cfg, "PROCESS_RESTORE_ON_RELEASE", "off"));
  EXPECT_TRUE(applyValue(cfg, "SECONDARY_SERVICE_NAME", "sdxl"));
  EXPECT_DOUBLE_EQ(cfg.vram.usageCeilingPercent, 85.5);
  EXPECT_EQ(cfg.manager.priorityFor(ServiceType::Other), -2);
  EXPECT_EQ(cfg.manager.defaultTimeout, 1500ms);
  EXPECT_FALSE(cfg.switcher.restoreOnRelease);
  EXPECT_EQ(cfg.controlPlane.serviceName(ServiceType::Secondary), "sdxl");
}

/** @test Out-of-range and malformed values are rejected with a message. */
TEST(ArbiterConfigTest, ApplyValueRejects) {
  ArbiterConfig cfg{};
  std::string error;
  EXPECT_FALSE(applyValue(cfg, "VRAM_USAGE_CEILING_PERCENT", "120", error));
  EXPECT_NE(error.find("VRAM_USAGE_CEILING_PERCENT"), std::string::npos);
  EXPECT_FALSE(applyValue(cfg, "RETRY_MAX_ATTEMPTS", "0"));
  EXPECT_FALSE(applyValue(cfg, "QUEUE_RECHECK_MS", "0"));
  EXPECT_FALSE(applyValue(cfg, "VRAM_MIN_FREE_MB", "lots"));
  EXPECT_FALSE(applyValue(cfg, "PROCESS_MANAGER_API_URL", "https://x"));
  EXPECT_FALSE(applyValue(cfg, "PRIMARY_SERVICE_NAME", ""));
  EXPECT_FALSE(applyValue(cfg, "LOG_LEVEL", "chatty"));
  EXPECT_FALSE(applyValue(cfg, "NOT_A_KEY", "1", error));
  EXPECT_NE(error.find("unknown"), std::string::npos);
}

/** @test Integers that do not fit their field are rejected and leave it unchanged. */
TEST(ArbiterConfigTest, ApplyValueRejectsOutOfRange) {
  ArbiterConfig cfg{};
  std::string error;
  EXPECT_FALSE(applyValue(cfg, "GPU_DEVICE_INDEX", "4294967296", error));
  EXPECT_NE(error.find("GPU_DEVICE_INDEX"), std::string::npos);
  EXPECT_FALSE(applyValue(cfg, "GPU_DEVICE_INDEX", "2147483648"));
  EXPECT_EQ(cfg.vram.deviceIndex, 0);

  EXPECT_FALSE(applyValue(cfg, "RETRY_MAX_ATTEMPTS", "4294967297"));
  EXPECT_EQ(cfg.switcher.retry.maxAttempts, 3U);

  EXPECT_FALSE(applyValue(cfg, "PRIORITY_PRIMARY", "2147483648"));
  EXPECT_FALSE(applyValue(cfg, "PRIORITY_PRIMARY", "-2147483649"));
  EXPECT_EQ(cfg.manager.priorityFor(ServiceType::Primary), 5);

  EXPECT_TRUE(applyValue(cfg, "GPU_DEVICE_INDEX", "2147483647"));
  EXPECT_EQ(cfg.vram.deviceIndex, 2147483647);
  EXPECT_TRUE(applyValue(cfg, "RETRY_MAX_ATTEMPTS", "4294967295"));
  EXPECT_EQ(cfg.switcher.retry.maxAttempts, 4294967295U);
}

/** @test Every documented key is recognised. */
TEST(ArbiterConfigTest, KnownKeys) {
  const auto KEYS = knownKeys();
  EXPECT_EQ(KEYS.size(), 27U);
  for (const auto KEY : KEYS) {
    ArbiterConfig cfg{};
    std::string error;
    (void)applyValue(cfg, KEY, "", error);
    EXPECT_EQ(error.find("unknown"), std::string::npos) << KEY;
  }
}

/* ----------------------------- applyText ----------------------------- */

/** @test Dotenv syntax: comments, export, prefix and quotes. */
TEST(ArbiterConfigTest, ApplyText) {
  ArbiterConfig cfg{};
  std::string error;
  ASSERT_TRUE(applyText(cfg,
                        "# arbiter\n"
                        "\n"
                        "export ARBITER_PROCESS_MANAGER_API_URL=\"http://127.0.0.1:8000\"\n"
                        "SWITCH_SETTLE_MS = 500\r\n"
                        "ALWAYS_RESTORE_PRIMARY_AFTER_SECONDARY='false'\n",
                        error))
      << error;
  EXPECT_EQ(cfg.controlPlane.controlPlaneUrl, "http://127.0.0.1:8000");
  EXPECT_EQ(cfg.manager.settleDelay, 500ms);
  EXPECT_FALSE(cfg.manager.alwaysRestorePrimaryAfterSecondary);
}

/** @test Errors name the offending line. */
TEST(ArbiterConfigTest, ApplyTextReportsLine) {
  ArbiterConfig cfg{};
  std::string error;
  EXPECT_FALSE(applyText(cfg, "GPU_DEVICE_INDEX=0\nno equals sign\n", error));
  EXPECT_NE(error.find("line 2"), std::string::npos);
  EXPECT_FALSE(applyText(cfg, "GPU_DEVICE_INDEX=0\nGPU_DEVICE_INDEX=x\n", error));
  EXPECT_NE(error.find("line 2"), std::string::npos);
}

/* ----------------------------- Files and Environment ----------------------------- */

/** @test Files load, and a missing file is an error. */
TEST(ArbiterConfigTest, LoadFromFile) {
  const std::string PATH = ::testing::TempDir() + "arbiter_config_test.env";
  {
    std::ofstream out(PATH);
    out << "VRAM_MIN_FREE_MB=4096\nPRIORITY_PRIMARY=7\n";
  }
  ArbiterConfig cfg{};
  ASSERT_TRUE(loadFromFile(cfg, PATH));
  EXPECT_EQ(cfg.vram.minFreeMb, 4096U);
  EXPECT_EQ(cfg.manager.priorityFor(ServiceType::Primary), 7);
  std::remove(PATH.c_str());

  std::string error;
  EXPECT_FALSE(loadFromFile(cfg, PATH, error));
  EXPECT_NE(error.find("cannot open"), std::string::npos);
}

/** @test Environment variables override the file. */
TEST(ArbiterConfigTest, EnvOverridesFile) {
  const std::string PATH = ::testing::TempDir() + "arbiter_config_env_test.env";
  {
    std::ofstream out(PATH);
    out << "RETRY_BASE_DELAY_MS=100\nRETRY_MULTIPLIER=3\n";
  }
  ScopedEnv env("ARBITER_RETRY_BASE_DELAY_MS", "250");

  ArbiterConfig cfg{};
  ASSERT_TRUE(load(cfg, PATH));
  EXPECT_EQ(cfg.switcher.retry.baseDelay, 250ms);
  EXPECT_DOUBLE_EQ(cfg.switcher.retry.multiplier, 3.0);
  std::remove(PATH.c_str());
}

/** @test Invalid environment values are reported. */
TEST(ArbiterConfigTest, EnvInvalid) {
  ScopedEnv env("ARBITER_VRAM_MONITORING_ENABLED", "perhaps");
  ArbiterConfig cfg{};
  std::string error;
  EXPECT_FALSE(loadFromEnv(cfg, error));
  EXPECT_NE(error.find("ARBITER_VRAM_MONITORING_ENABLED"), std::string::npos);
}

/** @test The dump mentions every section. */
TEST(ArbiterConfigTest, ToString) {
  const std::string TEXT = ArbiterConfig{}.toString();
  for (const char* section : {"VRAM:", "Control:", "Services:", "Switcher:", "Arbiter:"}) {
    EXPECT_NE(TEXT.find(section), std::string::npos) << section;
  }
}
