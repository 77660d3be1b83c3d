/**
 * @file ServiceType_uTest.cpp
 * @brief Unit tests for arbiter::process::ServiceType and RetryPolicy.
 */

#include "src/process/inc/RetryPolicy.hpp"
#include "src/process/inc/ServiceType.hpp"

#include <gtest/gtest.h>

using arbiter::process::parseServiceType;
using arbiter::process::retry;
using arbiter::process::RetryPolicy;
using arbiter::process::ServiceType;
using arbiter::process::toString;

using namespace std::chrono_literals;

/* ----------------------------- ServiceType Tests ----------------------------- */

/** @test Names round-trip and parsing ignores case. */
TEST(ServiceTypeTest, Names) {
  EXPECT_EQ(toString(ServiceType::Primary), "primary");
  EXPECT_EQ(toString(ServiceType::Secondary), "secondary");
  EXPECT_EQ(toString(ServiceType::Other), "other");
  EXPECT_EQ(parseServiceType("SECONDARY"), ServiceType::Secondary);
  EXPECT_FALSE(parseServiceType("gpu").has_value());
}

/* ----------------------------- RetryPolicy Tests ----------------------------- */

/** @test Default schedule doubles from 2 s. */
TEST(RetryPolicyTest, DefaultSchedule) {
  const RetryPolicy POLICY{};
  EXPECT_EQ(POLICY.maxAttempts, 3U);
  EXPECT_EQ(POLICY.delayAfter(1), 2000ms);
  EXPECT_EQ(POLICY.delayAfter(2), 4000ms);
}

/** @test Stops at the first success. */
TEST(RetryPolicyTest, StopsOnSuccess) {
  RetryPolicy policy{};
  policy.baseDelay = 1ms;
  int calls = 0;
  EXPECT_TRUE(retry(policy, "op", [&] { return ++calls == 2; }));
  EXPECT_EQ(calls, 2);
}

/** @test Gives up after maxAttempts. */
TEST(RetryPolicyTest, ExhaustsAttempts) {
  RetryPolicy policy{};
  policy.maxAttempts = 4;
  policy.baseDelay = 0ms;
  int calls = 0;
  EXPECT_FALSE(retry(policy, "op", [&] {
    ++calls;
    return false;
  }));
  EXPECT_EQ(calls, 4);
}

/** @test Zero attempts still tries once. */
TEST(RetryPolicyTest, ZeroAttemptsTriesOnce) {
  RetryPolicy policy{};
  policy.maxAttempts = 0;
  int calls = 0;
  EXPECT_FALSE(retry(policy, "op", [&] {
    ++calls;
    return false;
  }));
  EXPECT_EQ(calls, 1);
}
