/**
 * @file Format_uTest.cpp
 * @brief Unit tests for arbiter::helpers::format.
 */

#include "src/helpers/inc/Format.hpp"

#include <gtest/gtest.h>

#include <chrono>

using arbiter::helpers::format::megabytes;
using arbiter::helpers::format::seconds;
using arbiter::helpers::format::shortId;

/** @test Sizes below 1 GiB stay in MiB. */
TEST(FormatTest, Megabytes) {
  EXPECT_EQ(megabytes(512), "512 MiB");
  EXPECT_EQ(megabytes(1024), "1.0 GiB");
  EXPECT_EQ(megabytes(24576), "24.0 GiB");
}

/** @test Durations print with two decimals. */
TEST(FormatTest, Seconds) {
  EXPECT_EQ(seconds(std::chrono::milliseconds{1250}), "1.25s");
  EXPECT_EQ(seconds(std::chrono::seconds{0}), "0.00s");
}

/** @test shortId keeps eight characters and tolerates short input. */
TEST(FormatTest, ShortId) {
  EXPECT_EQ(shortId("0123456789abcdef"), "01234567");
  EXPECT_EQ(shortId("abc"), "abc");
}
