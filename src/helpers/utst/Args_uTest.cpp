/**
 * @file Args_uTest.cpp
 * @brief Unit tests for arbiter::helpers::args.
 */

#include "src/helpers/inc/Args.hpp"

#include <gtest/gtest.h>

#include <array>
#include <string>
#include <string_view>

using arbiter::helpers::args::ArgMap;
using arbiter::helpers::args::firstValue;
using arbiter::helpers::args::ParsedArgs;
using arbiter::helpers::args::parseArgs;
using arbiter::helpers::args::uintValue;

namespace {

enum : std::uint8_t { KEY_HELP = 0, KEY_SERVICE = 1, KEY_TIMEOUT = 2 };

ArgMap testMap() {
  ArgMap map;
  map[KEY_HELP] = {"--help", 0, false, "help"};
  map[KEY_SERVICE] = {"--service", 1, true, "service"};
  map[KEY_TIMEOUT] = {"--timeout", 1, false, "timeout"};
  return map;
}

} // namespace

/* ----------------------------- parseArgs Tests ----------------------------- */

/** @test Flags and values are collected by key. */
TEST(ArgsTest, ParsesFlagsWithValues) {
  const std::array<std::string_view, 4> ARGV{"--service", "primary", "--timeout", "30"};
  ParsedArgs pargs;
  ASSERT_TRUE(parseArgs(ARGV, testMap(), pargs));
  EXPECT_EQ(firstValue(pargs, KEY_SERVICE), "primary");
  EXPECT_EQ(uintValue(pargs, KEY_TIMEOUT), 30U);
  EXPECT_EQ(pargs.count(KEY_HELP), 0U);
}

/** @test Unknown tokens are rejected with a message. */
TEST(ArgsTest, RejectsUnknownArgument) {
  const std::array<std::string_view, 3> ARGV{"--service", "primary", "--bogus"};
  ParsedArgs pargs;
  std::string error;
  EXPECT_FALSE(parseArgs(ARGV, testMap(), pargs, error));
  EXPECT_NE(error.find("--bogus"), std::string::npos);
}

/** @test Missing required flag fails. */
TEST(ArgsTest, RequiredFlagMissing) {
  const std::array<std::string_view, 2> ARGV{"--timeout", "5"};
  ParsedArgs pargs;
  std::string error;
  EXPECT_FALSE(parseArgs(ARGV, testMap(), pargs, error));
  EXPECT_NE(error.find("--service"), std::string::npos);
}

/** @test A flag at the end without its value fails. */
TEST(ArgsTest, MissingValue) {
  const std::array<std::string_view, 1> ARGV{"--service"};
  ParsedArgs pargs;
  EXPECT_FALSE(parseArgs(ARGV, testMap(), pargs));
}

/** @test uintValue rejects negative and non-numeric input. */
TEST(ArgsTest, UintValueRejectsGarbage) {
  ParsedArgs pargs;
  pargs[KEY_TIMEOUT] = {"-3"};
  EXPECT_FALSE(uintValue(pargs, KEY_TIMEOUT).has_value());
  pargs[KEY_TIMEOUT] = {"12s"};
  EXPECT_FALSE(uintValue(pargs, KEY_TIMEOUT).has_value());
  EXPECT_FALSE(uintValue(pargs, KEY_SERVICE).has_value());
}
