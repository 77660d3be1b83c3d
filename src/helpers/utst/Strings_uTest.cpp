/**
 * @file Strings_uTest.cpp
 * @brief Unit tests for arbiter::helpers::strings.
 */

#include "src/helpers/inc/Strings.hpp"

#include <gtest/gtest.h>

using arbiter::helpers::strings::iequals;
using arbiter::helpers::strings::parseBool;
using arbiter::helpers::strings::parseDouble;
using arbiter::helpers::strings::parseInt;
using arbiter::helpers::strings::parseUint;
using arbiter::helpers::strings::trim;
using arbiter::helpers::strings::unquote;

/** @test trim strips whitespace on both ends only. */
TEST(StringsTest, Trim) {
  EXPECT_EQ(trim("  a b \r\n"), "a b");
  EXPECT_EQ(trim("\t"), "");
  EXPECT_EQ(trim(""), "");
}

/** @test unquote removes one matching pair. */
TEST(StringsTest, Unquote) {
  EXPECT_EQ(unquote("\"x\""), "x");
  EXPECT_EQ(unquote("'x'"), "x");
  EXPECT_EQ(unquote("\"x'"), "\"x'");
  EXPECT_EQ(unquote("\""), "\"");
}

/** @test iequals ignores ASCII case. */
TEST(StringsTest, Iequals) {
  EXPECT_TRUE(iequals("Primary", "PRIMARY"));
  EXPECT_FALSE(iequals("primary", "primar"));
}

/** @test Integer parsers reject trailing garbage and overflow. */
TEST(StringsTest, IntegerParsing) {
  EXPECT_EQ(parseUint(" 2048 "), 2048U);
  EXPECT_FALSE(parseUint("12x").has_value());
  EXPECT_FALSE(parseUint("-1").has_value());
  EXPECT_FALSE(parseUint("99999999999999999999").has_value());
  EXPECT_EQ(parseInt("-7"), -7);
  EXPECT_EQ(parseInt("+7"), 7);
  EXPECT_FALSE(parseInt("-").has_value());
}

/** @test parseDouble accepts decimals, rejects junk. */
TEST(StringsTest, DoubleParsing) {
  EXPECT_DOUBLE_EQ(*parseDouble("92.5"), 92.5);
  EXPECT_FALSE(parseDouble("9o").has_value());
  EXPECT_FALSE(parseDouble("").has_value());
}

/** @test parseBool understands common spellings. */
TEST(StringsTest, BoolParsing) {
  EXPECT_EQ(parseBool("TRUE"), true);
  EXPECT_EQ(parseBool("on"), true);
  EXPECT_EQ(parseBool("0"), false);
  EXPECT_EQ(parseBool("No"), false);
  EXPECT_FALSE(parseBool("maybe").has_value());
}
