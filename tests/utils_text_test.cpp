#include <gtest/gtest.h>

#include "oaicompat/utils/text.hpp"
#include "oaicompat/utils/values.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <limits>

namespace utils = oaicompat::utils;

TEST(UtilsTextTest, TrimsBothEndsOrTrailingOnly) {
  EXPECT_EQ(utils::trim("  data: x \r\n"), "data: x");
  EXPECT_EQ(utils::trim_trailing("  data: x \r\n"), "  data: x");
  EXPECT_EQ(utils::trim("   "), "");
}

TEST(UtilsTextTest, ValidatesUtf8) {
  EXPECT_TRUE(utils::is_valid_utf8("plain ascii"));
  EXPECT_TRUE(utils::is_valid_utf8("caf\xC3\xA9 \xE6\x97\xA5\xE6\x9C\xAC \xF0\x9F\x98\x80"));
  EXPECT_FALSE(utils::is_valid_utf8("\xC3"));
  EXPECT_FALSE(utils::is_valid_utf8("\xC0\xAF"));
  EXPECT_FALSE(utils::is_valid_utf8("\xED\xA0\x80"));
  EXPECT_FALSE(utils::is_valid_utf8("\xF4\x90\x80\x80"));
  EXPECT_FALSE(utils::is_valid_utf8("\xFF"));
}

TEST(UtilsTextTest, PreviewDoesNotSplitCodePoints) {
  EXPECT_EQ(utils::preview("short", 100), "short");
  EXPECT_EQ(utils::preview("ab\xC3\xA9", 3), "ab");
  EXPECT_EQ(utils::preview("abcdef", 4), "abcd");
}

TEST(UtilsValuesTest, ErrorMessagePrefersMessageMember) {
  EXPECT_EQ(utils::error_message(nlohmann::json{{"message", "bad key"}, {"code", 401}}), "bad key");
  EXPECT_EQ(utils::error_message(nlohmann::json("boom")), "boom");
  EXPECT_EQ(utils::error_message(nlohmann::json{{"code", 401}}), R"({"code":401})");
}

TEST(UtilsValuesTest, SafeJsonReturnsNulloptOnGarbage) {
  EXPECT_FALSE(utils::safe_json("{nope").has_value());
  ASSERT_TRUE(utils::safe_json("{\"a\":1}").has_value());
}

TEST(UtilsValuesTest, NonNegativeIntegerClampsAndDefaults) {
  nlohmann::json usage = {{"prompt_tokens", 12}, {"completion_tokens", -3}, {"total_tokens", "9"}};
  EXPECT_EQ(utils::non_negative_integer(usage, "prompt_tokens"), 12);
  EXPECT_EQ(utils::non_negative_integer(usage, "completion_tokens"), 0);
  EXPECT_EQ(utils::non_negative_integer(usage, "total_tokens"), 0);
  EXPECT_EQ(utils::non_negative_integer(usage, "missing"), 0);
}

TEST(UtilsValuesTest, NonNegativeIntegerSaturatesOutOfRangeNumbers) {
  constexpr auto kMax = std::numeric_limits<std::int64_t>::max();
  auto usage = nlohmann::json::parse(
      R"({"float_huge": 1e30, "unsigned_huge": 18446744073709551615, "fraction": 7.8, "float_negative": -2.5})");

  EXPECT_EQ(utils::non_negative_integer(usage, "float_huge"), kMax);
  EXPECT_EQ(utils::non_negative_integer(usage, "unsigned_huge"), kMax);
  EXPECT_EQ(utils::non_negative_integer(usage, "fraction"), 7);
  EXPECT_EQ(utils::non_negative_integer(usage, "float_negative"), 0);
}

TEST(UtilsValuesTest, SaturatingAddStopsAtMaximum) {
  constexpr auto kMax = std::numeric_limits<std::int64_t>::max();
  EXPECT_EQ(utils::saturating_add(5, 7), 12);
  EXPECT_EQ(utils::saturating_add(kMax, kMax), kMax);
  EXPECT_EQ(utils::saturating_add(kMax - 1, 2), kMax);
  EXPECT_EQ(utils::saturating_add(9, -4), 9);
}
