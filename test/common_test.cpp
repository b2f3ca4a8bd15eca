#include "northpole/check.hpp"
#include "northpole/math.hpp"
#include "northpole/string.hpp"

#include <gtest/gtest.h>

#include <cstdint>
#include <limits>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

using namespace northpole;

TEST(MathTest, ModIsNeverNegative) {
  EXPECT_EQ(mod(-18, 100), 82);
  EXPECT_EQ(mod(-100, 100), 0);
  EXPECT_EQ(mod(-1, 100), 99);
  EXPECT_EQ(mod(250, 100), 50);
  EXPECT_EQ(mod(int64_t{-1050}, 100), 50);
}

TEST(MathTest, FloorDivRoundsTowardNegativeInfinity) {
  EXPECT_EQ(floor_div(-18, 100), -1);
  EXPECT_EQ(floor_div(-100, 100), -1);
  EXPECT_EQ(floor_div(-101, 100), -2);
  EXPECT_EQ(floor_div(0, 100), 0);
  EXPECT_EQ(floor_div(99, 100), 0);
  EXPECT_EQ(floor_div(1050, 100), 10);

  // Built-in division truncates, which is exactly what must be avoided.
  EXPECT_NE(floor_div(-18, 100), -18 / 100);
}

TEST(MathTest, NumDigits) {
  EXPECT_EQ(num_digits(0), 1u);
  EXPECT_EQ(num_digits(9), 1u);
  EXPECT_EQ(num_digits(10), 2u);
  EXPECT_EQ(num_digits(1212121212), 10u);
  EXPECT_EQ(num_digits(std::numeric_limits<uint64_t>::max()), 20u);
}

TEST(MathTest, PowerOf10) {
  EXPECT_EQ(power_of_10(0), 1u);
  EXPECT_EQ(power_of_10(3), 1000u);
  EXPECT_EQ(power_of_10(19), 10'000'000'000'000'000'000ull);
  EXPECT_THROW(power_of_10(20), std::out_of_range);
}

TEST(StringTest, Trim) {
  EXPECT_EQ(trim(std::string_view{"  11-22\n"}), "11-22");
  EXPECT_EQ(trim(std::string{"\tL68\r"}), "L68");
  EXPECT_EQ(trim(std::string_view{" \n "}), "");
}

TEST(StringTest, ToIntRejectsPartialNumbers) {
  EXPECT_EQ(to_int<uint64_t>("1188511890"), 1188511890u);
  EXPECT_THROW(to_int<uint64_t>(""), std::invalid_argument);
  EXPECT_THROW(to_int<uint64_t>("12x"), std::invalid_argument);
  EXPECT_THROW(to_int<uint64_t>("-5"), std::invalid_argument);
  EXPECT_THROW(to_int<uint32_t>("99999999999"), std::invalid_argument);
}

TEST(StringTest, SplitSkipsEmptyTokens) {
  std::vector<std::string_view> tokens;
  split("a,,b,c,", ',', [&](std::string_view token) { tokens.push_back(token); });
  EXPECT_EQ(tokens, (std::vector<std::string_view>{"a", "b", "c"}));
}

TEST(StringTest, SplitStopsWhenCallbackReturnsFalse) {
  std::vector<std::string_view> tokens;
  split("a\nb\nc\n", '\n', [&](std::string_view token) {
    tokens.push_back(token);
    return token != "b";
  });
  EXPECT_EQ(tokens, (std::vector<std::string_view>{"a", "b"}));
}

TEST(CheckTest, ThrowsOnFailure) {
  EXPECT_NO_THROW(check(true, "not thrown"));
  EXPECT_THROW(check(false, "value {} is wrong", 42), check_failure);
}
