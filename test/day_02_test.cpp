#include "northpole/check.hpp"
#include "northpole/day_02.hpp"

#include <gtest/gtest.h>

#include <cstdint>
#include <limits>
#include <stdexcept>
#include <string_view>
#include <vector>

using namespace northpole;

namespace {

  constexpr std::string_view example_input =
      "11-22,95-115,998-1012,1188511880-1188511890,222220-222224,1698522-1698528,446443-446449,"
      "38593856-38593862,565653-565659,824824821-824824827,2121212118-2121212124\n";

}  // namespace

TEST(MinimalPeriodTest, SmallestRepeatingPrefix) {
  EXPECT_EQ(minimal_period("11"), 1u);
  EXPECT_EQ(minimal_period("123123"), 3u);
  EXPECT_EQ(minimal_period("1212121212"), 2u);
  EXPECT_EQ(minimal_period("111111111"), 1u);
  EXPECT_EQ(minimal_period("123123123"), 3u);  // Odd length, but still a repetition.
  EXPECT_EQ(minimal_period("1231"), 4u);
  EXPECT_EQ(minimal_period("5"), 1u);
  EXPECT_EQ(minimal_period(""), 0u);
}

TEST(IsRepeatedTest, AtLeastTwice) {
  EXPECT_TRUE(is_repeated(11));
  EXPECT_TRUE(is_repeated(123123));
  EXPECT_TRUE(is_repeated(1212121212));
  EXPECT_TRUE(is_repeated(111));
  EXPECT_TRUE(is_repeated(824824824));
  EXPECT_FALSE(is_repeated(1231));
  EXPECT_FALSE(is_repeated(5));
  EXPECT_FALSE(is_repeated(0));
  EXPECT_FALSE(is_repeated(1001));
  EXPECT_FALSE(is_repeated(std::numeric_limits<uint64_t>::max()));
}

TEST(IsRepeatedTest, ExactlyTwice) {
  EXPECT_TRUE(is_repeated(11, repetition_t::exactly_twice));
  EXPECT_TRUE(is_repeated(1111, repetition_t::exactly_twice));
  EXPECT_TRUE(is_repeated(123123, repetition_t::exactly_twice));
  EXPECT_TRUE(is_repeated(12121212, repetition_t::exactly_twice));
  EXPECT_FALSE(is_repeated(111, repetition_t::exactly_twice));
  EXPECT_FALSE(is_repeated(121212, repetition_t::exactly_twice));
  EXPECT_FALSE(is_repeated(1212121212, repetition_t::exactly_twice));
  EXPECT_FALSE(is_repeated(5, repetition_t::exactly_twice));
}

TEST(IsRepeatedTest, NumericMatchesString) {
  auto const check_value = [](uint64_t value) {
    for (auto const rule : {repetition_t::at_least_twice, repetition_t::exactly_twice}) {
      EXPECT_EQ(is_repeated_numeric(value, rule), is_repeated(value, rule))
          << "value: " << value << ", rule: " << static_cast<int>(rule);
    }
  };

  for (uint64_t value = 0; value <= 130'000; ++value) {
    check_value(value);
  }

  std::vector<uint64_t> const large_values{
      1010101010, 1001001001, 9999999999, 1000000000, 12345678901234567890ull,
      11111111111111111111ull, std::numeric_limits<uint64_t>::max()};
  for (uint64_t value : large_values) {
    check_value(value);
  }
}

TEST(SumInvalidTest, InclusiveBounds) {
  EXPECT_EQ(sum_invalid({11, 22}), 33u);
  EXPECT_EQ(sum_invalid({11, 11}), 11u);
  EXPECT_EQ(sum_invalid({12, 21}), 0u);
  EXPECT_EQ(sum_invalid({95, 115}), 99u + 111u);
  EXPECT_EQ(sum_invalid({95, 115}, repetition_t::exactly_twice), 99u);
}

TEST(SumInvalidTest, LargestValueAsUpperBound) {
  constexpr auto max = std::numeric_limits<uint64_t>::max();
  EXPECT_EQ(sum_invalid({max - 3, max}), 0u);
}

TEST(SumInvalidTest, RejectsInvertedRange) {
  EXPECT_THROW(sum_invalid({22, 11}), check_failure);
}

TEST(SumInvalidIdsTest, SplittingRangesKeepsTotal) {
  auto const whole = std::vector<id_range_t>{{1, 5000}};
  auto const pieces = std::vector<id_range_t>{{2001, 5000}, {1, 999}, {1000, 2000}};
  EXPECT_EQ(sum_invalid_ids(whole), sum_invalid_ids(pieces));
  EXPECT_EQ(sum_invalid_ids(whole, repetition_t::exactly_twice),
            sum_invalid_ids(pieces, repetition_t::exactly_twice));
}

TEST(SumInvalidIdsTest, ExceedsThirtyTwoBits) {
  auto const ranges = std::vector<id_range_t>{{1188511880, 1188511890}, {2121212118, 2121212124}};
  EXPECT_EQ(sum_invalid_ids(ranges), 1188511885ull + 2121212121ull);
}

TEST(RangeParseTest, Ranges) {
  EXPECT_EQ(parse_ranges("11-22,95-115\n"), (std::vector<id_range_t>{{11, 22}, {95, 115}}));
  EXPECT_EQ(parse_ranges(" 1-2 , 3-3 "), (std::vector<id_range_t>{{1, 2}, {3, 3}}));
  EXPECT_EQ(parse_ranges("11-22,,95-115,"), (std::vector<id_range_t>{{11, 22}, {95, 115}}));
  EXPECT_TRUE(parse_ranges("\n").empty());
}

TEST(RangeParseTest, MalformedRangesThrow) {
  EXPECT_THROW(parse_range("1122"), check_failure);
  EXPECT_THROW(parse_range("22-11"), check_failure);
  EXPECT_THROW(parse_range("a-11"), std::invalid_argument);
  EXPECT_THROW(parse_range("11-"), std::invalid_argument);
  EXPECT_THROW(parse_range("11-22-33"), std::invalid_argument);
  EXPECT_THROW(parse_ranges("11-22,95"), check_failure);
}

TEST(Day02Test, AllVersionsAgree) {
  day_t<2> day;
  EXPECT_EQ(day.solve(part<1>, version<0>, example_input), 1227775554u);
  EXPECT_EQ(day.solve(part<1>, version<1>, example_input), 1227775554u);
  EXPECT_EQ(day.solve(part<2>, version<0>, example_input), 4174379265u);
  EXPECT_EQ(day.solve(part<2>, version<1>, example_input), 4174379265u);
}
