#pragma once

#include "northpole/day.hpp"

#include <cstddef>
#include <cstdint>
#include <span>
#include <string_view>
#include <vector>

/*
  The input is a comma separated list of inclusive ID ranges (e.g. "11-22,95-115"). An ID is
  invalid if its digits are some shorter digit sequence repeated: exactly twice for part 1, at
  least twice for part 2. Each part sums all invalid IDs in all ranges.
 */

namespace northpole {

  enum class repetition_t : uint8_t {
    at_least_twice,  // 11, 111, 123123, 121212
    exactly_twice,   // 11, 1111, 123123 (but not 111 or 121212)
  };

  // NOTE: Both bounds are inclusive.
  struct id_range_t {
    uint64_t lower;
    uint64_t upper;

    friend bool operator==(id_range_t const &, id_range_t const &) = default;
  };

  /** @brief Returns the smallest d (with d dividing digits.size() and d <= digits.size() / 2) such
   * that digits consists of its first d characters repeated. Returns digits.size() if there's no
   * such d.
   */
  size_t minimal_period(std::string_view digits);

  /// @brief Checks whether the decimal representation of value is a repeated digit sequence.
  bool is_repeated(uint64_t value, repetition_t rule = repetition_t::at_least_twice);

  /// @brief Same result as is_repeated, but compares blocks of digits arithmetically.
  bool is_repeated_numeric(uint64_t value, repetition_t rule = repetition_t::at_least_twice);

  /// @brief Sum of all values in range for which is_repeated(value, rule) holds.
  uint64_t sum_invalid(id_range_t const & range, repetition_t rule = repetition_t::at_least_twice);

  uint64_t sum_invalid_ids(std::span<id_range_t const> ranges,
                           repetition_t rule = repetition_t::at_least_twice);

  /// @throws check_failure If the dash is missing or lower > upper.
  /// @throws std::invalid_argument If a bound isn't a number.
  id_range_t parse_range(std::string_view token);

  /// @brief Parses comma separated "lower-upper" tokens.
  std::vector<id_range_t> parse_ranges(std::string_view input);

  template <>
  struct day_t<2> {
    uint64_t solve(part_t<1>, version_t<0>, std::string_view input);
    uint64_t solve(part_t<1>, version_t<1>, std::string_view input);

    uint64_t solve(part_t<2>, version_t<0>, std::string_view input);
    uint64_t solve(part_t<2>, version_t<1>, std::string_view input);
  };

}  // namespace northpole
