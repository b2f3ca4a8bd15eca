#include "northpole/day_02.hpp"

#include "northpole/check.hpp"
#include "northpole/math.hpp"
#include "northpole/string.hpp"

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <cstdint>
#include <string_view>

namespace northpole {

  namespace {

    /// Whether a string of the given length with the given minimal period satisfies rule.
    bool matches_rule(size_t length, size_t period, repetition_t rule) {
      if (period == length) {  // Not a repetition at all (this includes single digits).
        return false;
      }

      switch (rule) {
        case repetition_t::at_least_twice:
          return true;
        case repetition_t::exactly_twice:
          // Both halves are equal iff the minimal period fits evenly in a half.
          return (length % 2 == 0) && ((length / 2) % period == 0);
      }

      return false;
    }

    /// Checks if all base 10^width blocks of value are equal.
    bool repeats_with_width(uint64_t value, unsigned width) {
      uint64_t const base = power_of_10(width);
      uint64_t const block = value % base;

      for (uint64_t rest = value / base; rest != 0; rest /= base) {
        if (rest % base != block) {
          return false;
        }
      }

      return true;
    }

    template <class Classifier>
    uint64_t sum_matching(id_range_t const & range, Classifier && is_invalid) {
      check(range.lower <= range.upper, "Invalid range {}-{}", range.lower, range.upper);

      uint64_t sum = 0;

      for (uint64_t value = range.lower;; ++value) {
        if (is_invalid(value)) {
          SPDLOG_TRACE("invalid: {}", value);
          sum += value;
        }

        if (value == range.upper) {  // Stop here, so that upper can't overflow value.
          break;
        }
      }

      SPDLOG_DEBUG("[range: {}-{}, sum: {}]", range.lower, range.upper, sum);
      return sum;
    }

    template <class Classifier>
    uint64_t sum_matching(std::span<id_range_t const> ranges, Classifier && is_invalid) {
      uint64_t total = 0;

      for (auto const & range : ranges) {
        total += sum_matching(range, is_invalid);
      }

      return total;
    }

  }  // namespace

  size_t minimal_period(std::string_view digits) {
    size_t const length = digits.size();

    for (size_t period = 1; period <= length / 2; ++period) {
      if (length % period != 0) {  // Blocks must fit evenly.
        continue;
      }

      auto const pattern = digits.substr(0, period);
      bool matches = true;

      for (size_t offset = period; matches && offset < length; offset += period) {
        matches = digits.substr(offset, period) == pattern;
      }

      if (matches) {
        return period;
      }
    }

    return length;
  }

  bool is_repeated(uint64_t value, repetition_t rule) {
    auto const formatted = fmt::format_int(value);
    auto const digits = std::string_view{formatted.data(), formatted.size()};
    return matches_rule(digits.size(), minimal_period(digits), rule);
  }

  bool is_repeated_numeric(uint64_t value, repetition_t rule) {
    unsigned const length = num_digits(value);

    switch (rule) {
      case repetition_t::exactly_twice:
        return (length % 2 == 0) && repeats_with_width(value, length / 2);
      case repetition_t::at_least_twice:
        for (unsigned width = 1; width <= length / 2; ++width) {
          if (length % width == 0 && repeats_with_width(value, width)) {
            return true;
          }
        }
        return false;
    }

    return false;
  }

  uint64_t sum_invalid(id_range_t const & range, repetition_t rule) {
    return sum_matching(range, [rule](uint64_t value) { return is_repeated(value, rule); });
  }

  uint64_t sum_invalid_ids(std::span<id_range_t const> ranges, repetition_t rule) {
    return sum_matching(ranges, [rule](uint64_t value) { return is_repeated(value, rule); });
  }

  id_range_t parse_range(std::string_view token) {
    token = trim(token);

    auto const dash = token.find('-');
    check(dash != token.npos, "Missing '-' in range '{}'", token);

    id_range_t range;
    range.lower = to_int<uint64_t>(trim(token.substr(0, dash)));
    range.upper = to_int<uint64_t>(trim(token.substr(dash + 1)));

    check(range.lower <= range.upper, "Range '{}' has lower bound above upper bound", token);
    return range;
  }

  std::vector<id_range_t> parse_ranges(std::string_view input) {
    std::vector<id_range_t> ranges;

    split(trim(input), ',', [&](std::string_view token) {
      SPDLOG_TRACE("token: '{}'", token);
      ranges.push_back(parse_range(token));
    });

    return ranges;
  }

  uint64_t day_t<2>::solve(part_t<1>, version_t<0>, std::string_view input) {
    auto const ranges = parse_ranges(input);
    return sum_invalid_ids(ranges, repetition_t::exactly_twice);
  }

  uint64_t day_t<2>::solve(part_t<1>, version_t<1>, std::string_view input) {
    auto const ranges = parse_ranges(input);
    return sum_matching(std::span<id_range_t const>{ranges}, [](uint64_t value) {
      return is_repeated_numeric(value, repetition_t::exactly_twice);
    });
  }

  uint64_t day_t<2>::solve(part_t<2>, version_t<0>, std::string_view input) {
    auto const ranges = parse_ranges(input);
    return sum_invalid_ids(ranges, repetition_t::at_least_twice);
  }

  uint64_t day_t<2>::solve(part_t<2>, version_t<1>, std::string_view input) {
    auto const ranges = parse_ranges(input);
    return sum_matching(std::span<id_range_t const>{ranges}, [](uint64_t value) {
      return is_repeated_numeric(value, repetition_t::at_least_twice);
    });
  }

}  // namespace northpole
