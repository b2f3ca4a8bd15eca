#pragma once

#include "northpole/math.hpp"  // Only for IDE.

#include <array>
#include <cassert>
#include <stdexcept>

namespace northpole {

  template <std::integral T, std::integral U>
  constexpr T mod(T value, U modulus) {
    assert(modulus > 0);
    auto const cast_mod = static_cast<T>(modulus);
    return ((value % cast_mod) + cast_mod) % cast_mod;
  }

  template <std::signed_integral T, std::integral U>
  constexpr T floor_div(T value, U divisor) {
    assert(divisor > 0);
    auto const cast_div = static_cast<T>(divisor);
    // Remove the non-negative remainder first, so the division below is exact.
    return (value - mod(value, cast_div)) / cast_div;
  }

  constexpr unsigned num_digits(uint64_t x) {
    unsigned digits = 1;
    for (; x >= 10; x /= 10) {
      ++digits;
    }
    return digits;
  }

  constexpr uint64_t power_of_10(unsigned exponent) {
    constexpr auto table = [] {
      std::array<uint64_t, 20> result{};
      uint64_t value = 1;
      for (auto & entry : result) {
        entry = value;
        value *= 10;  // Wraps after the last entry, but that value is never stored.
      }
      return result;
    }();

    if (exponent >= table.size()) {
      throw std::out_of_range("10^exponent does not fit in 64 bits");
    }
    return table[exponent];
  }

}  // namespace northpole
