#pragma once

#include <concepts>
#include <cstdint>

namespace northpole {

  /// @brief Calculate the non-negative mod(value, modulus).
  template <std::integral T, std::integral U>
  constexpr T mod(T value, U modulus);

  /// @brief Division rounding toward negative infinity (unlike the built-in operator/).
  template <std::signed_integral T, std::integral U>
  constexpr T floor_div(T value, U divisor);

  /// @brief Number of decimal digits in x, with num_digits(0) == 1.
  constexpr unsigned num_digits(uint64_t x);

  /// @brief Returns 10^exponent. Only valid for exponents that fit in 64 bits (i.e. <= 19).
  constexpr uint64_t power_of_10(unsigned exponent);

}  // namespace northpole

#include "northpole/math.tpp"
