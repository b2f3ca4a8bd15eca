#pragma once

#include <concepts>
#include <string_view>

namespace northpole {

  template <class StringLike>
    requires requires(StringLike s) {
      { s.substr(0, 1) } -> std::same_as<StringLike>;
    }
  StringLike trim(StringLike s);

  /// @brief Converts the whole of str to an integer.
  /// @throws std::invalid_argument If str isn't entirely a valid number of type T.
  template <class T>
  T to_int(std::string_view str);

  /** @brief Calls callback for each non-empty token in input separated by splitter. Stops early if
   * callback returns false.
   */
  template <class Callback>
    requires std::invocable<Callback, std::string_view>
  void split(std::string_view input, char splitter, Callback && callback);

}  // namespace northpole

#include "northpole/string.tpp"
