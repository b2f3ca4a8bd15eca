#pragma once

#include "northpole/string.hpp"  // Only for IDE.

#include <fmt/format.h>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <iterator>
#include <stdexcept>
#include <type_traits>
#include <utility>

namespace northpole {

  template <class StringLike>
    requires requires(StringLike s) {
      { s.substr(0, 1) } -> std::same_as<StringLike>;
    }
  StringLike trim(StringLike s) {
    auto const is_nonspace = [](unsigned char c) { return !std::isspace(c); };

    auto const new_begin = std::ranges::find_if(s, is_nonspace);

    if (new_begin == s.end()) {  // If the string is all whitespace, stop.
      return {};
    }

    // There's at least one non-whitespace character, so this can't return s.rend().
    auto const new_end = std::find_if(s.rbegin(), s.rend(), is_nonspace).base();

    size_t const start_index = std::distance(s.begin(), new_begin);
    size_t const new_length = std::distance(new_begin, new_end);

    return std::move(s).substr(start_index, new_length);
  }

  template <class T>
  T to_int(std::string_view str) {
    T value{};
    auto const * const end = str.data() + str.size();
    auto const [ptr, ec] = std::from_chars(str.data(), end, value);
    if (ec != std::errc{} || ptr != end) [[unlikely]] {
      throw std::invalid_argument(fmt::format("Failed to convert '{}' to integer", str));
    }
    return value;
  }

  template <class Callback>
    requires std::invocable<Callback, std::string_view>
  void split(std::string_view input, char splitter, Callback && callback) {
    while (!input.empty()) {
      auto const pos = input.find(splitter);
      auto const token = input.substr(0, pos);
      input.remove_prefix(pos == input.npos ? input.size() : pos + 1);

      if (token.empty()) {
        continue;
      }

      if constexpr (std::is_same_v<std::invoke_result_t<Callback, std::string_view>, bool>) {
        if (!callback(token)) {
          return;
        }
      } else {
        callback(token);
      }
    }
  }

}  // namespace northpole
