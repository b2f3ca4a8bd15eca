#pragma once

#include "northpole/day.hpp"

#include <cstdint>
#include <span>
#include <string_view>
#include <vector>

/*
  A dial with positions 0..99 starts at 50 and is rotated by a list of commands (e.g. "L68",
  "R48"). Part 1 counts the commands that leave the dial at 0, part 2 counts every time the dial
  points at 0, including while a single rotation passes over it.
 */

namespace northpole {

  inline constexpr int64_t dial_size = 100;
  inline constexpr int64_t dial_start = 50;

  enum class direction_t : uint8_t {
    toward_lower,   // 'L'
    toward_higher,  // 'R'
  };

  struct dial_command_t {
    direction_t direction;
    uint32_t magnitude;

    /// Displacement caused by this command.
    int64_t signed_magnitude() const {
      return direction == direction_t::toward_higher ? static_cast<int64_t>(magnitude)
                                                     : -static_cast<int64_t>(magnitude);
    }

    friend bool operator==(dial_command_t const &, dial_command_t const &) = default;
  };

  struct dial_result_t {
    uint64_t landing_count = 0;   // Commands that ended exactly on 0.
    uint64_t crossing_count = 0;  // Times 0 was passed or landed on.

    friend bool operator==(dial_result_t const &, dial_result_t const &) = default;
  };

  /** @brief Number of multiples of modulus passed or landed on when moving from pre to post. The
   * starting position itself is never counted. Uses floor division, so any sign of pre and post
   * is fine.
   */
  uint64_t count_crossings(int64_t pre, int64_t post, int64_t modulus = dial_size);

  /// @brief Same as count_crossings, but moves one position at a time.
  uint64_t count_crossings_by_stepping(int64_t pre, int64_t post, int64_t modulus = dial_size);

  /** @brief Circular dial which keeps its unbounded raw position next to the counters. Only
   * reading() normalizes, the raw position is never wrapped since the crossing count of later
   * rotations depends on it.
   */
  class dial_t {
   public:
    explicit dial_t(int64_t initial = dial_start, int64_t modulus = dial_size);

    /// Applies a single command and returns the number of crossings it caused.
    uint64_t rotate(dial_command_t const & command);

    int64_t raw_position() const { return position_; }
    int64_t reading() const;
    int64_t modulus() const { return modulus_; }
    dial_result_t const & result() const { return result_; }

   private:
    int64_t modulus_;
    int64_t position_;
    dial_result_t result_;
  };

  dial_result_t process_dial(std::span<dial_command_t const> commands,
                             int64_t initial = dial_start,
                             int64_t modulus = dial_size);

  /// @throws check_failure On an unknown direction or empty line.
  /// @throws std::invalid_argument On a non-numeric magnitude.
  dial_command_t parse_command(std::string_view line);

  /// @brief Parses one command per line, skipping blank lines.
  std::vector<dial_command_t> parse_commands(std::string_view input);

  /// @brief Counts entries that are a multiple of dial_size (SIMD).
  uint64_t count_dial_zeros(std::span<int64_t const> positions);

  template <>
  struct day_t<1> {
    uint64_t solve(part_t<1>, version_t<0>, std::string_view input);
    uint64_t solve(part_t<1>, version_t<1>, std::string_view input);

    uint64_t solve(part_t<2>, version_t<0>, std::string_view input);
    uint64_t solve(part_t<2>, version_t<1>, std::string_view input);
  };

}  // namespace northpole
