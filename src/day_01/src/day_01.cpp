#include "northpole/day_01.hpp"

#include "northpole/check.hpp"
#include "northpole/math.hpp"
#include "northpole/string.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cstdint>
#include <string_view>
#include <vector>

namespace northpole {

  uint64_t count_crossings(int64_t pre, int64_t post, int64_t modulus) {
    check(modulus > 0, "Dial modulus must be positive (got {})", modulus);

    if (post >= pre) {  // Multiples in (pre, post].
      return floor_div(post, modulus) - floor_div(pre, modulus);
    }

    // Multiples in [post, pre). Shifting both ends down by one includes post and excludes pre.
    // Without the shift, leaving 0 would count and landing on 0 wouldn't, which disagrees with
    // count_crossings_by_stepping.
    return floor_div(pre - 1, modulus) - floor_div(post - 1, modulus);
  }

  uint64_t count_crossings_by_stepping(int64_t pre, int64_t post, int64_t modulus) {
    check(modulus > 0, "Dial modulus must be positive (got {})", modulus);

    int64_t const step = (post >= pre) ? 1 : -1;
    uint64_t crossings = 0;

    for (int64_t pos = pre; pos != post;) {
      pos += step;
      crossings += (mod(pos, modulus) == 0);
    }

    return crossings;
  }

  dial_t::dial_t(int64_t initial, int64_t modulus)
      : modulus_(modulus), position_(initial) {
    check(modulus_ > 0, "Dial modulus must be positive (got {})", modulus_);
  }

  int64_t dial_t::reading() const {
    return mod(position_, modulus_);
  }

  uint64_t dial_t::rotate(dial_command_t const & command) {
    int64_t const pre = position_;
    int64_t const post = pre + command.signed_magnitude();

    uint64_t const crossings = count_crossings(pre, post, modulus_);
    result_.crossing_count += crossings;

    position_ = post;
    result_.landing_count += (reading() == 0);

    SPDLOG_TRACE("{} -> {} (reading: {}, crossings: {}, total: {})", pre, post, reading(),
                 crossings, result_.crossing_count);
    return crossings;
  }

  dial_result_t process_dial(std::span<dial_command_t const> commands,
                             int64_t initial,
                             int64_t modulus) {
    dial_t dial{initial, modulus};

    for (auto const & command : commands) {
      dial.rotate(command);
    }

    SPDLOG_DEBUG("{} commands, final position: {}, landings: {}, crossings: {}", commands.size(),
                 dial.raw_position(), dial.result().landing_count, dial.result().crossing_count);
    return dial.result();
  }

  dial_command_t parse_command(std::string_view line) {
    line = trim(line);
    check(!line.empty(), "Empty dial command");

    dial_command_t command{};

    switch (line.front()) {
      case 'L':
        command.direction = direction_t::toward_lower;
        break;
      case 'R':
        command.direction = direction_t::toward_higher;
        break;
      default:
        check(false, "Unknown direction '{}' in command '{}'", line.front(), line);
    }

    command.magnitude = to_int<uint32_t>(line.substr(1));
    return command;
  }

  std::vector<dial_command_t> parse_commands(std::string_view input) {
    std::vector<dial_command_t> commands;

    // Assume one command per line.
    commands.reserve(std::ranges::count(input, '\n') + 1);

    split(input, '\n', [&](std::string_view line) {
      if (!trim(line).empty()) {
        commands.push_back(parse_command(line));
      }
    });

    return commands;
  }

  uint64_t day_t<1>::solve(part_t<1>, version_t<0>, std::string_view input) {
    auto const commands = parse_commands(input);
    return process_dial(commands).landing_count;
  }

  uint64_t day_t<1>::solve(part_t<1>, version_t<1>, std::string_view input) {
    auto const commands = parse_commands(input);

    // Raw positions after each command. A command lands on 0 iff its raw position is a multiple of
    // the dial size, so there's no need to normalize anything before counting.
    std::vector<int64_t> positions(commands.size());
    int64_t position = dial_start;

    std::ranges::transform(commands, positions.begin(), [&](dial_command_t const & command) {
      position += command.signed_magnitude();
      return position;
    });

    return count_dial_zeros(positions);
  }

  uint64_t day_t<1>::solve(part_t<2>, version_t<0>, std::string_view input) {
    auto const commands = parse_commands(input);
    return process_dial(commands).crossing_count;
  }

  uint64_t day_t<1>::solve(part_t<2>, version_t<1>, std::string_view input) {
    auto const commands = parse_commands(input);

    int64_t pos = dial_start;
    uint64_t passed_zero = 0;

    for (auto const & command : commands) {
      int64_t const after_move = pos + command.signed_magnitude();
      passed_zero += count_crossings_by_stepping(pos, after_move);
      pos = after_move;
    }

    return passed_zero;
  }

}  // namespace northpole
