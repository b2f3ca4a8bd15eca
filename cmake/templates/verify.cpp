// clang-format off
#include NORTHPOLE_DAYS_HEADER
// clang-format on

#include "northpole/day.hpp"
#include "northpole/file.hpp"
#include "northpole/logging.hpp"
#include "northpole/preprocessor.hpp"
#include "northpole/string.hpp"

#include <fmt/color.h>
#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <cstddef>
#include <exception>
#include <filesystem>
#include <string>
#include <string_view>
#include <utility>

namespace {

  using namespace northpole;

  struct test_count_t {
    test_count_t()
        : successful(0), total(0) {}

    test_count_t & operator+=(test_count_t const & other) {
      successful += other.successful;
      total += other.total;
      return *this;
    }

    [[maybe_unused]] friend test_count_t operator+(test_count_t lhs, test_count_t const & rhs) {
      lhs += rhs;
      return lhs;
    }

    unsigned successful;
    unsigned total;
  };

  template <size_t Day, size_t Part, size_t Version>
  bool verify_day_part_version(std::string_view msg_prefix,
                               std::string const & input,
                               size_t example_number,
                               std::string_view expected) {
    static constexpr bool run_version = Version != static_cast<size_t>(-1);

    std::string actual_str;

    try {
      // Internal state might change when calling solve, so always recreate the day_t object.
      day_t<Day> day{};
      static constexpr auto tag = part<Part>;

      if constexpr (run_version) {
        actual_str = fmt::format("{}", day.solve(tag, version<Version>, input));
      } else {
        actual_str = fmt::format("{}", day.solve(tag, input));
      }
    } catch (std::exception const & ex) {
      actual_str = fmt::format("exception ({})", ex.what());
    }

    bool const success = actual_str == expected;
    spdlog::info("[{}{} - example {}] {} (actual: {}, expected: {})", msg_prefix,
                 run_version ? fmt::format(" v{:d}", Version) : std::string{}, example_number,
                 success ? fmt::styled("PASS", fmt::fg(fmt::terminal_color::green))
                         : fmt::styled("FAIL", fmt::fg(fmt::terminal_color::red)),
                 actual_str, expected);
    return success;
  }

  template <size_t Day, size_t Part>
  test_count_t verify_day_part() {
    using input_t = decltype(read_file(std::declval<std::filesystem::path>()));
    static constexpr auto & version_info = highest_version_for_part<Day, Part, input_t>;
    static constexpr bool can_run =
        version_info.has_versions || invocable_for_part<Day, Part, input_t>;

    test_count_t test_count;

    if constexpr (can_run) {
      auto const msg_prefix = fmt::format("day {:02} - part {}", Day, Part);

      auto const example_files =
          example_file_paths(NORTHPOLE_STRINGIFY(NORTHPOLE_INPUT_DIR), Day, Part);

      if (example_files.empty()) {
        spdlog::warn("[{}] No example files found", msg_prefix);
        return test_count;
      }

      // Validate each example file for each version. Iterate over example files first, since
      // this makes it easier to compare the output of different versions against each other.
      for (auto const & example_file : example_files) {
        auto const solution_file =
            example_file.parent_path() /
            example_file.stem().concat("-solution").concat(example_file.extension().native());

        auto const expected = trim(read_file(solution_file));
        auto const stem = example_file.stem().string();
        size_t const example_number = to_int<size_t>(stem.substr(stem.find_last_of('_') + 1));

        auto const input = read_file(example_file);

        if constexpr (version_info.has_versions) {
          static constexpr auto versions =
              std::make_index_sequence<version_info.highest_version + 1>{};

          auto const invoker = [&]<size_t... Version>(std::index_sequence<Version...>) {
            return (... + static_cast<unsigned>(verify_day_part_version<Day, Part, Version>(
                              msg_prefix, input, example_number, expected)));
          };

          test_count.total += versions.size();
          test_count.successful += invoker(versions);
        } else {
          test_count.total += 1;
          test_count.successful += verify_day_part_version<Day, Part, static_cast<size_t>(-1)>(
              msg_prefix, input, example_number, expected);
        }
      }
    }

    return test_count;
  }

  template <size_t Day>
  test_count_t verify_day() {
    static constexpr size_t max_parts = 2;
    static constexpr auto parts = std::make_index_sequence<max_parts>{};

    auto const invoker = []<size_t... Is>(std::index_sequence<Is...>) {
      // Need fold expression to ensure proper evaluation order. Hence this mess.
      test_count_t result{};
      auto const add = [&](test_count_t tc) { result += tc; };
      (add(verify_day_part<Day, Is + 1>()), ...);
      return result;
    };
    return invoker(parts);
  }

  template <size_t... Days>
  test_count_t verify_days() {
    return (... + verify_day<Days>());
  }

}  // namespace

int main(int argc, char ** argv) {
  northpole::setup_logging(argc, argv);

  auto const test_counts = verify_days<NORTHPOLE_DAY_NUMBERS>();
  bool const success = test_counts.total > 0 && test_counts.total == test_counts.successful;
  spdlog::info("[summary] {} ({} passed, {} failed, {} total)",
               success ? fmt::styled("PASS", fmt::fg(fmt::terminal_color::green))
                       : fmt::styled("FAIL", fmt::fg(fmt::terminal_color::red)),
               test_counts.successful, test_counts.total - test_counts.successful,
               test_counts.total);
  return success ? 0 : 1;
}
