// clang-format off
#include NORTHPOLE_DAYS_HEADER
// clang-format on

#include "northpole/day.hpp"
#include "northpole/file.hpp"
#include "northpole/logging.hpp"
#include "northpole/preprocessor.hpp"

#include <benchmark/benchmark.h>
#include <fmt/format.h>
#include <spdlog/common.h>
#include <spdlog/spdlog.h>

#include <cstddef>
#include <exception>
#include <filesystem>
#include <utility>

namespace {

  using namespace northpole;

  template <size_t Day, size_t Part, size_t Version = static_cast<size_t>(-1)>
  void benchmark_day_part(benchmark::State & state) {
    auto const input_path = input_file_path(NORTHPOLE_STRINGIFY(NORTHPOLE_INPUT_DIR), Day, Part);

    // Skip benchmarks for which no input files exist.
    if (!std::filesystem::exists(input_path)) {
      auto const msg = fmt::format("Input file does not exist ({})", input_path.string());
      state.SkipWithError(msg.c_str());
      return;
    }

    auto const input = read_file(input_path);

    // Suppress all non-critical logging inside solvers. Note that we can't completely
    // disable logging, since the source code for each day is already compiled into a separate
    // library, with SPDLOG_ACTIVE_LEVEL set to a specific value.
    auto const prev_log_level = spdlog::get_level();
    spdlog::set_level(spdlog::level::warn);

    try {
      for (auto _ : state) {
        // Internal state might change when calling solve, so always recreate the day_t object.
        day_t<Day> day{};
        static constexpr auto tag = part<Part>;

        if constexpr (Version == static_cast<size_t>(-1)) {
          benchmark::DoNotOptimize(day.solve(tag, input));
        } else {
          benchmark::DoNotOptimize(day.solve(tag, version<Version>, input));
        }
      }
    } catch (std::exception const & ex) {
      auto const msg = fmt::format("Exception: {}", ex.what());
      state.SkipWithError(msg.c_str());
    }

    // Restore previous logging level.
    spdlog::set_level(prev_log_level);
  }

  template <size_t Day, size_t Part, bool IsMultiDayBenchmark>
  void register_day_part() {
    auto const msg_prefix = fmt::format("day {:02} - part {}", Day, Part);

    // If this is a multi-day benchmark, only run the highest version or the non-versioned solver.
    // Otherwise run all available versions.
    using input_t = decltype(read_file(std::declval<std::filesystem::path>()));
    static constexpr auto & version_info = highest_version_for_part<Day, Part, input_t>;
    static constexpr bool runMultipleVersions = !IsMultiDayBenchmark && version_info.has_versions;

    if constexpr (runMultipleVersions) {
      static constexpr auto versions = std::make_index_sequence<version_info.highest_version + 1>{};

      auto const invoker = [&]<size_t... Version>(std::index_sequence<Version...>) {
        (..., benchmark::RegisterBenchmark(fmt::format("{} v{:d}", msg_prefix, Version).c_str(),
                                           &benchmark_day_part<Day, Part, Version>));
      };
      invoker(versions);
    } else {
      if constexpr (version_info.has_versions) {
        benchmark::RegisterBenchmark(msg_prefix.c_str(),
                                     &benchmark_day_part<Day, Part, version_info.highest_version>);
      } else if constexpr (invocable_for_part<Day, Part, input_t>) {
        benchmark::RegisterBenchmark(msg_prefix.c_str(), &benchmark_day_part<Day, Part>);
      }
    }
  }

  template <size_t Day, bool IsMultiDayBenchmark>
  void register_day() {
    static constexpr size_t max_parts = 2;
    static constexpr auto parts = std::make_index_sequence<max_parts>{};

    auto const invoker = []<size_t... Part>(std::index_sequence<Part...>) {
      (..., register_day_part<Day, Part + 1, IsMultiDayBenchmark>());
    };
    invoker(parts);
  }

  template <size_t... Days>
  void register_days() {
    bool constexpr static isMultiDayBenchmark = sizeof...(Days) > 1;
    (..., register_day<Days, isMultiDayBenchmark>());
  }

}  // namespace

int main(int argc, char ** argv) {
  northpole::setup_logging(argc, argv);

  benchmark::Initialize(&argc, argv);

  // Register benchmarks for each day.
  register_days<NORTHPOLE_DAY_NUMBERS>();

  benchmark::RunSpecifiedBenchmarks();
  benchmark::Shutdown();
}
