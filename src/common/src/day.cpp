#include "northpole/day.hpp"

#include "northpole/file.hpp"

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <regex>

namespace northpole {

  std::filesystem::path input_file_path(std::filesystem::path input_dir, size_t day, size_t part) {
    return std::move(input_dir) / fmt::format("day_{:02d}-part_{}.txt", day, part);
  }

  std::vector<std::filesystem::path> example_file_paths(std::filesystem::path const & dir,
                                                        size_t day,
                                                        size_t part) {
    // Find all files matching the pattern "day_{day}-part_{part}-example_{number}.txt".
    auto const pattern =
        std::regex(fmt::format(R"(^day_{:02d}-part_{:d}-example_\d+\.txt$)", day, part));

    std::vector<std::filesystem::path> result;

    for (auto const & entry : std::filesystem::directory_iterator(dir)) {
      if (!std::filesystem::is_regular_file(resolve_symlink(entry.path()))) {
        continue;
      }

      auto const & path = entry.path();
      if (!std::regex_match(path.filename().string(), pattern)) {
        continue;
      }

      // Examples without a solution can't be verified.
      auto const solution_file =
          path.parent_path() / path.stem().concat("-solution").concat(path.extension().native());
      if (!std::filesystem::exists(solution_file)) {
        SPDLOG_DEBUG("Skipping example without solution ({})", path.string());
        continue;
      }

      result.push_back(path);
    }

    std::ranges::sort(result);

    return result;
  }

}  // namespace northpole
