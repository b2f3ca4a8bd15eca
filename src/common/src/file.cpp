#include "northpole/file.hpp"

#include "northpole/string.hpp"

#include <fmt/format.h>

#include <fstream>
#include <iterator>

namespace northpole {

  std::string read_file(std::filesystem::path const & file) {
    auto ifile = std::ifstream{file};
    if (!ifile.is_open()) {
      throw file_read_error(fmt::format("Failed to open file ({})", file.string()));
    }

    auto result =
        trim(std::string(std::istreambuf_iterator<char>{ifile}, std::istreambuf_iterator<char>{}));
    if (ifile.bad()) {
      throw file_read_error(fmt::format("Failed to read file ({})", file.string()));
    }

    // Ensure the last character is a newline. This makes parsing lines easier (i.e. no need to
    // check for either '\n' or EOF).
    result.push_back('\n');

    return result;
  }

  std::filesystem::path resolve_symlink(std::filesystem::path path) {
    if (!std::filesystem::is_symlink(path)) {
      return path;
    }

    auto const target = std::filesystem::read_symlink(path);
    if (target.is_absolute()) {
      path = target;
    } else {
      path = path.parent_path() / target;
      path = path.lexically_normal();
    }

    return resolve_symlink(std::move(path));
  }

}  // namespace northpole
