#pragma once

#include <filesystem>
#include <stdexcept>
#include <string>

namespace northpole {

  /** @brief Returns trimmed file contents.
   *
   * @returns Trimmed contents of the file at `file`. The last character is always a newline. This
   * is to simplify parsing when there's multiple lines.
   *
   * @throws file_read_error If the file could not be opened or read.
   */
  std::string read_file(std::filesystem::path const & file);

  struct file_read_error : public std::runtime_error {
    using std::runtime_error::runtime_error;
  };

  /// @brief Resolves path to its target. If path is not a symlink, returns the path itself.
  std::filesystem::path resolve_symlink(std::filesystem::path path);

}  // namespace northpole
