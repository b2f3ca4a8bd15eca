#pragma once

namespace northpole {

  /** @brief Sets the default log level to SPDLOG_ACTIVE_LEVEL, then overrides it from the
   * SPDLOG_LEVEL environment variable and SPDLOG_LEVEL=... command line arguments.
   */
  void setup_logging(int argc, char ** argv);

}  // namespace northpole
