#pragma once

#include <filesystem>
#include <string>

namespace tasknag::util {

struct LogSettings {
  std::string level = "info";
  std::filesystem::path file;  // empty disables the file sink
  size_t max_size_mb = 5;
  size_t max_files = 3;
  bool quiet = false;          // suppress console output below error
};

// Install the "tasknag" logger as spdlog's default logger. Falls back to
// console-only logging when the log file cannot be opened.
void setupLogging(const LogSettings& settings);

}  // namespace tasknag::util
