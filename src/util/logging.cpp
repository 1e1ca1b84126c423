#include "tasknag/util/logging.hpp"

#include <spdlog/spdlog.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <vector>

namespace tasknag::util {

namespace {

constexpr const char* kLogPattern = "[%Y-%m-%d %H:%M:%S.%e] [%l] [%n] %v";

}  // namespace

void setupLogging(const LogSettings& settings) {
  auto level = spdlog::level::from_str(settings.level);
  if (level == spdlog::level::off && settings.level != "off") {
    level = spdlog::level::info;
  }

  auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
  console_sink->set_level(settings.quiet ? spdlog::level::err : spdlog::level::warn);
  if (level <= spdlog::level::debug && !settings.quiet) {
    console_sink->set_level(level);
  }

  std::vector<spdlog::sink_ptr> sinks = {console_sink};
  std::string file_error;

  if (!settings.file.empty()) {
    try {
      std::filesystem::create_directories(settings.file.parent_path());
      auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
          settings.file.string(), settings.max_size_mb * 1024 * 1024, settings.max_files);
      sinks.push_back(file_sink);
    } catch (const std::exception& e) {
      file_error = e.what();
    }
  }

  auto logger = std::make_shared<spdlog::logger>("tasknag", sinks.begin(), sinks.end());
  logger->set_pattern(kLogPattern);
  logger->set_level(level);
  logger->flush_on(spdlog::level::warn);

  spdlog::set_default_logger(logger);

  if (!file_error.empty()) {
    spdlog::warn("Failed to setup file logging: {}", file_error);
  }
}

}  // namespace tasknag::util
