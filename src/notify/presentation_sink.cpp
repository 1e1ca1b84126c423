#include "tasknag/notify/presentation_sink.hpp"

#include <spdlog/spdlog.h>

#include "tasknag/util/safe_process.hpp"
#include "tasknag/util/time.hpp"

namespace tasknag::notify {

namespace {

Result<void> runTool(const std::string& command, const std::vector<std::string>& args) {
  auto result = util::SafeProcess::execute(command, args);
  if (!result) {
    return std::unexpected(makeError(ErrorCode::kExternalToolError,
                                     command + ": " + result.error().message()));
  }
  if (!result->success()) {
    std::string detail = result->stderr_output.empty() ? "" : ": " + result->stderr_output;
    while (!detail.empty() && (detail.back() == '\n' || detail.back() == '\r')) {
      detail.pop_back();
    }
    return std::unexpected(makeError(ErrorCode::kExternalToolError,
                                     command + " exited with code " +
                                     std::to_string(result->exit_code) + detail));
  }
  return {};
}

}  // namespace

DesktopPresentationSink::DesktopPresentationSink(Options options) : options_(std::move(options)) {}

Result<void> DesktopPresentationSink::showAlert(const std::string& title, const std::string& body) {
  std::vector<std::string> args = {"--app-name", options_.app_name, title, body};
  return runTool(options_.notifier, args);
}

Result<void> DesktopPresentationSink::playCue() {
  if (options_.sound_command.empty()) {
    return std::unexpected(makeError(ErrorCode::kConfigError, "No sound command configured"));
  }
  return runTool(options_.sound_command, options_.sound_args);
}

Result<void> DesktopPresentationSink::bringToFront() {
  if (options_.focus_command.empty()) {
    spdlog::debug("No focus command configured, not raising a window");
    return {};
  }
  return runTool(options_.focus_command, options_.focus_args);
}

ConsolePresentationSink::ConsolePresentationSink(std::ostream& out) : out_(out) {}

Result<void> ConsolePresentationSink::showAlert(const std::string& title, const std::string& body) {
  out_ << "[" << util::Time::formatLocal(util::Time::now(), "%H:%M") << "] "
       << title << ": " << body << std::endl;
  if (!out_) {
    return std::unexpected(makeError(ErrorCode::kFileWriteError, "Cannot write alert to console"));
  }
  return {};
}

Result<void> ConsolePresentationSink::playCue() {
  out_ << '\a' << std::flush;
  return {};
}

Result<void> ConsolePresentationSink::bringToFront() {
  return {};
}

}  // namespace tasknag::notify
