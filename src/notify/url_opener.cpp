#include "tasknag/notify/url_opener.hpp"

#include <algorithm>

#include <spdlog/spdlog.h>

#include "tasknag/util/safe_process.hpp"

namespace tasknag::notify {

SystemUrlOpener::SystemUrlOpener(std::string command)
    : command_(command.empty() ? defaultCommand() : std::move(command)) {}

SystemUrlOpener::~SystemUrlOpener() {
  reapStragglers();
}

std::string SystemUrlOpener::defaultCommand() {
#ifdef __APPLE__
  return "open";
#else
  return "xdg-open";
#endif
}

Result<void> SystemUrlOpener::open(const std::string& url, std::chrono::milliseconds timeout) {
  reapStragglers();

  auto pid = util::SafeProcess::executeAsync(command_, {url});
  if (!pid) {
    return std::unexpected(makeError(ErrorCode::kExternalToolError,
                                     "Failed to launch " + command_ + ": " + pid.error().message()));
  }

  auto exit_code = util::SafeProcess::waitForExit(*pid, timeout);
  if (!exit_code) {
    if (exit_code.error().code() == ErrorCode::kTimeout) {
      std::lock_guard<std::mutex> lock(stragglers_mutex_);
      stragglers_.push_back(*pid);
    }
    return std::unexpected(exit_code.error());
  }

  if (*exit_code != 0) {
    return std::unexpected(makeError(ErrorCode::kExternalToolError,
                                     command_ + " exited with code " + std::to_string(*exit_code)));
  }
  return {};
}

bool SystemUrlOpener::isAvailable() const {
  return util::SafeProcess::commandExists(command_);
}

void SystemUrlOpener::reapStragglers() {
  std::lock_guard<std::mutex> lock(stragglers_mutex_);
  auto reaped = std::remove_if(stragglers_.begin(), stragglers_.end(),
                               [](pid_t pid) { return util::SafeProcess::reapIfExited(pid); });
  if (reaped != stragglers_.end()) {
    spdlog::debug("Reaped {} URL handler process(es)", std::distance(reaped, stragglers_.end()));
  }
  stragglers_.erase(reaped, stragglers_.end());
}

}  // namespace tasknag::notify
