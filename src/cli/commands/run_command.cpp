#include "tasknag/cli/commands/run_command.hpp"

#include <csignal>
#include <iostream>

#include <pthread.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace tasknag::cli {

RunCommand::RunCommand(Application& app) : app_(app) {}

void RunCommand::setupCommand(CLI::App* cmd) {
  cmd->add_flag("--check-first", check_first_, "Sweep once immediately before waiting for the first boundary");
}

Result<int> RunCommand::execute(const GlobalOptions& options) {
  // Block the shutdown signals before the scheduler thread exists so that
  // only this thread receives them through sigwait()
  sigset_t signals;
  sigemptyset(&signals);
  sigaddset(&signals, SIGINT);
  sigaddset(&signals, SIGTERM);
  if (pthread_sigmask(SIG_BLOCK, &signals, nullptr) != 0) {
    return std::unexpected(makeError(ErrorCode::kSystemError, "Failed to block shutdown signals"));
  }

  auto& scheduler = app_.scheduler();
  if (check_first_) {
    scheduler.checkNow();
  }

  auto started = scheduler.start();
  if (!started) {
    pthread_sigmask(SIG_UNBLOCK, &signals, nullptr);
    return std::unexpected(started.error());
  }

  if (!options.quiet && !options.json) {
    auto interval = std::chrono::minutes(app_.config().scheduler.interval_minutes);
    auto next = notify::NotificationScheduler::nextBoundary(app_.clock().now(), interval);
    std::cout << "TaskNag running, press Ctrl+C to stop\n";
    std::cout << "Next check at " << util::Time::formatLocal(next) << "\n";
  }

  int signal_number = 0;
  int wait_result = sigwait(&signals, &signal_number);
  if (wait_result != 0) {
    spdlog::error("sigwait failed: {}", wait_result);
  } else {
    spdlog::info("Received signal {}, shutting down", signal_number);
  }

  scheduler.stop();
  pthread_sigmask(SIG_UNBLOCK, &signals, nullptr);

  auto status = scheduler.status();
  if (options.json) {
    nlohmann::json output;
    output["sweeps"] = status.sweeps;
    output["notifications"] = status.notifications;
    std::cout << output.dump() << "\n";
  } else if (!options.quiet) {
    std::cout << "Stopped after " << status.sweeps << " check(s), "
              << status.notifications << " notification(s)\n";
  }
  return 0;
}

}  // namespace tasknag::cli
