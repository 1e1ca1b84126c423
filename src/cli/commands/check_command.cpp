#include "tasknag/cli/commands/check_command.hpp"

#include <iostream>

#include <nlohmann/json.hpp>

#include "tasknag/core/task_codec.hpp"
#include "tasknag/notify/notification_dispatcher.hpp"

namespace tasknag::cli {

CheckCommand::CheckCommand(Application& app) : app_(app) {}

void CheckCommand::setupCommand(CLI::App* cmd) {
  cmd->add_option("--at", at_, "Evaluate as of this time (RFC3339, local time if no offset)");
  cmd->add_flag("-n,--dry-run", dry_run_, "List what would fire without notifying");
}

Result<int> CheckCommand::execute(const GlobalOptions& options) {
  auto when = app_.clock().now();
  if (!at_.empty()) {
    auto parsed = util::Time::fromRfc3339(at_);
    if (!parsed) {
      return std::unexpected(makeError(ErrorCode::kInvalidArgument,
                                       "Invalid --at time: " + parsed.error().message()));
    }
    when = *parsed;
  }

  auto& scheduler = app_.scheduler();
  if (dry_run_) {
    auto due = scheduler.preview(when);
    if (!due) {
      return std::unexpected(due.error());
    }
    printResults(*due, when, options);
    return 0;
  }

  printResults(scheduler.sweep(when), when, options);
  return 0;
}

void CheckCommand::printResults(const std::vector<core::FiredNotification>& fired,
                                util::TimePoint when, const GlobalOptions& options) const {
  if (options.json) {
    nlohmann::json output;
    output["checkedAt"] = util::Time::toRfc3339(when);
    output["dryRun"] = dry_run_;
    output["notifications"] = nlohmann::json::array();
    for (const auto& notification : fired) {
      output["notifications"].push_back(core::TaskCodec::toJson(notification));
    }
    std::cout << output.dump(2) << "\n";
    return;
  }

  if (options.quiet) {
    return;
  }

  if (fired.empty()) {
    std::cout << "No reminders due at " << util::Time::formatLocal(when) << "\n";
    return;
  }

  std::cout << (dry_run_ ? "Would notify" : "Notified") << " " << fired.size()
            << " task(s) at " << util::Time::formatLocal(when) << ":\n";
  for (const auto& notification : fired) {
    std::cout << "  [L" << notification.level << "] "
              << notify::NotificationDispatcher::alertTitle(notification) << " - "
              << notification.title << " (" << notification.task_id << ")\n";
  }
}

}  // namespace tasknag::cli
