#pragma once

#include <vector>

#include "tasknag/cli/application.hpp"
#include "tasknag/common.hpp"
#include "tasknag/core/task.hpp"

namespace tasknag::cli {

/**
 * Runs a single reminder sweep, optionally as of another instant.
 *
 * With --dry-run the reminders that would fire are listed but nothing is
 * shown on the desktop and no browser action is launched.
 */
class CheckCommand : public Command {
public:
  explicit CheckCommand(Application& app);

  void setupCommand(CLI::App* cmd) override;
  Result<int> execute(const GlobalOptions& options) override;

  std::string name() const override { return "check"; }
  std::string description() const override { return "Check reminders once"; }

private:
  Application& app_;
  std::string at_;
  bool dry_run_ = false;

  void printResults(const std::vector<core::FiredNotification>& fired, util::TimePoint when,
                    const GlobalOptions& options) const;
};

}  // namespace tasknag::cli
