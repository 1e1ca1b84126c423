#pragma once

#include "tasknag/cli/application.hpp"
#include "tasknag/common.hpp"

namespace tasknag::cli {

/**
 * Runs the notification scheduler in the foreground until SIGINT or SIGTERM.
 */
class RunCommand : public Command {
public:
  explicit RunCommand(Application& app);

  void setupCommand(CLI::App* cmd) override;
  Result<int> execute(const GlobalOptions& options) override;

  std::string name() const override { return "run"; }
  std::string description() const override { return "Run the reminder scheduler"; }

private:
  Application& app_;
  bool check_first_ = false;
};

}  // namespace tasknag::cli
