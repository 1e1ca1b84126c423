#pragma once

#include "tasknag/cli/application.hpp"
#include "tasknag/common.hpp"

namespace tasknag::cli {

/**
 * Command for checking browser action URLs
 *
 * Subcommands:
 * - validate <url>: Validate, normalize and preview a URL
 * - open <url>: Validate and open a URL the way a reminder would
 */
class UrlCommand : public Command {
public:
  explicit UrlCommand(Application& app);

  void setupCommand(CLI::App* cmd) override;
  Result<int> execute(const GlobalOptions& options) override;
  bool needsEngine() const override { return open_mode_; }

  std::string name() const override { return "url"; }
  std::string description() const override { return "Validate or open browser action URLs"; }

private:
  Application& app_;

  bool validate_mode_ = false;
  bool open_mode_ = false;
  std::string url_;

  Result<int> executeValidate(const GlobalOptions& options);
  Result<int> executeOpen(const GlobalOptions& options);
};

}  // namespace tasknag::cli
