#pragma once

#include <string>

#include "tasknag/cli/application.hpp"
#include "tasknag/common.hpp"

namespace tasknag::cli {

/**
 * Command for managing configuration
 *
 * Subcommands:
 * - get <key>: Get configuration value
 * - set <key> <value>: Set configuration value
 * - list: List all configuration
 * - path: Show configuration file path
 * - validate: Validate current configuration
 * - reset <key>: Reset key to default value
 */
class ConfigCommand : public Command {
public:
  explicit ConfigCommand(Application& app);

  void setupCommand(CLI::App* cmd) override;
  Result<int> execute(const GlobalOptions& options) override;
  bool needsEngine() const override { return false; }

  std::string name() const override { return "config"; }
  std::string description() const override { return "Manage configuration settings"; }

private:
  Application& app_;

  // Subcommand flags
  bool get_mode_ = false;
  bool set_mode_ = false;
  bool list_mode_ = false;
  bool path_mode_ = false;
  bool validate_mode_ = false;
  bool reset_mode_ = false;

  // Command arguments
  std::string key_;
  std::string value_;

  Result<int> executeGet();
  Result<int> executeSet();
  Result<int> executeList();
  Result<int> executePath();
  Result<int> executeValidate();
  Result<int> executeReset();

  Result<int> assignAndSave(const std::string& value);
  void printConfigValue(const std::string& key, const std::string& value, bool json_output);
  bool isValidConfigKey(const std::string& key) const;
};

}  // namespace tasknag::cli
