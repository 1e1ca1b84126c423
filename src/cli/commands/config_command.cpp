#include "tasknag/cli/commands/config_command.hpp"

#include <algorithm>
#include <filesystem>
#include <iomanip>
#include <iostream>

#include <nlohmann/json.hpp>

namespace tasknag::cli {

ConfigCommand::ConfigCommand(Application& app) : app_(app) {}

void ConfigCommand::setupCommand(CLI::App* cmd) {
  auto get_cmd = cmd->add_subcommand("get", "Get configuration value");
  get_cmd->add_option("key", key_, "Configuration key (dot notation)")->required();
  get_cmd->callback([this]() { get_mode_ = true; });

  auto set_cmd = cmd->add_subcommand("set", "Set configuration value");
  set_cmd->add_option("key", key_, "Configuration key (dot notation)")->required();
  set_cmd->add_option("value", value_, "Configuration value")->required();
  set_cmd->callback([this]() { set_mode_ = true; });

  auto list_cmd = cmd->add_subcommand("list", "List all configuration settings");
  list_cmd->callback([this]() { list_mode_ = true; });

  auto path_cmd = cmd->add_subcommand("path", "Show configuration file path");
  path_cmd->callback([this]() { path_mode_ = true; });

  auto validate_cmd = cmd->add_subcommand("validate", "Validate current configuration");
  validate_cmd->callback([this]() { validate_mode_ = true; });

  auto reset_cmd = cmd->add_subcommand("reset", "Reset configuration key to default value");
  reset_cmd->add_option("key", key_, "Configuration key to reset")->required();
  reset_cmd->callback([this]() { reset_mode_ = true; });

  cmd->require_subcommand(1);
}

Result<int> ConfigCommand::execute(const GlobalOptions& options) {
  (void)options;
  if (get_mode_) {
    return executeGet();
  } else if (set_mode_) {
    return executeSet();
  } else if (list_mode_) {
    return executeList();
  } else if (path_mode_) {
    return executePath();
  } else if (validate_mode_) {
    return executeValidate();
  } else if (reset_mode_) {
    return executeReset();
  }

  return std::unexpected(makeError(ErrorCode::kInvalidArgument, "No subcommand specified"));
}

Result<int> ConfigCommand::executeGet() {
  if (!isValidConfigKey(key_)) {
    return std::unexpected(makeError(ErrorCode::kInvalidArgument, "Invalid configuration key: " + key_));
  }

  auto result = app_.config().get(key_);
  if (!result.has_value()) {
    return std::unexpected(result.error());
  }

  printConfigValue(key_, *result, app_.globalOptions().json);
  return 0;
}

Result<int> ConfigCommand::executeSet() {
  if (!isValidConfigKey(key_)) {
    return std::unexpected(makeError(ErrorCode::kInvalidArgument, "Invalid configuration key: " + key_));
  }
  return assignAndSave(value_);
}

Result<int> ConfigCommand::executeReset() {
  if (!isValidConfigKey(key_)) {
    return std::unexpected(makeError(ErrorCode::kInvalidArgument, "Invalid configuration key: " + key_));
  }

  config::Config defaults;
  auto default_value = defaults.get(key_);
  if (!default_value.has_value()) {
    return std::unexpected(default_value.error());
  }
  return assignAndSave(*default_value);
}

Result<int> ConfigCommand::assignAndSave(const std::string& value) {
  auto& config = app_.config();

  auto result = config.set(key_, value);
  if (!result.has_value()) {
    return std::unexpected(result.error());
  }

  // Refuse to persist a combination the engine would reject at startup
  auto valid = config.validate();
  if (!valid.has_value()) {
    return std::unexpected(valid.error());
  }

  auto save_result = config.save();
  if (!save_result.has_value()) {
    return std::unexpected(makeError(save_result.error().code(),
                                     "Failed to save configuration: " + save_result.error().message()));
  }

  if (app_.globalOptions().json) {
    nlohmann::json output;
    output["success"] = true;
    output["key"] = key_;
    output["value"] = value;
    std::cout << output.dump(2) << "\n";
  } else if (!app_.globalOptions().quiet) {
    std::cout << "✅ Configuration updated: " << key_ << " = " << value << "\n";
  }
  return 0;
}

Result<int> ConfigCommand::executeList() {
  auto& config = app_.config();
  auto keys = config::Config::keys();

  if (app_.globalOptions().json) {
    nlohmann::json output;
    for (const auto& key : keys) {
      auto result = config.get(key);
      if (result.has_value()) {
        output[key] = *result;
      }
    }
    std::cout << output.dump(2) << "\n";
    return 0;
  }

  std::string section;
  for (const auto& key : keys) {
    auto dot = key.find('.');
    auto key_section = key.substr(0, dot);
    if (key_section != section) {
      std::cout << (section.empty() ? "" : "\n") << "[" << key_section << "]\n";
      section = key_section;
    }
    auto result = config.get(key);
    if (result.has_value()) {
      std::cout << "  " << std::setw(20) << std::left << key.substr(dot + 1) << " = " << *result << "\n";
    }
  }
  return 0;
}

Result<int> ConfigCommand::executePath() {
  const auto& config_path = app_.config().path();

  if (app_.globalOptions().json) {
    nlohmann::json output;
    output["config_path"] = config_path.string();
    output["exists"] = std::filesystem::exists(config_path);
    std::cout << output.dump(2) << "\n";
  } else {
    std::cout << "Configuration file: " << config_path.string() << "\n";
    if (std::filesystem::exists(config_path)) {
      std::cout << "Status: ✅ File exists\n";
    } else {
      std::cout << "Status: ⚠️  File not found (using defaults)\n";
    }
  }
  return 0;
}

Result<int> ConfigCommand::executeValidate() {
  auto result = app_.config().validate();

  if (app_.globalOptions().json) {
    nlohmann::json output;
    output["valid"] = result.has_value();
    if (!result.has_value()) {
      output["error"] = result.error().message();
    }
    std::cout << output.dump(2) << "\n";
  } else if (result.has_value()) {
    std::cout << "✅ Configuration is valid\n";
  } else {
    std::cout << "❌ Configuration validation failed: " << result.error().message() << "\n";
  }
  return result.has_value() ? 0 : 1;
}

void ConfigCommand::printConfigValue(const std::string& key, const std::string& value, bool json_output) {
  if (json_output) {
    nlohmann::json output;
    output["key"] = key;
    output["value"] = value;
    std::cout << output.dump(2) << "\n";
  } else {
    std::cout << key << " = " << value << "\n";
  }
}

bool ConfigCommand::isValidConfigKey(const std::string& key) const {
  auto valid_keys = config::Config::keys();
  return std::find(valid_keys.begin(), valid_keys.end(), key) != valid_keys.end();
}

}  // namespace tasknag::cli
