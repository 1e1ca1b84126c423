#include "tasknag/cli/commands/url_command.hpp"

#include <iostream>

#include <nlohmann/json.hpp>

namespace tasknag::cli {

UrlCommand::UrlCommand(Application& app) : app_(app) {}

void UrlCommand::setupCommand(CLI::App* cmd) {
  auto validate_cmd = cmd->add_subcommand("validate", "Validate a URL and show suggestions");
  validate_cmd->add_option("url", url_, "URL to validate")->required();
  validate_cmd->callback([this]() { validate_mode_ = true; });

  auto open_cmd = cmd->add_subcommand("open", "Open a URL in the default browser");
  open_cmd->add_option("url", url_, "URL to open")->required();
  open_cmd->callback([this]() { open_mode_ = true; });

  cmd->require_subcommand(1);
}

Result<int> UrlCommand::execute(const GlobalOptions& options) {
  if (validate_mode_) {
    return executeValidate(options);
  } else if (open_mode_) {
    return executeOpen(options);
  }
  return std::unexpected(makeError(ErrorCode::kInvalidArgument, "No subcommand specified"));
}

Result<int> UrlCommand::executeValidate(const GlobalOptions& options) {
  auto& validator = app_.urlValidator();
  auto result = validator.validate(url_);
  auto suggestions = result.is_valid ? std::vector<std::string>{} : validator.suggestCorrections(url_);
  auto preview = validator.preview(url_);

  if (options.json) {
    nlohmann::json output;
    output["url"] = url_;
    output["isValid"] = result.is_valid;
    output["protocol"] = result.protocol;
    if (result.is_valid) {
      output["host"] = result.host;
      output["normalizedUrl"] = result.normalized_url;
    }
    if (result.error) {
      output["error"] = *result.error;
    }
    output["suggestions"] = suggestions;
    if (preview) {
      output["preview"] = {{"url", preview->url}, {"domain", preview->domain}, {"title", preview->title}};
    }
    std::cout << output.dump(2) << "\n";
    return result.is_valid ? 0 : 1;
  }

  if (result.is_valid) {
    std::cout << "✅ " << result.normalized_url << "\n";
    if (preview) {
      std::cout << "   " << preview->title << "\n";
    }
    return 0;
  }

  std::cout << "❌ " << result.error.value_or("Invalid URL") << "\n";
  if (!suggestions.empty()) {
    std::cout << "Did you mean:\n";
    for (const auto& suggestion : suggestions) {
      std::cout << "  " << suggestion << "\n";
    }
  }
  return 1;
}

Result<int> UrlCommand::executeOpen(const GlobalOptions& options) {
  auto& browser = app_.browserActions();
  if (!browser.isAvailable()) {
    return std::unexpected(makeError(ErrorCode::kExternalToolError, "No URL opener available"));
  }

  auto result = browser.testUrl(url_);
  if (!result) {
    return std::unexpected(result.error());
  }

  if (options.json) {
    nlohmann::json output;
    output["success"] = true;
    output["url"] = url_;
    std::cout << output.dump(2) << "\n";
  } else if (!options.quiet) {
    std::cout << "Opened " << url_ << "\n";
  }
  return 0;
}

}  // namespace tasknag::cli
