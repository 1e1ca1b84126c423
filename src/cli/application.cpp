#include "tasknag/cli/application.hpp"

#include <algorithm>
#include <iostream>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "tasknag/util/logging.hpp"

// Command includes
#include "tasknag/cli/commands/check_command.hpp"
#include "tasknag/cli/commands/config_command.hpp"
#include "tasknag/cli/commands/run_command.hpp"
#include "tasknag/cli/commands/test_notify_command.hpp"
#include "tasknag/cli/commands/url_command.hpp"

namespace tasknag::cli {

Application::Application()
    : app_("tasknag", "Task reminder notification engine") {
  app_.set_version_flag("--version", tasknag::getVersion().toString());
  app_.set_help_all_flag("--help-all", "Expand all help");
  app_.require_subcommand(1);

  setupGlobalOptions();
  setupCommands();
  setupHelp();
}

Application::~Application() {
  if (scheduler_) {
    scheduler_->stop();
  }
}

int Application::run(int argc, char* argv[]) {
  try {
    app_.parse(argc, argv);
  } catch (const CLI::ParseError& e) {
    return app_.exit(e);
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }

  // The command has already been executed by CLI11's callback system
  return 0;
}

void Application::setupGlobalOptions() {
  app_.add_flag("--json", global_options_.json, "Output in JSON format");
  app_.add_flag("-v,--verbose", global_options_.verbose, "Verbose output");
  app_.add_flag("-q,--quiet", global_options_.quiet, "Suppress normal output");
  app_.add_option("--config", global_options_.config_file, "Path to config file");
  app_.add_option("--db", global_options_.db_path, "Override task database path");
  app_.add_flag("--console", global_options_.console, "Print alerts to the terminal instead of the desktop");
}

void Application::setupCommands() {
  // Notification engine
  registerCommand(std::make_unique<RunCommand>(*this));
  registerCommand(std::make_unique<CheckCommand>(*this));
  registerCommand(std::make_unique<TestNotifyCommand>(*this));

  // Browser actions
  registerCommand(std::make_unique<UrlCommand>(*this));

  // Configuration management
  registerCommand(std::make_unique<ConfigCommand>(*this));
}

void Application::setupHelp() {
  app_.get_formatter()->column_width(40);

  app_.footer(R"(Examples:
  tasknag run                          # Check reminders every 15 minutes
  tasknag check --dry-run --json       # What would fire right now
  tasknag check --at 2025-01-15T09:00:00
  tasknag test-notify --console
  tasknag url validate docs.google.com
  tasknag config set scheduler.interval_minutes 30

For more information on a specific command, run:
  tasknag <command> --help)");
}

void Application::registerCommand(std::unique_ptr<Command> command) {
  auto* cmd_ptr = command.get();

  auto* sub = app_.add_subcommand(cmd_ptr->name(), cmd_ptr->description());
  cmd_ptr->setupCommand(sub);

  sub->callback([this, cmd_ptr]() {
    auto init_result = initializeConfig();
    if (init_result && cmd_ptr->needsEngine()) {
      init_result = initializeEngine();
    }
    if (!init_result.has_value()) {
      reportError(init_result.error());
      throw CLI::RuntimeError(1);
    }

    auto result = cmd_ptr->execute(global_options_);
    if (!result.has_value()) {
      reportError(result.error());
      throw CLI::RuntimeError(1);
    }
    if (*result != 0) {
      throw CLI::RuntimeError(*result);
    }
  });

  commands_.push_back(std::move(command));
}

void Application::reportError(const Error& error) const {
  if (global_options_.json) {
    nlohmann::json output;
    output["error"] = error.message();
    output["code"] = static_cast<int>(error.code());
    std::cout << output.dump() << "\n";
  } else {
    std::cerr << "Error: " << error.message() << "\n";
  }
}

Result<void> Application::initializeConfig() {
  if (config_) {
    return {};
  }

  auto config = std::make_unique<config::Config>();

  std::filesystem::path config_path = global_options_.config_file.empty()
                                          ? config::Config::defaultConfigPath()
                                          : std::filesystem::path(global_options_.config_file);
  // An explicit --config must exist; the default location is optional
  if (!global_options_.config_file.empty() || std::filesystem::exists(config_path)) {
    auto load_result = config->load(config_path);
    if (!load_result) {
      return std::unexpected(load_result.error());
    }
  }

  if (!global_options_.db_path.empty()) {
    config->storage.database = global_options_.db_path;
  }

  util::LogSettings log_settings;
  log_settings.level = global_options_.verbose >= 1 ? "debug" : config->logging.level;
  log_settings.file = config->logging.file;
  log_settings.max_size_mb = static_cast<size_t>(std::max(config->logging.max_size_mb, 1));
  log_settings.max_files = static_cast<size_t>(std::max(config->logging.max_files, 1));
  log_settings.quiet = global_options_.quiet;
  util::setupLogging(log_settings);

  notify::UrlValidator::Options url_options;
  url_options.max_length = config->url.max_length;
  url_options.allowed_protocols = config->url.allowed_protocols;
  url_options.blocked_protocols = config->url.blocked_protocols;
  url_validator_ = std::make_unique<notify::UrlValidator>(std::move(url_options));

  clock_ = std::make_unique<util::SystemClock>();
  config_ = std::move(config);
  return {};
}

Result<void> Application::initializeEngine() {
  if (scheduler_) {
    return {};
  }

  auto valid = config_->validate();
  if (!valid) {
    return std::unexpected(valid.error());
  }
  if (config_->scheduler.tolerance_minutes > config_->scheduler.interval_minutes) {
    spdlog::warn("Tolerance ({} min) exceeds the check interval ({} min); reminders may fire twice",
                 config_->scheduler.tolerance_minutes, config_->scheduler.interval_minutes);
  }

  auto source = std::make_unique<store::SqliteTaskSource>(config_->storage.database);
  auto init_result = source->initialize();
  if (!init_result) {
    return std::unexpected(init_result.error());
  }
  task_source_ = std::move(source);

  url_opener_ = std::make_unique<notify::SystemUrlOpener>(config_->resolveEnvVar(config_->browser.opener));

  notify::BrowserActionExecutor::Options executor_options;
  executor_options.open_timeout = std::chrono::milliseconds(config_->browser.open_timeout_ms);
  executor_options.pacing = std::chrono::milliseconds(config_->browser.pacing_ms);
  browser_actions_ = std::make_unique<notify::BrowserActionExecutor>(
      *url_opener_, *url_validator_, *clock_, executor_options);

  if (global_options_.console) {
    // stdout is reserved for the JSON document
    presentation_ = std::make_unique<notify::ConsolePresentationSink>(
        global_options_.json ? std::cerr : std::cout);
  } else {
    notify::DesktopPresentationSink::Options sink_options;
    sink_options.app_name = config_->alert.app_name;
    sink_options.notifier = config_->resolveEnvVar(config_->alert.notifier);
    sink_options.sound_command = config_->resolveEnvVar(config_->alert.sound_command);
    sink_options.sound_args = config_->alert.sound_args;
    sink_options.focus_command = config_->resolveEnvVar(config_->alert.focus_command);
    sink_options.focus_args = config_->alert.focus_args;
    presentation_ = std::make_unique<notify::DesktopPresentationSink>(std::move(sink_options));
  }

  dispatcher_ = std::make_unique<notify::NotificationDispatcher>(*presentation_, *browser_actions_);
  evaluator_ = std::make_unique<notify::NotificationEvaluator>(
      std::chrono::minutes(config_->scheduler.tolerance_minutes));

  notify::NotificationScheduler::Options scheduler_options;
  scheduler_options.interval = std::chrono::minutes(config_->scheduler.interval_minutes);
  scheduler_options.align_to_boundary = config_->scheduler.align_to_boundary;
  // Shared by `run` and `check` so their sweeps never overlap
  scheduler_options.lock_file = task_source_->path();
  scheduler_options.lock_file += ".lock";
  scheduler_ = std::make_unique<notify::NotificationScheduler>(
      *task_source_, *evaluator_, *dispatcher_, *clock_, scheduler_options);

  spdlog::debug("Engine ready (database {})", task_source_->path().string());
  return {};
}

const GlobalOptions& Application::globalOptions() const {
  return global_options_;
}

config::Config& Application::config() {
  if (!config_) {
    throw std::runtime_error("Configuration not loaded");
  }
  return *config_;
}

util::Clock& Application::clock() {
  if (!clock_) {
    throw std::runtime_error("Services not initialized");
  }
  return *clock_;
}

notify::UrlValidator& Application::urlValidator() {
  if (!url_validator_) {
    throw std::runtime_error("Services not initialized");
  }
  return *url_validator_;
}

notify::BrowserActionExecutor& Application::browserActions() {
  if (!browser_actions_) {
    throw std::runtime_error("Services not initialized");
  }
  return *browser_actions_;
}

notify::NotificationScheduler& Application::scheduler() {
  if (!scheduler_) {
    throw std::runtime_error("Services not initialized");
  }
  return *scheduler_;
}

store::SqliteTaskSource& Application::taskSource() {
  if (!task_source_) {
    throw std::runtime_error("Services not initialized");
  }
  return *task_source_;
}

} // namespace tasknag::cli
