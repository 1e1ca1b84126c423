#pragma once

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include <CLI/CLI.hpp>

#include "tasknag/common.hpp"
#include "tasknag/config/config.hpp"
#include "tasknag/notify/browser_action_executor.hpp"
#include "tasknag/notify/notification_dispatcher.hpp"
#include "tasknag/notify/notification_evaluator.hpp"
#include "tasknag/notify/notification_scheduler.hpp"
#include "tasknag/notify/presentation_sink.hpp"
#include "tasknag/notify/url_opener.hpp"
#include "tasknag/notify/url_validator.hpp"
#include "tasknag/store/sqlite_task_source.hpp"
#include "tasknag/util/clock.hpp"

namespace tasknag::cli {

/**
 * @brief Global CLI options that are available to all commands
 */
struct GlobalOptions {
  bool json = false;           // --json: Output in JSON format
  int verbose = 0;             // --verbose: Verbose output level (can be repeated: -v, -vv)
  bool quiet = false;          // --quiet: Suppress normal output
  std::string config_file;     // --config: Path to config file
  std::string db_path;         // --db: Override task database path
  bool console = false;        // --console: Print alerts to stdout instead of the desktop
};

/**
 * @brief Base class for all CLI commands
 */
class Command {
public:
  virtual ~Command() = default;

  /**
   * @brief Execute the command with the given arguments
   * @param options Global CLI options
   * @return Result with exit code (0 = success)
   */
  virtual Result<int> execute(const GlobalOptions& options) = 0;

  virtual std::string name() const = 0;
  virtual std::string description() const = 0;

  /**
   * @brief Setup command-specific CLI options (optional override)
   */
  virtual void setupCommand(CLI::App* cmd) { (void)cmd; }

  /**
   * @brief Whether the command needs the task database and delivery services
   */
  virtual bool needsEngine() const { return true; }
};

/**
 * @brief Main CLI application
 *
 * Owns the configuration and the notification engine. Configuration and
 * logging are set up before every command; the engine (database, scheduler,
 * presentation) only for commands that ask for it.
 */
class Application {
public:
  Application();
  ~Application();

  Application(const Application&) = delete;
  Application& operator=(const Application&) = delete;

  /**
   * @brief Run the application with command line arguments
   * @return Exit code (0 = success)
   */
  int run(int argc, char* argv[]);

  // Service accessors for commands
  const GlobalOptions& globalOptions() const;
  config::Config& config();
  util::Clock& clock();
  notify::UrlValidator& urlValidator();
  notify::BrowserActionExecutor& browserActions();
  notify::NotificationScheduler& scheduler();
  store::SqliteTaskSource& taskSource();

private:
  void setupGlobalOptions();
  void setupCommands();
  void setupHelp();

  void registerCommand(std::unique_ptr<Command> command);

  Result<void> initializeConfig();
  Result<void> initializeEngine();

  void reportError(const Error& error) const;

  // CLI framework
  CLI::App app_;
  GlobalOptions global_options_;

  // Services, in construction order
  std::unique_ptr<config::Config> config_;
  std::unique_ptr<util::SystemClock> clock_;
  std::unique_ptr<notify::UrlValidator> url_validator_;
  std::unique_ptr<store::SqliteTaskSource> task_source_;
  std::unique_ptr<notify::UrlOpener> url_opener_;
  std::unique_ptr<notify::BrowserActionExecutor> browser_actions_;
  std::unique_ptr<notify::PresentationSink> presentation_;
  std::unique_ptr<notify::NotificationDispatcher> dispatcher_;
  std::unique_ptr<notify::NotificationEvaluator> evaluator_;
  std::unique_ptr<notify::NotificationScheduler> scheduler_;

  // Registered commands
  std::vector<std::unique_ptr<Command>> commands_;
};

} // namespace tasknag::cli
