#pragma once

#include <sys/types.h>

#include <chrono>
#include <optional>
#include <string>
#include <vector>

#include "tasknag/common.hpp"

namespace tasknag::util {

/**
 * @brief Secure process execution utility to replace unsafe system() calls
 *
 * Commands are spawned directly with posix_spawn; no shell ever interprets
 * a URL, a notification title or any other task-provided text.
 */
class SafeProcess {
public:
  /**
   * @brief Result of a process execution
   */
  struct ProcessResult {
    int exit_code;
    std::string stdout_output;
    std::string stderr_output;
    bool success() const { return exit_code == 0; }
  };

  /**
   * @brief Execute a command with arguments safely and wait for it
   * @param command The command to execute (no shell interpretation)
   * @param args Command arguments
   * @param working_dir Optional working directory
   * @return Result of execution or error
   */
  static Result<ProcessResult> execute(
    const std::string& command,
    const std::vector<std::string>& args = {},
    const std::optional<std::string>& working_dir = std::nullopt
  );

  /**
   * @brief Check if a command exists in PATH
   * @param command Command name to check
   * @return true if command exists and is executable
   */
  static bool commandExists(const std::string& command);

  /**
   * @brief Find the full path of a command in PATH
   * @param command Command name to find
   * @return Full path to command or nullopt if not found
   */
  static std::optional<std::string> findCommand(const std::string& command);

  /**
   * @brief Execute a command in the background
   * @param command The command to execute
   * @param args Command arguments
   * @return Process ID or error
   */
  static Result<pid_t> executeAsync(
    const std::string& command,
    const std::vector<std::string>& args = {}
  );

  /**
   * @brief Wait for a background process with a hard deadline
   * @param pid Process started with executeAsync()
   * @param timeout Maximum time to wait
   * @return Exit code, or kTimeout if the process is still running
   */
  static Result<int> waitForExit(pid_t pid, std::chrono::milliseconds timeout);

  /**
   * @brief Reap a background process if it has exited, without blocking
   * @return true if the process is gone (reaped or unknown)
   */
  static bool reapIfExited(pid_t pid);

  /**
   * @brief Validate that a command name is safe for execution
   * @param command Command name to validate
   * @return true if safe to use
   */
  static bool isValidCommand(const std::string& command);

  /**
   * @brief Validate that an argument is safe for execution
   * @param arg Argument to validate
   * @return true if safe to use
   */
  static bool isValidArgument(const std::string& arg);

private:
  SafeProcess() = default;

  static Result<std::string> prepare(const std::string& command,
                                     const std::vector<std::string>& args);
};

} // namespace tasknag::util
