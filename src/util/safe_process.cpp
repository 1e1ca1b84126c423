#include "tasknag/util/safe_process.hpp"

#include <unistd.h>
#include <sys/wait.h>
#include <spawn.h>
#include <signal.h>
#include <sys/stat.h>
#include <fcntl.h>

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <memory>
#include <sstream>
#include <thread>

extern char **environ;

namespace tasknag::util {

namespace {

  /**
   * @brief Read all data from file descriptor with bounds checking
   */
  std::string readFromFd(int fd) {
    std::string result;
    constexpr size_t BUFFER_SIZE = 4096;
    constexpr size_t MAX_OUTPUT_SIZE = 1024 * 1024; // 1MB limit
    char buffer[BUFFER_SIZE];
    ssize_t bytes_read;

    while ((bytes_read = read(fd, buffer, sizeof(buffer))) > 0) {
      if (result.size() + static_cast<size_t>(bytes_read) > MAX_OUTPUT_SIZE) {
        size_t remaining = MAX_OUTPUT_SIZE - result.size();
        if (remaining > 0) {
          result.append(buffer, remaining);
        }
        break;
      }
      result.append(buffer, static_cast<size_t>(bytes_read));
    }

    return result;
  }

  void safeClose(int fd) {
    if (fd >= 0) {
      close(fd);
    }
  }

  /**
   * @brief Convert vector of strings to char* array for posix_spawn
   */
  class SafeArgvBuilder {
  private:
    std::vector<std::unique_ptr<char[]>> storage_;
    std::vector<char*> argv_;

  public:
    explicit SafeArgvBuilder(const std::vector<std::string>& strings) {
      storage_.reserve(strings.size());
      argv_.reserve(strings.size() + 1);

      for (const auto& str : strings) {
        auto len = str.length() + 1;
        auto buffer = std::make_unique<char[]>(len);
        std::memcpy(buffer.get(), str.c_str(), len);

        argv_.push_back(buffer.get());
        storage_.push_back(std::move(buffer));
      }
      argv_.push_back(nullptr);
    }

    char* const* data() { return argv_.data(); }
  };

  int decodeWaitStatus(int status) {
    if (WIFEXITED(status)) {
      return WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status)) {
      return 128 + WTERMSIG(status);
    }
    return -1;
  }

}

Result<std::string> SafeProcess::prepare(const std::string& command,
                                         const std::vector<std::string>& args) {
  if (!SafeProcess::isValidCommand(command)) {
    return std::unexpected(makeError(ErrorCode::kInvalidArgument,
                                     "Invalid command name: " + command));
  }

  for (const auto& arg : args) {
    if (!SafeProcess::isValidArgument(arg)) {
      return std::unexpected(makeError(ErrorCode::kInvalidArgument,
                                       "Invalid argument: " + arg.substr(0, 50) + "..."));
    }
  }

  auto command_path = findCommand(command);
  if (!command_path.has_value()) {
    return std::unexpected(makeError(ErrorCode::kNotFound,
                                     "Command not found: " + command));
  }
  return *command_path;
}

Result<SafeProcess::ProcessResult> SafeProcess::execute(
    const std::string& command,
    const std::vector<std::string>& args,
    const std::optional<std::string>& working_dir) {
  auto command_path = prepare(command, args);
  if (!command_path) {
    return std::unexpected(command_path.error());
  }

  int stdout_pipe[2] = {-1, -1};
  int stderr_pipe[2] = {-1, -1};

  if (pipe(stdout_pipe) == -1 || pipe(stderr_pipe) == -1) {
    safeClose(stdout_pipe[0]);
    safeClose(stdout_pipe[1]);
    safeClose(stderr_pipe[0]);
    safeClose(stderr_pipe[1]);
    return std::unexpected(makeError(ErrorCode::kSystemError,
                                     "Failed to create pipes: " + std::string(strerror(errno))));
  }

  std::vector<std::string> full_args;
  full_args.push_back(command);
  full_args.insert(full_args.end(), args.begin(), args.end());

  SafeArgvBuilder argv_builder(full_args);

  posix_spawn_file_actions_t file_actions;
  posix_spawn_file_actions_init(&file_actions);
  posix_spawn_file_actions_adddup2(&file_actions, stdout_pipe[1], STDOUT_FILENO);
  posix_spawn_file_actions_adddup2(&file_actions, stderr_pipe[1], STDERR_FILENO);
  posix_spawn_file_actions_addclose(&file_actions, stdout_pipe[0]);
  posix_spawn_file_actions_addclose(&file_actions, stderr_pipe[0]);
  posix_spawn_file_actions_addclose(&file_actions, stdout_pipe[1]);
  posix_spawn_file_actions_addclose(&file_actions, stderr_pipe[1]);

  std::string old_cwd;
  if (working_dir.has_value()) {
    char* cwd = getcwd(nullptr, 0);
    if (cwd) {
      old_cwd = cwd;
      free(cwd);
    }

    if (chdir(working_dir->c_str()) != 0) {
      posix_spawn_file_actions_destroy(&file_actions);
      safeClose(stdout_pipe[0]);
      safeClose(stdout_pipe[1]);
      safeClose(stderr_pipe[0]);
      safeClose(stderr_pipe[1]);
      return std::unexpected(makeError(ErrorCode::kSystemError,
                                       "Failed to change directory: " + std::string(strerror(errno))));
    }
  }

  pid_t pid;
  int spawn_result = posix_spawn(&pid, command_path->c_str(), &file_actions, nullptr,
                                 argv_builder.data(), environ);

  posix_spawn_file_actions_destroy(&file_actions);

  if (!old_cwd.empty() && chdir(old_cwd.c_str()) != 0) {
    old_cwd.clear();
  }

  if (spawn_result != 0) {
    safeClose(stdout_pipe[0]);
    safeClose(stdout_pipe[1]);
    safeClose(stderr_pipe[0]);
    safeClose(stderr_pipe[1]);
    return std::unexpected(makeError(ErrorCode::kProcessError,
                                     "Failed to spawn process: " + std::string(strerror(spawn_result))));
  }

  ProcessResult result;

  safeClose(stdout_pipe[1]);
  safeClose(stderr_pipe[1]);

  result.stdout_output = readFromFd(stdout_pipe[0]);
  result.stderr_output = readFromFd(stderr_pipe[0]);

  safeClose(stdout_pipe[0]);
  safeClose(stderr_pipe[0]);

  int status;
  if (waitpid(pid, &status, 0) == -1) {
    return std::unexpected(makeError(ErrorCode::kSystemError,
                                     "Failed to wait for process: " + std::string(strerror(errno))));
  }

  result.exit_code = decodeWaitStatus(status);
  return result;
}

bool SafeProcess::commandExists(const std::string& command) {
  return findCommand(command).has_value();
}

std::optional<std::string> SafeProcess::findCommand(const std::string& command) {
  if (!SafeProcess::isValidCommand(command)) {
    return std::nullopt;
  }

  // Absolute path
  if (!command.empty() && command.front() == '/') {
    struct stat st;
    if (stat(command.c_str(), &st) == 0 && (st.st_mode & S_IXUSR)) {
      return command;
    }
    return std::nullopt;
  }

  const char* path_env = std::getenv("PATH");
  if (!path_env) {
    return std::nullopt;
  }

  std::string path_str(path_env);
  std::istringstream path_stream(path_str);
  std::string dir;

  while (std::getline(path_stream, dir, ':')) {
    if (dir.empty()) continue;

    std::string full_path = dir + "/" + command;
    struct stat st;
    if (stat(full_path.c_str(), &st) == 0 && (st.st_mode & S_IXUSR)) {
      return full_path;
    }
  }

  return std::nullopt;
}

Result<pid_t> SafeProcess::executeAsync(
    const std::string& command,
    const std::vector<std::string>& args) {
  auto command_path = prepare(command, args);
  if (!command_path) {
    return std::unexpected(command_path.error());
  }

  std::vector<std::string> full_args;
  full_args.push_back(command);
  full_args.insert(full_args.end(), args.begin(), args.end());

  SafeArgvBuilder argv_builder(full_args);

  // Detach from our terminal output; URL handlers tend to be chatty
  posix_spawn_file_actions_t file_actions;
  posix_spawn_file_actions_init(&file_actions);
  posix_spawn_file_actions_addopen(&file_actions, STDOUT_FILENO, "/dev/null", O_WRONLY, 0);
  posix_spawn_file_actions_addopen(&file_actions, STDERR_FILENO, "/dev/null", O_WRONLY, 0);

  pid_t pid;
  int result = posix_spawn(&pid, command_path->c_str(), &file_actions, nullptr,
                           argv_builder.data(), environ);
  posix_spawn_file_actions_destroy(&file_actions);

  if (result != 0) {
    return std::unexpected(makeError(ErrorCode::kProcessError,
                                     "Failed to spawn process: " + std::string(strerror(result))));
  }

  return pid;
}

Result<int> SafeProcess::waitForExit(pid_t pid, std::chrono::milliseconds timeout) {
  constexpr auto kPollInterval = std::chrono::milliseconds(20);
  auto deadline = std::chrono::steady_clock::now() + timeout;

  while (true) {
    int status = 0;
    pid_t waited = waitpid(pid, &status, WNOHANG);
    if (waited == pid) {
      return decodeWaitStatus(status);
    }
    if (waited == -1) {
      return std::unexpected(makeError(ErrorCode::kSystemError,
                                       "Failed to wait for process: " + std::string(strerror(errno))));
    }
    if (std::chrono::steady_clock::now() >= deadline) {
      return std::unexpected(makeError(ErrorCode::kTimeout,
                                       "Process " + std::to_string(pid) + " did not finish within " +
                                       std::to_string(timeout.count()) + "ms"));
    }
    std::this_thread::sleep_for(kPollInterval);
  }
}

bool SafeProcess::reapIfExited(pid_t pid) {
  int status = 0;
  pid_t waited = waitpid(pid, &status, WNOHANG);
  return waited == pid || waited == -1;
}

bool SafeProcess::isValidCommand(const std::string& command) {
  if (command.empty() || command.length() > 255) {
    return false;
  }

  const std::string dangerous_chars = "|&;(){}[]<>*?~$`\"'\\";
  for (char c : command) {
    if (dangerous_chars.find(c) != std::string::npos) {
      return false;
    }
    if (static_cast<unsigned char>(c) < 32) {
      return false;
    }
  }

  // Reject paths with .. to prevent directory traversal
  if (command.find("..") != std::string::npos) {
    return false;
  }

  return true;
}

bool SafeProcess::isValidArgument(const std::string& arg) {
  if (arg.length() > 4096) {
    return false;
  }

  for (char c : arg) {
    unsigned char uc = static_cast<unsigned char>(c);
    if (uc < 32 && c != '\t' && c != '\n' && c != '\r') {
      return false;
    }
  }

  return true;
}

} // namespace tasknag::util
