#pragma once

#include <sys/types.h>

#include <chrono>
#include <mutex>
#include <string>
#include <vector>

#include "tasknag/common.hpp"

namespace tasknag::notify {

// Opens a URL in the platform's default external handler
class UrlOpener {
 public:
  virtual ~UrlOpener() = default;

  /**
   * @brief Open one URL, failing with kTimeout if the handler does not
   *        return within the given time
   */
  virtual Result<void> open(const std::string& url, std::chrono::milliseconds timeout) = 0;

  // Whether the underlying open facility exists on this system
  virtual bool isAvailable() const = 0;
};

/**
 * @brief UrlOpener backed by xdg-open (Linux), open (macOS) or a configured command
 *
 * The URL is passed as a single argv entry through SafeProcess; no shell is
 * involved. Handlers that outlive the timeout are left running and reaped
 * on later calls.
 */
class SystemUrlOpener : public UrlOpener {
 public:
  explicit SystemUrlOpener(std::string command = {});
  ~SystemUrlOpener() override;

  Result<void> open(const std::string& url, std::chrono::milliseconds timeout) override;
  bool isAvailable() const override;

  const std::string& command() const noexcept { return command_; }

  // Platform default opener command
  static std::string defaultCommand();

 private:
  void reapStragglers();

  std::string command_;
  std::mutex stragglers_mutex_;
  std::vector<pid_t> stragglers_;
};

}  // namespace tasknag::notify
