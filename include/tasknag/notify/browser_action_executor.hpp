#pragma once

#include <chrono>
#include <string>
#include <vector>

#include "tasknag/common.hpp"
#include "tasknag/core/browser_action.hpp"
#include "tasknag/notify/url_opener.hpp"
#include "tasknag/notify/url_validator.hpp"
#include "tasknag/util/clock.hpp"

namespace tasknag::notify {

/**
 * @brief Opens a task's browser actions with per-URL isolation
 *
 * Actions run in ascending order. Invalid URLs are skipped, failed or slow
 * launches are logged and the next action still runs, and launches are
 * paced so the desktop is not flooded with handler processes.
 */
class BrowserActionExecutor {
 public:
  struct Options {
    std::chrono::milliseconds open_timeout{3000};
    std::chrono::milliseconds pacing{500};
  };

  BrowserActionExecutor(UrlOpener& opener, const UrlValidator& validator, util::Clock& clock);
  BrowserActionExecutor(UrlOpener& opener, const UrlValidator& validator, util::Clock& clock,
                        Options options);

  // Best-effort run over all enabled actions; never fails
  void run(const std::vector<core::BrowserAction>& actions);

  /**
   * @brief Run a single action and report why it did not open
   * @return kSecurityError for a rejected URL, the opener's error otherwise.
   *         A disabled action is a successful no-op.
   */
  Result<void> runOne(const core::BrowserAction& action);

  // Validate and open a raw URL ("test this URL")
  Result<void> testUrl(const std::string& url);

  bool isAvailable() const { return opener_.isAvailable(); }

  const Options& options() const noexcept { return options_; }

 private:
  Result<void> openValidated(const std::string& url);

  UrlOpener& opener_;
  const UrlValidator& validator_;
  util::Clock& clock_;
  Options options_;
};

}  // namespace tasknag::notify
