#pragma once

#include <string>

#include "tasknag/common.hpp"
#include "tasknag/core/task.hpp"
#include "tasknag/notify/browser_action_executor.hpp"
#include "tasknag/notify/presentation_sink.hpp"

namespace tasknag::notify {

/**
 * @brief Turns a fire decision into user-visible side effects
 *
 * Level 1 shows an alert, level 2 adds the audible cue, level 3 also raises
 * the window and runs the task's enabled browser actions. Only the alert can
 * fail the dispatch; everything after it is best-effort.
 */
class NotificationDispatcher {
 public:
  NotificationDispatcher(PresentationSink& sink, BrowserActionExecutor& executor);

  Result<void> fire(const core::FiredNotification& notification, const core::Task& task);

  static std::string alertTitle(const core::FiredNotification& notification);
  static std::string alertBody(const core::FiredNotification& notification);

 private:
  PresentationSink& sink_;
  BrowserActionExecutor& executor_;
};

}  // namespace tasknag::notify
