#include "tasknag/notify/notification_dispatcher.hpp"

#include <spdlog/spdlog.h>

namespace tasknag::notify {

NotificationDispatcher::NotificationDispatcher(PresentationSink& sink, BrowserActionExecutor& executor)
    : sink_(sink), executor_(executor) {}

std::string NotificationDispatcher::alertTitle(const core::FiredNotification& notification) {
  std::string title;
  switch (notification.kind) {
    case core::NotificationKind::kDueDate: {
      int days = notification.days_until_due.value_or(0);
      if (days <= 0) {
        title = "📅 Due today";
      } else if (days == 1) {
        title = "📅 Due tomorrow";
      } else {
        title = "📅 Due in " + std::to_string(days) + " days";
      }
      break;
    }
    case core::NotificationKind::kRecurring:
      title = "🔔 Recurring reminder";
      break;
    case core::NotificationKind::kNone:
      title = "📋 Reminder";
      break;
  }
  if (notification.test_mode) {
    title += " (test)";
  }
  return title;
}

std::string NotificationDispatcher::alertBody(const core::FiredNotification& notification) {
  return notification.title;
}

Result<void> NotificationDispatcher::fire(const core::FiredNotification& notification,
                                          const core::Task& task) {
  auto alert = sink_.showAlert(alertTitle(notification), alertBody(notification));
  if (!alert) {
    spdlog::error("Alert for task {} could not be shown: {}", notification.task_id,
                  alert.error().message());
    return alert;
  }

  if (notification.level >= 2) {
    auto cue = sink_.playCue();
    if (!cue) {
      spdlog::warn("Sound cue for task {} failed: {}", notification.task_id, cue.error().message());
    }
  }

  if (notification.level >= 3) {
    auto front = sink_.bringToFront();
    if (!front) {
      spdlog::warn("Could not bring window to front for task {}: {}", notification.task_id,
                   front.error().message());
    }

    auto actions = task.browser_actions.enabledActions();
    if (!actions.empty()) {
      spdlog::info("Running {} browser action(s) for task {}", actions.size(), notification.task_id);
      executor_.run(actions);
    }
  }

  spdlog::info("Notified task {} '{}' (kind={}, level={}{})", notification.task_id,
               notification.title, core::toString(notification.kind), notification.level,
               notification.test_mode ? ", test" : "");
  return {};
}

}  // namespace tasknag::notify
