#pragma once

#include <optional>
#include <set>
#include <string>
#include <string_view>

#include "tasknag/common.hpp"
#include "tasknag/core/browser_action.hpp"
#include "tasknag/util/time.hpp"

namespace tasknag::core {

enum class TaskStatus {
  kInbox,
  kTodo,
  kInProgress,
  kDone
};

enum class NotificationKind {
  kNone,
  kDueDate,
  kRecurring
};

std::string_view toString(TaskStatus status);
Result<TaskStatus> parseTaskStatus(std::string_view str);

std::string_view toString(NotificationKind kind);
Result<NotificationKind> parseNotificationKind(std::string_view str);

// Wall-clock time of day, "HH:MM" at the storage boundary
struct TimeOfDay {
  int hour = 0;
  int minute = 0;

  static Result<TimeOfDay> parse(std::string_view str);

  int minuteOfDay() const noexcept { return hour * 60 + minute; }
  std::string toString() const;

  bool operator==(const TimeOfDay& other) const = default;
};

// Declarative reminder schedule of a task
struct NotificationConfig {
  NotificationKind kind = NotificationKind::kNone;
  int days_before = 1;                     // due-date reminders only
  std::optional<TimeOfDay> time_of_day;
  std::set<int> days_of_week;              // 0 = Sunday ... 6 = Saturday
  int level = 1;                           // 1 alert, 2 +sound, 3 +focus and browser actions

  // Check the invariants that make the schedule evaluable
  Result<void> validate(bool has_due_date) const;
};

struct Task {
  std::string id;
  std::string title;
  TaskStatus status = TaskStatus::kTodo;
  std::optional<util::TimePoint> due;
  NotificationConfig notification;
  BrowserActionSettings browser_actions;

  bool isDone() const noexcept { return status == TaskStatus::kDone; }
};

// The decision that a reminder is due now
struct FiredNotification {
  std::string task_id;
  std::string title;
  int level = 1;
  NotificationKind kind = NotificationKind::kNone;
  std::optional<int> days_until_due;
  bool test_mode = false;
};

}  // namespace tasknag::core
