#include "tasknag/core/task.hpp"

#include <charconv>
#include <cstdio>

namespace tasknag::core {

std::string_view toString(TaskStatus status) {
  switch (status) {
    case TaskStatus::kInbox: return "inbox";
    case TaskStatus::kTodo: return "todo";
    case TaskStatus::kInProgress: return "in_progress";
    case TaskStatus::kDone: return "done";
  }
  return "todo";
}

Result<TaskStatus> parseTaskStatus(std::string_view str) {
  if (str == "inbox") return TaskStatus::kInbox;
  if (str == "todo") return TaskStatus::kTodo;
  if (str == "in_progress") return TaskStatus::kInProgress;
  if (str == "done") return TaskStatus::kDone;
  return std::unexpected(makeError(ErrorCode::kParseError,
                                   "Invalid task status: " + std::string(str)));
}

std::string_view toString(NotificationKind kind) {
  switch (kind) {
    case NotificationKind::kNone: return "none";
    case NotificationKind::kDueDate: return "due_date_based";
    case NotificationKind::kRecurring: return "recurring";
  }
  return "none";
}

Result<NotificationKind> parseNotificationKind(std::string_view str) {
  if (str.empty() || str == "none") return NotificationKind::kNone;
  if (str == "due_date_based") return NotificationKind::kDueDate;
  if (str == "recurring") return NotificationKind::kRecurring;
  return std::unexpected(makeError(ErrorCode::kParseError,
                                   "Invalid notification type: " + std::string(str)));
}

Result<TimeOfDay> TimeOfDay::parse(std::string_view str) {
  auto colon = str.find(':');
  if (colon == std::string_view::npos || colon == 0 || colon > 2 || str.size() - colon - 1 != 2) {
    return std::unexpected(makeError(ErrorCode::kParseError,
                                     "Invalid time of day (expected HH:MM): " + std::string(str)));
  }

  TimeOfDay time;
  auto hour_part = str.substr(0, colon);
  auto minute_part = str.substr(colon + 1);
  auto [hour_end, hour_ec] = std::from_chars(hour_part.data(), hour_part.data() + hour_part.size(), time.hour);
  auto [minute_end, minute_ec] = std::from_chars(minute_part.data(), minute_part.data() + minute_part.size(), time.minute);
  if (hour_ec != std::errc() || minute_ec != std::errc() ||
      hour_end != hour_part.data() + hour_part.size() ||
      minute_end != minute_part.data() + minute_part.size()) {
    return std::unexpected(makeError(ErrorCode::kParseError,
                                     "Invalid time of day (expected HH:MM): " + std::string(str)));
  }

  if (time.hour < 0 || time.hour > 23 || time.minute < 0 || time.minute > 59) {
    return std::unexpected(makeError(ErrorCode::kParseError,
                                     "Time of day out of range: " + std::string(str)));
  }
  return time;
}

std::string TimeOfDay::toString() const {
  char buffer[8];
  std::snprintf(buffer, sizeof(buffer), "%02d:%02d", hour, minute);
  return buffer;
}

Result<void> NotificationConfig::validate(bool has_due_date) const {
  if (level < 1 || level > 3) {
    return std::unexpected(makeError(ErrorCode::kConfigError,
                                     "Notification level must be 1, 2 or 3, got " + std::to_string(level)));
  }

  switch (kind) {
    case NotificationKind::kNone:
      return {};

    case NotificationKind::kDueDate:
      if (!has_due_date) {
        return std::unexpected(makeError(ErrorCode::kConfigError,
                                         "Due date reminder configured on a task without a due date"));
      }
      if (days_before < 0) {
        return std::unexpected(makeError(ErrorCode::kConfigError,
                                         "daysBefore must not be negative, got " + std::to_string(days_before)));
      }
      return {};

    case NotificationKind::kRecurring:
      if (days_of_week.empty()) {
        return std::unexpected(makeError(ErrorCode::kConfigError,
                                         "Recurring reminder without any weekday"));
      }
      for (int day : days_of_week) {
        if (day < 0 || day > 6) {
          return std::unexpected(makeError(ErrorCode::kConfigError,
                                           "Weekday out of range (0-6): " + std::to_string(day)));
        }
      }
      if (!time_of_day) {
        return std::unexpected(makeError(ErrorCode::kConfigError,
                                         "Recurring reminder without a time of day"));
      }
      return {};
  }
  return {};
}

}  // namespace tasknag::core
