#pragma once

#include <optional>
#include <string>

namespace tasknag::core {

// A task row exactly as persisted, before any decoding. Keeping the raw
// shape lets a malformed row be skipped without affecting its neighbours.
struct TaskRecord {
  std::string id;
  std::string title;
  std::string status;
  std::optional<std::string> due_date;                   // RFC3339
  std::optional<std::string> notification_type;          // none | due_date_based | recurring
  std::optional<int> notification_days_before;
  std::optional<std::string> notification_time;          // HH:MM
  std::optional<std::string> notification_days_of_week;  // JSON array, e.g. "[1,3,5]"
  std::optional<int> notification_level;
  std::optional<std::string> browser_actions;            // JSON object
  std::optional<std::string> created_at;
};

}  // namespace tasknag::core
