#pragma once

#include <set>
#include <string>

#include <nlohmann/json.hpp>

#include "tasknag/common.hpp"
#include "tasknag/core/task.hpp"
#include "tasknag/core/task_record.hpp"

namespace tasknag::core {

/**
 * @brief Conversion between persisted task rows/JSON and the task model
 *
 * Every decoder validates the invariants of the model, so a Task produced
 * here is always evaluable.
 */
class TaskCodec {
 public:
  /**
   * @brief Decode a persisted row into a Task
   * @return The task, or kParseError/kConfigError describing the first problem
   */
  static Result<Task> decode(const TaskRecord& record);

  /**
   * @brief Parse a weekday set stored as a JSON array ("[0,1,2]")
   */
  static Result<std::set<int>> decodeDaysOfWeek(const std::string& json_text);
  static std::string encodeDaysOfWeek(const std::set<int>& days);

  /**
   * @brief Notification config in its JSON form
   *        {kind, daysBefore, timeOfDay, daysOfWeek, level}
   */
  static Result<NotificationConfig> decodeNotificationConfig(const nlohmann::json& json);
  static nlohmann::json encodeNotificationConfig(const NotificationConfig& config);

  /**
   * @brief Browser action settings in their JSON form
   *        {enabled, actions: [{id, label, url, enabled, order, createdAt}]}
   */
  static Result<BrowserActionSettings> decodeBrowserActions(const nlohmann::json& json);
  static Result<BrowserActionSettings> decodeBrowserActions(const std::string& json_text);
  static nlohmann::json encodeBrowserActions(const BrowserActionSettings& settings);

  static nlohmann::json toJson(const FiredNotification& notification);

  // Build a persisted row from a task, the inverse of decode()
  static TaskRecord toRecord(const Task& task);
};

}  // namespace tasknag::core
