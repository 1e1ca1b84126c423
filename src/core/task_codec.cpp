#include "tasknag/core/task_codec.hpp"

namespace tasknag::core {

namespace {

Error withTaskContext(const std::string& task_id, const Error& error) {
  return makeError(error.code(), "Task " + task_id + ": " + error.message());
}

bool present(const std::optional<std::string>& value) {
  return value.has_value() && !value->empty();
}

}  // namespace

Result<Task> TaskCodec::decode(const TaskRecord& record) {
  Task task;
  task.id = record.id;
  task.title = record.title;

  auto status = parseTaskStatus(record.status);
  if (!status) {
    return std::unexpected(withTaskContext(record.id, status.error()));
  }
  task.status = *status;

  if (present(record.due_date)) {
    auto due = util::Time::fromRfc3339(*record.due_date);
    if (!due) {
      return std::unexpected(withTaskContext(record.id, due.error()));
    }
    task.due = *due;
  }

  auto kind = parseNotificationKind(record.notification_type.value_or("none"));
  if (!kind) {
    return std::unexpected(withTaskContext(record.id, kind.error()));
  }

  NotificationConfig& config = task.notification;
  config.kind = *kind;
  config.days_before = record.notification_days_before.value_or(1);
  config.level = record.notification_level.value_or(1);

  if (present(record.notification_time)) {
    auto time = TimeOfDay::parse(*record.notification_time);
    if (!time) {
      return std::unexpected(withTaskContext(record.id, time.error()));
    }
    config.time_of_day = *time;
  }

  // Weekdays only matter for recurring reminders
  if (config.kind == NotificationKind::kRecurring && present(record.notification_days_of_week)) {
    auto days = decodeDaysOfWeek(*record.notification_days_of_week);
    if (!days) {
      return std::unexpected(withTaskContext(record.id, days.error()));
    }
    config.days_of_week = std::move(*days);
  }

  auto valid = config.validate(task.due.has_value());
  if (!valid) {
    return std::unexpected(withTaskContext(record.id, valid.error()));
  }

  if (present(record.browser_actions)) {
    auto actions = decodeBrowserActions(*record.browser_actions);
    if (!actions) {
      return std::unexpected(withTaskContext(record.id, actions.error()));
    }
    task.browser_actions = std::move(*actions);
  }

  return task;
}

Result<std::set<int>> TaskCodec::decodeDaysOfWeek(const std::string& json_text) {
  nlohmann::json json;
  try {
    json = nlohmann::json::parse(json_text);
  } catch (const nlohmann::json::exception& e) {
    return std::unexpected(makeError(ErrorCode::kParseError,
                                     "Invalid weekday list '" + json_text + "': " + e.what()));
  }

  if (!json.is_array()) {
    return std::unexpected(makeError(ErrorCode::kParseError,
                                     "Weekday list must be a JSON array: " + json_text));
  }

  std::set<int> days;
  for (const auto& element : json) {
    if (!element.is_number_integer()) {
      return std::unexpected(makeError(ErrorCode::kParseError,
                                       "Weekday list must contain integers: " + json_text));
    }
    int day = element.get<int>();
    if (day < 0 || day > 6) {
      return std::unexpected(makeError(ErrorCode::kConfigError,
                                       "Weekday out of range (0-6): " + std::to_string(day)));
    }
    days.insert(day);
  }
  return days;
}

std::string TaskCodec::encodeDaysOfWeek(const std::set<int>& days) {
  nlohmann::json json = nlohmann::json::array();
  for (int day : days) {
    json.push_back(day);
  }
  return json.dump();
}

Result<NotificationConfig> TaskCodec::decodeNotificationConfig(const nlohmann::json& json) {
  if (!json.is_object()) {
    return std::unexpected(makeError(ErrorCode::kParseError,
                                     "Notification config must be a JSON object"));
  }

  NotificationConfig config;
  try {
    auto kind = parseNotificationKind(json.value("kind", std::string("none")));
    if (!kind) {
      return std::unexpected(kind.error());
    }
    config.kind = *kind;

    if (json.contains("daysBefore") && !json["daysBefore"].is_null()) {
      config.days_before = json["daysBefore"].get<int>();
    }
    if (json.contains("timeOfDay") && !json["timeOfDay"].is_null()) {
      auto time = TimeOfDay::parse(json["timeOfDay"].get<std::string>());
      if (!time) {
        return std::unexpected(time.error());
      }
      config.time_of_day = *time;
    }
    if (json.contains("daysOfWeek") && !json["daysOfWeek"].is_null()) {
      auto days = decodeDaysOfWeek(json["daysOfWeek"].dump());
      if (!days) {
        return std::unexpected(days.error());
      }
      config.days_of_week = std::move(*days);
    }
    if (json.contains("level") && !json["level"].is_null()) {
      config.level = json["level"].get<int>();
    }
  } catch (const nlohmann::json::exception& e) {
    return std::unexpected(makeError(ErrorCode::kParseError,
                                     "Invalid notification config: " + std::string(e.what())));
  }

  return config;
}

nlohmann::json TaskCodec::encodeNotificationConfig(const NotificationConfig& config) {
  nlohmann::json json;
  json["kind"] = std::string(toString(config.kind));
  json["daysBefore"] = config.days_before;
  json["timeOfDay"] = config.time_of_day ? nlohmann::json(config.time_of_day->toString())
                                         : nlohmann::json(nullptr);
  json["daysOfWeek"] = nlohmann::json::array();
  for (int day : config.days_of_week) {
    json["daysOfWeek"].push_back(day);
  }
  json["level"] = config.level;
  return json;
}

Result<BrowserActionSettings> TaskCodec::decodeBrowserActions(const nlohmann::json& json) {
  if (!json.is_object()) {
    return std::unexpected(makeError(ErrorCode::kParseError,
                                     "Browser action settings must be a JSON object"));
  }

  try {
    BrowserActionSettings settings(json.value("enabled", false));

    if (!json.contains("actions") || json["actions"].is_null()) {
      return settings;
    }
    if (!json["actions"].is_array()) {
      return std::unexpected(makeError(ErrorCode::kParseError,
                                       "Browser actions must be a JSON array"));
    }

    for (const auto& item : json["actions"]) {
      // Entries past the cap are not part of the configuration
      if (settings.actions().size() >= BrowserActionSettings::kMaxActions) {
        break;
      }

      BrowserAction action;
      action.id = item.at("id").get<std::string>();
      action.label = item.value("label", std::string());
      action.url = item.at("url").get<std::string>();
      action.enabled = item.value("enabled", true);
      action.order = item.value("order", 0);
      if (item.contains("createdAt") && item["createdAt"].is_string()) {
        action.created_at = item["createdAt"].get<std::string>();
      } else if (item.contains("created_at") && item["created_at"].is_string()) {
        action.created_at = item["created_at"].get<std::string>();
      }

      auto added = settings.addAction(std::move(action));
      if (!added) {
        return std::unexpected(added.error());
      }
    }
    return settings;

  } catch (const nlohmann::json::exception& e) {
    return std::unexpected(makeError(ErrorCode::kParseError,
                                     "Invalid browser action settings: " + std::string(e.what())));
  }
}

Result<BrowserActionSettings> TaskCodec::decodeBrowserActions(const std::string& json_text) {
  nlohmann::json json;
  try {
    json = nlohmann::json::parse(json_text);
  } catch (const nlohmann::json::exception& e) {
    return std::unexpected(makeError(ErrorCode::kParseError,
                                     "Invalid browser action JSON: " + std::string(e.what())));
  }
  return decodeBrowserActions(json);
}

nlohmann::json TaskCodec::encodeBrowserActions(const BrowserActionSettings& settings) {
  nlohmann::json json;
  json["enabled"] = settings.enabled();
  json["actions"] = nlohmann::json::array();
  for (const auto& action : settings.actions()) {
    nlohmann::json item;
    item["id"] = action.id;
    item["label"] = action.label;
    item["url"] = action.url;
    item["enabled"] = action.enabled;
    item["order"] = action.order;
    if (action.created_at) {
      item["createdAt"] = *action.created_at;
    }
    json["actions"].push_back(item);
  }
  return json;
}

nlohmann::json TaskCodec::toJson(const FiredNotification& notification) {
  nlohmann::json json;
  json["taskId"] = notification.task_id;
  json["title"] = notification.title;
  json["level"] = notification.level;
  json["kind"] = std::string(toString(notification.kind));
  json["daysUntilDue"] = notification.days_until_due ? nlohmann::json(*notification.days_until_due)
                                                     : nlohmann::json(nullptr);
  if (notification.test_mode) {
    json["test"] = true;
  }
  return json;
}

TaskRecord TaskCodec::toRecord(const Task& task) {
  TaskRecord record;
  record.id = task.id;
  record.title = task.title;
  record.status = std::string(toString(task.status));
  if (task.due) {
    record.due_date = util::Time::toRfc3339(*task.due);
  }

  const auto& config = task.notification;
  record.notification_type = std::string(toString(config.kind));
  record.notification_days_before = config.days_before;
  if (config.time_of_day) {
    record.notification_time = config.time_of_day->toString();
  }
  if (!config.days_of_week.empty()) {
    record.notification_days_of_week = encodeDaysOfWeek(config.days_of_week);
  }
  record.notification_level = config.level;

  if (task.browser_actions.enabled() || !task.browser_actions.actions().empty()) {
    record.browser_actions = encodeBrowserActions(task.browser_actions).dump();
  }
  return record;
}

}  // namespace tasknag::core
