#include <gtest/gtest.h>

#include "tasknag/core/task_codec.hpp"
#include "test_helpers.hpp"

using namespace tasknag::core;
using namespace tasknag::test;
using tasknag::ErrorCode;

class TaskCodecTest : public ::testing::Test {
protected:
  TaskRecord dueRecord() {
    TaskRecord record;
    record.id = "t1";
    record.title = "Submit report";
    record.status = "todo";
    record.due_date = "2025-03-10T15:00:00Z";
    record.notification_type = "due_date_based";
    record.notification_days_before = 2;
    record.notification_time = "09:30";
    record.notification_level = 2;
    return record;
  }
};

TEST_F(TaskCodecTest, DecodesDueDateReminder) {
  auto task = TaskCodec::decode(dueRecord());
  ASSERT_OK(task);

  EXPECT_EQ(task->id, "t1");
  EXPECT_EQ(task->title, "Submit report");
  EXPECT_EQ(task->status, TaskStatus::kTodo);
  ASSERT_TRUE(task->due.has_value());
  EXPECT_EQ(tasknag::util::Time::toRfc3339(*task->due), "2025-03-10T15:00:00.000Z");
  EXPECT_EQ(task->notification.kind, NotificationKind::kDueDate);
  EXPECT_EQ(task->notification.days_before, 2);
  ASSERT_TRUE(task->notification.time_of_day.has_value());
  EXPECT_EQ(*task->notification.time_of_day, (TimeOfDay{9, 30}));
  EXPECT_EQ(task->notification.level, 2);
}

TEST_F(TaskCodecTest, MissingDaysBeforeAndLevelDefaultToOne) {
  auto record = dueRecord();
  record.notification_days_before.reset();
  record.notification_level.reset();

  auto task = TaskCodec::decode(record);
  ASSERT_OK(task);
  EXPECT_EQ(task->notification.days_before, 1);
  EXPECT_EQ(task->notification.level, 1);
}

TEST_F(TaskCodecTest, MissingTypeMeansNoReminder) {
  TaskRecord record;
  record.id = "plain";
  record.title = "No reminder";
  record.status = "inbox";

  auto task = TaskCodec::decode(record);
  ASSERT_OK(task);
  EXPECT_EQ(task->notification.kind, NotificationKind::kNone);
  EXPECT_EQ(task->status, TaskStatus::kInbox);
}

TEST_F(TaskCodecTest, DecodesRecurringWeekdays) {
  auto task = TaskCodec::decode(makeRecurringRecord("r1", "[5, 1, 3, 1]", "9:00"));
  ASSERT_OK(task);
  EXPECT_EQ(task->notification.kind, NotificationKind::kRecurring);
  EXPECT_EQ(task->notification.days_of_week, (std::set<int>{1, 3, 5}));
  EXPECT_EQ(task->notification.time_of_day->toString(), "09:00");
}

TEST_F(TaskCodecTest, MalformedWeekdayJsonIsParseError) {
  auto task = TaskCodec::decode(makeRecurringRecord("r1", "[1, 3", "09:00"));
  EXPECT_ERROR(task, ErrorCode::kParseError);
  EXPECT_NE(task.error().message().find("Task r1"), std::string::npos);
}

TEST_F(TaskCodecTest, WeekdayOutOfRangeIsRejected) {
  EXPECT_ERROR(TaskCodec::decodeDaysOfWeek("[7]"), ErrorCode::kConfigError);
  EXPECT_ERROR(TaskCodec::decodeDaysOfWeek("[-1]"), ErrorCode::kConfigError);
  EXPECT_ERROR(TaskCodec::decodeDaysOfWeek("[\"mon\"]"), ErrorCode::kParseError);
  EXPECT_ERROR(TaskCodec::decodeDaysOfWeek("{\"day\": 1}"), ErrorCode::kParseError);
}

TEST_F(TaskCodecTest, MalformedTimeIsRejected) {
  for (const auto* bad : {"25:00", "12:60", "noon", "12", "12:5x"}) {
    auto record = dueRecord();
    record.notification_time = bad;
    EXPECT_FALSE(TaskCodec::decode(record).has_value()) << bad;
  }
}

TEST_F(TaskCodecTest, DueDateReminderWithoutDueDateIsConfigError) {
  auto record = dueRecord();
  record.due_date.reset();
  EXPECT_ERROR(TaskCodec::decode(record), ErrorCode::kConfigError);
}

TEST_F(TaskCodecTest, RecurringWithoutWeekdaysIsConfigError) {
  auto record = makeRecurringRecord("r1", "[]", "09:00");
  EXPECT_ERROR(TaskCodec::decode(record), ErrorCode::kConfigError);
}

TEST_F(TaskCodecTest, LevelOutsideRangeIsConfigError) {
  auto record = dueRecord();
  record.notification_level = 4;
  EXPECT_ERROR(TaskCodec::decode(record), ErrorCode::kConfigError);
}

TEST_F(TaskCodecTest, UnknownStatusIsParseError) {
  auto record = dueRecord();
  record.status = "archived";
  EXPECT_ERROR(TaskCodec::decode(record), ErrorCode::kParseError);
}

TEST_F(TaskCodecTest, DecodesBrowserActionsInOrder) {
  auto record = dueRecord();
  record.notification_level = 3;
  record.browser_actions = R"({
    "enabled": true,
    "actions": [
      {"id": "b", "label": "Docs", "url": "https://docs.example.com", "enabled": true, "order": 2},
      {"id": "a", "label": "Board", "url": "https://board.example.com", "enabled": false, "order": 1,
       "createdAt": "2025-01-01T00:00:00Z"}
    ]
  })";

  auto task = TaskCodec::decode(record);
  ASSERT_OK(task);
  const auto& actions = task->browser_actions.actions();
  ASSERT_EQ(actions.size(), 2u);
  EXPECT_EQ(actions[0].id, "a");
  EXPECT_FALSE(actions[0].enabled);
  EXPECT_EQ(actions[0].created_at.value_or(""), "2025-01-01T00:00:00Z");
  EXPECT_EQ(actions[1].id, "b");
  ASSERT_EQ(task->browser_actions.enabledActions().size(), 1u);
}

TEST_F(TaskCodecTest, BrowserActionsBeyondCapAreDropped) {
  nlohmann::json json;
  json["enabled"] = true;
  for (int i = 0; i < 7; ++i) {
    json["actions"].push_back({{"id", "a" + std::to_string(i)},
                               {"url", "https://example.com/" + std::to_string(i)},
                               {"order", i}});
  }

  auto settings = TaskCodec::decodeBrowserActions(json);
  ASSERT_OK(settings);
  ASSERT_EQ(settings->actions().size(), BrowserActionSettings::kMaxActions);
  EXPECT_EQ(settings->actions().back().id, "a4");
}

TEST_F(TaskCodecTest, AcceptsSnakeCaseCreatedAt) {
  auto settings = TaskCodec::decodeBrowserActions(std::string(
      R"({"enabled": true, "actions": [{"id": "x", "url": "https://x.io", "created_at": "2025-02-02T10:00:00Z"}]})"));
  ASSERT_OK(settings);
  EXPECT_EQ(settings->actions()[0].created_at.value_or(""), "2025-02-02T10:00:00Z");
}

TEST_F(TaskCodecTest, MalformedBrowserActionJsonIsParseError) {
  auto record = dueRecord();
  record.browser_actions = "{not json";
  EXPECT_ERROR(TaskCodec::decode(record), ErrorCode::kParseError);

  EXPECT_ERROR(TaskCodec::decodeBrowserActions(std::string(R"({"enabled": true, "actions": [{"label": "no url"}]})")),
               ErrorCode::kParseError);
}

TEST_F(TaskCodecTest, NotificationConfigJsonUsesCamelCaseKeys) {
  auto json = nlohmann::json::parse(
      R"({"kind": "recurring", "daysBefore": null, "timeOfDay": "07:45", "daysOfWeek": [0, 6], "level": 3})");
  auto config = TaskCodec::decodeNotificationConfig(json);
  ASSERT_OK(config);
  EXPECT_EQ(config->kind, NotificationKind::kRecurring);
  EXPECT_EQ(config->days_before, 1);
  EXPECT_EQ(config->days_of_week, (std::set<int>{0, 6}));
  EXPECT_EQ(config->level, 3);

  auto encoded = TaskCodec::encodeNotificationConfig(*config);
  EXPECT_EQ(encoded["kind"], "recurring");
  EXPECT_EQ(encoded["timeOfDay"], "07:45");
  EXPECT_EQ(encoded["daysOfWeek"], nlohmann::json::array({0, 6}));
}

TEST_F(TaskCodecTest, ToRecordProducesDecodableRow) {
  auto task = makeRecurringTask("r9", {2, 4}, TimeOfDay{18, 5}, 3);
  ASSERT_OK(task.browser_actions.addAction(makeAction("a", "https://example.com", 0)));
  task.browser_actions.setEnabled(true);

  auto record = TaskCodec::toRecord(task);
  EXPECT_EQ(record.notification_type.value_or(""), "recurring");
  EXPECT_EQ(record.notification_days_of_week.value_or(""), "[2,4]");
  EXPECT_EQ(record.notification_time.value_or(""), "18:05");

  auto decoded = TaskCodec::decode(record);
  ASSERT_OK(decoded);
  EXPECT_EQ(decoded->notification.days_of_week, task.notification.days_of_week);
  EXPECT_TRUE(decoded->browser_actions.hasRunnableActions());
}

TEST_F(TaskCodecTest, FiredNotificationJson) {
  FiredNotification fired;
  fired.task_id = "t1";
  fired.title = "Submit report";
  fired.level = 2;
  fired.kind = NotificationKind::kDueDate;
  fired.days_until_due = 1;

  auto json = TaskCodec::toJson(fired);
  EXPECT_EQ(json["taskId"], "t1");
  EXPECT_EQ(json["kind"], "due_date_based");
  EXPECT_EQ(json["daysUntilDue"], 1);
  EXPECT_FALSE(json.contains("test"));
}
