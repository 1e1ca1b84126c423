#include <gtest/gtest.h>

#include <atomic>
#include <filesystem>
#include <optional>
#include <thread>

#include "fakes.hpp"
#include "tasknag/core/task_codec.hpp"
#include "tasknag/notify/notification_scheduler.hpp"
#include "test_helpers.hpp"

using namespace tasknag::core;
using namespace tasknag::notify;
using namespace tasknag::test;
using tasknag::ErrorCode;
using std::chrono::minutes;

class NotificationSchedulerTest : public ::testing::Test {
protected:
  NotificationSchedulerTest()
      : clock_(localTime(2025, 3, 12, 9, 7)),
        executor_(opener_, validator_, clock_),
        dispatcher_(sink_, executor_),
        scheduler_(source_, evaluator_, dispatcher_, clock_, {}) {}

  InMemoryTaskSource source_;
  FakePresentationSink sink_;
  RecordingUrlOpener opener_;
  UrlValidator validator_;
  ManualClock clock_;
  BrowserActionExecutor executor_;
  NotificationDispatcher dispatcher_;
  NotificationEvaluator evaluator_;
  NotificationScheduler scheduler_;
};

TEST_F(NotificationSchedulerTest, DelayAlignsToQuarterHours) {
  EXPECT_EQ(NotificationScheduler::delayUntilNextBoundary(localTime(2025, 3, 12, 9, 7, 30), minutes(15)),
            std::chrono::milliseconds(7 * 60 * 1000 + 30 * 1000));
  EXPECT_EQ(NotificationScheduler::delayUntilNextBoundary(localTime(2025, 3, 12, 9, 15), minutes(15)),
            minutes(15));
  EXPECT_EQ(NotificationScheduler::nextBoundary(localTime(2025, 3, 12, 23, 55), minutes(15)),
            localTime(2025, 3, 13, 0, 0));
  EXPECT_EQ(NotificationScheduler::nextBoundary(localTime(2025, 3, 12, 9, 7), minutes(60)),
            localTime(2025, 3, 12, 10, 0));
}

TEST_F(NotificationSchedulerTest, DelayIsWithinOneInterval) {
  for (int second = 0; second < 24 * 60 * 60; second += 373) {
    auto now = localTime(2025, 3, 12, 0, 0) + std::chrono::seconds(second);
    auto delay = NotificationScheduler::delayUntilNextBoundary(now, minutes(15));
    EXPECT_GT(delay.count(), 0);
    EXPECT_LE(delay, minutes(15));
  }
}

TEST_F(NotificationSchedulerTest, RunWakesOnFixedGrid) {
  clock_.setSleepBudget(3);
  scheduler_.run();

  EXPECT_EQ(clock_.wakeDeadlines(),
            (std::vector<tasknag::util::TimePoint>{localTime(2025, 3, 12, 9, 15),
                                                   localTime(2025, 3, 12, 9, 30),
                                                   localTime(2025, 3, 12, 9, 45)}));
  EXPECT_EQ(source_.calls, 3);
  EXPECT_EQ(scheduler_.status().sweeps, 3u);
  EXPECT_FALSE(scheduler_.isRunning());
}

TEST_F(NotificationSchedulerTest, MissedBoundariesAreSkipped) {
  clock_.setSleepBudget(2);
  clock_.setOversleep(minutes(40));
  scheduler_.run();

  auto deadlines = clock_.wakeDeadlines();
  ASSERT_EQ(deadlines.size(), 2u);
  EXPECT_EQ(deadlines[0], localTime(2025, 3, 12, 9, 15));
  EXPECT_EQ(deadlines[1], localTime(2025, 3, 12, 10, 0));
  EXPECT_EQ(source_.calls, 2);
}

TEST_F(NotificationSchedulerTest, RecurringReminderFiresFromLoop) {
  source_.records.push_back(makeRecurringRecord("r", "[3]", "09:15", 1));
  clock_.setSleepBudget(2);
  scheduler_.run();

  ASSERT_EQ(sink_.alerts.size(), 1u);
  EXPECT_EQ(sink_.alerts[0].body, "Task r");
  EXPECT_EQ(scheduler_.status().notifications, 1u);
}

TEST_F(NotificationSchedulerTest, SweepIsolatesBrokenTasks) {
  source_.records.push_back(makeRecurringRecord("good", "[3]", "09:00"));
  source_.records.push_back(makeRecurringRecord("bad-json", "[3,", "09:00"));
  source_.records.push_back(makeRecurringRecord("bad-time", "[3]", "9am"));
  source_.records.push_back(makeRecurringRecord("alert-fails", "[3]", "09:00"));
  source_.records.push_back(makeRecurringRecord("also-good", "[3]", "09:00"));
  sink_.fail_alert_for = "alert-fails";

  auto fired = scheduler_.sweep(localTime(2025, 3, 12, 9, 0));

  ASSERT_EQ(fired.size(), 2u);
  EXPECT_EQ(fired[0].task_id, "good");
  EXPECT_EQ(fired[1].task_id, "also-good");
  EXPECT_EQ(sink_.alerts.size(), 2u);
}

TEST_F(NotificationSchedulerTest, ProviderFailureYieldsEmptySweep) {
  source_.failure = tasknag::makeError(ErrorCode::kDatabaseError, "database is locked");
  EXPECT_TRUE(scheduler_.sweep(localTime(2025, 3, 12, 9, 0)).empty());
  EXPECT_ERROR(scheduler_.preview(localTime(2025, 3, 12, 9, 0)), ErrorCode::kDatabaseError);
}

TEST_F(NotificationSchedulerTest, CheckNowUsesClockTime) {
  source_.records.push_back(makeRecurringRecord("r", "[3]", "09:00"));
  clock_.set(localTime(2025, 3, 12, 9, 10));
  EXPECT_EQ(scheduler_.checkNow().size(), 1u);

  clock_.set(localTime(2025, 3, 12, 9, 20));
  EXPECT_TRUE(scheduler_.checkNow().empty());
}

TEST_F(NotificationSchedulerTest, PreviewDoesNotDispatch) {
  source_.records.push_back(makeRecurringRecord("r", "[3]", "09:00", 3));
  auto due = scheduler_.preview(localTime(2025, 3, 12, 9, 0));
  ASSERT_OK(due);
  EXPECT_EQ(due->size(), 1u);
  EXPECT_TRUE(sink_.alerts.empty());
  EXPECT_EQ(sink_.cues, 0);
}

TEST_F(NotificationSchedulerTest, TestNotificationsIgnoreTiming) {
  source_.records.push_back(makeRecurringRecord("r", "[0]", "03:00"));

  auto due = TaskCodec::toRecord(makeDueTask("d", localTime(2025, 3, 15, 12, 0), 1, 2));
  source_.records.push_back(due);

  TaskRecord done = makeRecurringRecord("done", "[3]", "09:00");
  done.status = "done";
  source_.records.push_back(done);

  TaskRecord plain;
  plain.id = "plain";
  plain.title = "No reminder";
  plain.status = "todo";
  source_.records.push_back(plain);

  auto sent = scheduler_.sendTestNotifications();
  ASSERT_EQ(sent.size(), 2u);
  EXPECT_TRUE(sent[0].test_mode);
  EXPECT_EQ(sent[1].task_id, "d");
  EXPECT_EQ(sent[1].days_until_due, 3);
  EXPECT_EQ(sink_.alerts[1].title, "📅 Due in 3 days (test)");
  EXPECT_EQ(sink_.cues, 1);
}

TEST_F(NotificationSchedulerTest, SweepWaitsForLockHeldByAnotherSweeper) {
  auto lock_path = std::filesystem::temp_directory_path() /
                   ("tasknag_sweep_" + randomString(8) + ".lock");
  NotificationScheduler::Options options;
  options.lock_file = lock_path;
  NotificationScheduler locked(source_, evaluator_, dispatcher_, clock_, options);
  source_.records.push_back(makeRecurringRecord("r", "[3]", "09:00"));

  // Stands in for a `run` daemon sweeping in another process
  std::optional<tasknag::util::FileLock> daemon;
  {
    auto held = tasknag::util::FileLock::acquire(lock_path);
    ASSERT_OK(held);
    daemon.emplace(std::move(*held));
  }

  std::atomic<bool> finished{false};
  std::vector<FiredNotification> fired;
  std::thread sweeper([&]() {
    fired = locked.sweep(localTime(2025, 3, 12, 9, 0));
    finished = true;
  });

  std::this_thread::sleep_for(std::chrono::milliseconds(150));
  EXPECT_FALSE(finished);

  daemon.reset();
  sweeper.join();
  EXPECT_TRUE(finished);
  EXPECT_EQ(fired.size(), 1u);
  EXPECT_EQ(sink_.alerts.size(), 1u);

  std::filesystem::remove(lock_path);
}

TEST(NotificationSchedulerThreadTest, StartAndStop) {
  InMemoryTaskSource source;
  FakePresentationSink sink;
  RecordingUrlOpener opener;
  UrlValidator validator;
  tasknag::util::SystemClock clock;
  BrowserActionExecutor executor(opener, validator, clock);
  NotificationDispatcher dispatcher(sink, executor);
  NotificationEvaluator evaluator;
  NotificationScheduler scheduler(source, evaluator, dispatcher, clock, {});

  ASSERT_OK(scheduler.start());
  EXPECT_ERROR(scheduler.start(), ErrorCode::kInvalidState);

  for (int i = 0; i < 100 && !scheduler.isRunning(); ++i) {
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }
  EXPECT_TRUE(scheduler.isRunning());

  auto begin = std::chrono::steady_clock::now();
  scheduler.stop();
  EXPECT_FALSE(scheduler.isRunning());
  EXPECT_LT(std::chrono::steady_clock::now() - begin, std::chrono::seconds(5));

  ASSERT_OK(scheduler.start());
  scheduler.stop();
}
