#include "tasknag/notify/notification_scheduler.hpp"

#include <chrono>

#include <spdlog/spdlog.h>

#include "tasknag/core/task_codec.hpp"

namespace tasknag::notify {

NotificationScheduler::NotificationScheduler(store::TaskSnapshotProvider& provider,
                                             const NotificationEvaluator& evaluator,
                                             NotificationDispatcher& dispatcher,
                                             util::Clock& clock,
                                             Options options)
    : provider_(provider),
      evaluator_(evaluator),
      dispatcher_(dispatcher),
      clock_(clock),
      options_(options) {}

NotificationScheduler::~NotificationScheduler() {
  stop();
}

Result<void> NotificationScheduler::start() {
  if (running_.load() || loop_thread_) {
    return std::unexpected(makeError(ErrorCode::kInvalidState, "Scheduler is already running"));
  }
  if (options_.interval.count() <= 0) {
    return std::unexpected(makeError(ErrorCode::kConfigError, "Scheduler interval must be positive"));
  }

  should_stop_ = false;
  clock_.reset();
  loop_thread_ = std::make_unique<std::thread>(&NotificationScheduler::run, this);
  return {};
}

void NotificationScheduler::stop() {
  should_stop_ = true;
  clock_.interrupt();

  if (loop_thread_ && loop_thread_->joinable()) {
    loop_thread_->join();
  }
  loop_thread_.reset();
}

bool NotificationScheduler::isRunning() const {
  return running_.load();
}

void NotificationScheduler::run() {
  running_ = true;
  {
    std::lock_guard<std::mutex> lock(status_mutex_);
    status_.running = true;
  }
  spdlog::info("Notification scheduler started (interval {} min)", options_.interval.count());

  util::TimePoint next = options_.align_to_boundary
                             ? nextBoundary(clock_.now(), options_.interval)
                             : clock_.now() + options_.interval;

  while (!should_stop_) {
    {
      std::lock_guard<std::mutex> lock(status_mutex_);
      status_.next_wake = next;
    }
    spdlog::debug("Next check at {}", util::Time::formatLocal(next));

    if (!clock_.sleepUntil(next) || should_stop_) {
      break;
    }

    try {
      sweep(clock_.now());
    } catch (const std::exception& e) {
      spdlog::error("Notification sweep failed: {}", e.what());
    }

    next += options_.interval;
    // Boundaries passed while asleep or suspended are not replayed
    auto now = clock_.now();
    size_t skipped = 0;
    while (next <= now) {
      next += options_.interval;
      ++skipped;
    }
    if (skipped > 0) {
      spdlog::info("Skipped {} missed check(s)", skipped);
    }
  }

  running_ = false;
  {
    std::lock_guard<std::mutex> lock(status_mutex_);
    status_.running = false;
    status_.next_wake.reset();
  }
  spdlog::info("Notification scheduler stopped");
}

std::vector<core::FiredNotification> NotificationScheduler::checkNow() {
  return sweep(clock_.now());
}

template <typename Visitor>
Result<void> NotificationScheduler::forEachTask(Visitor&& visitor) {
  auto records = provider_.listActiveNotifiable();
  if (!records) {
    return std::unexpected(records.error());
  }

  for (const auto& record : *records) {
    try {
      auto task = core::TaskCodec::decode(record);
      if (!task) {
        spdlog::warn("Skipping task {}: {}", record.id, task.error().message());
        continue;
      }
      visitor(*task);
    } catch (const std::exception& e) {
      spdlog::error("Task {} failed: {}", record.id, e.what());
    }
  }
  return {};
}

std::optional<util::FileLock> NotificationScheduler::lockSweeps() const {
  if (options_.lock_file.empty()) {
    return std::nullopt;
  }
  auto lock = util::FileLock::acquire(options_.lock_file);
  if (!lock) {
    spdlog::warn("Sweeping without the cross-process lock: {}", lock.error().message());
    return std::nullopt;
  }
  return std::move(*lock);
}

std::vector<core::FiredNotification> NotificationScheduler::sweep(util::TimePoint now) {
  std::lock_guard<std::mutex> lock(sweep_mutex_);
  auto process_lock = lockSweeps();
  spdlog::debug("Checking notifications at {}", util::Time::formatLocal(now));
  auto started = std::chrono::steady_clock::now();

  std::vector<core::FiredNotification> delivered;
  auto result = forEachTask([&](const core::Task& task) {
    auto decision = evaluator_.evaluate(task, now);
    if (!decision) {
      return;
    }
    auto fired = dispatcher_.fire(*decision, task);
    if (!fired) {
      spdlog::error("Failed to notify task {}: {}", task.id, fired.error().message());
      return;
    }
    delivered.push_back(*decision);
  });

  if (!result) {
    spdlog::error("Failed to load tasks: {}", result.error().message());
  }
  spdlog::debug("Sweep finished in {} with {} notification(s)",
                util::Time::formatDuration(std::chrono::steady_clock::now() - started),
                delivered.size());

  std::lock_guard<std::mutex> status_lock(status_mutex_);
  status_.last_sweep = now;
  status_.sweeps++;
  status_.notifications += delivered.size();
  return delivered;
}

Result<std::vector<core::FiredNotification>> NotificationScheduler::preview(util::TimePoint now) {
  std::lock_guard<std::mutex> lock(sweep_mutex_);

  std::vector<core::FiredNotification> due;
  auto result = forEachTask([&](const core::Task& task) {
    if (auto decision = evaluator_.evaluate(task, now)) {
      due.push_back(*decision);
    }
  });
  if (!result) {
    return std::unexpected(result.error());
  }
  return due;
}

std::vector<core::FiredNotification> NotificationScheduler::sendTestNotifications() {
  std::lock_guard<std::mutex> lock(sweep_mutex_);
  auto process_lock = lockSweeps();
  auto now = clock_.now();

  std::vector<core::FiredNotification> delivered;
  auto result = forEachTask([&](const core::Task& task) {
    if (task.isDone() || task.notification.kind == core::NotificationKind::kNone) {
      return;
    }

    core::FiredNotification notification;
    notification.task_id = task.id;
    notification.title = task.title;
    notification.level = task.notification.level;
    notification.kind = task.notification.kind;
    notification.test_mode = true;
    if (task.notification.kind == core::NotificationKind::kDueDate) {
      if (auto target = NotificationEvaluator::dueTarget(task)) {
        notification.days_until_due = util::Time::localDaysBetween(now, *target);
      }
    }

    auto fired = dispatcher_.fire(notification, task);
    if (!fired) {
      spdlog::error("Failed to send test notification for task {}: {}", task.id,
                    fired.error().message());
      return;
    }
    delivered.push_back(std::move(notification));
  });

  if (!result) {
    spdlog::error("Failed to load tasks: {}", result.error().message());
  }
  spdlog::info("Sent {} test notification(s)", delivered.size());
  return delivered;
}

NotificationScheduler::Status NotificationScheduler::status() const {
  std::lock_guard<std::mutex> lock(status_mutex_);
  return status_;
}

util::TimePoint NotificationScheduler::nextBoundary(util::TimePoint now,
                                                    std::chrono::minutes interval) {
  if (interval.count() <= 0) {
    return now;
  }

  auto local = util::Time::toLocal(now);
  auto midnight = util::Time::fromLocal(local.year, local.month, local.day, 0, 0, 0);
  if (!midnight || *midnight > now) {
    return now + interval;
  }

  auto elapsed = now - *midnight;
  auto periods = elapsed / interval;
  return *midnight + (periods + 1) * interval;
}

std::chrono::milliseconds NotificationScheduler::delayUntilNextBoundary(
    util::TimePoint now, std::chrono::minutes interval) {
  return std::chrono::ceil<std::chrono::milliseconds>(nextBoundary(now, interval) - now);
}

}  // namespace tasknag::notify
