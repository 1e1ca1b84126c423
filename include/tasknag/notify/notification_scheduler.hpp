#pragma once

#include <atomic>
#include <chrono>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>
#include <vector>

#include "tasknag/common.hpp"
#include "tasknag/core/task.hpp"
#include "tasknag/notify/notification_dispatcher.hpp"
#include "tasknag/notify/notification_evaluator.hpp"
#include "tasknag/store/task_snapshot_provider.hpp"
#include "tasknag/util/clock.hpp"
#include "tasknag/util/file_lock.hpp"

namespace tasknag::notify {

/**
 * @brief Drives evaluation sweeps on a wall-clock aligned cadence
 *
 * The loop sleeps until the next multiple of the interval since local
 * midnight (:00/:15/:30/:45 for the default 15 minutes), sweeps, and re-arms
 * on the same grid. Boundaries missed while the machine was suspended are
 * skipped rather than replayed. Manual checks share the sweep mutex with
 * the loop, so two sweeps never run at once. With a lock file set, sweeps
 * also hold an flock on it, which serializes `tasknag check` against a
 * running daemon.
 */
class NotificationScheduler {
 public:
  struct Options {
    std::chrono::minutes interval{15};
    bool align_to_boundary = true;
    std::filesystem::path lock_file;  // empty: no cross-process lock
  };

  struct Status {
    bool running = false;
    std::optional<util::TimePoint> last_sweep;
    std::optional<util::TimePoint> next_wake;
    size_t sweeps = 0;
    size_t notifications = 0;
  };

  NotificationScheduler(store::TaskSnapshotProvider& provider,
                        const NotificationEvaluator& evaluator,
                        NotificationDispatcher& dispatcher,
                        util::Clock& clock,
                        Options options);
  ~NotificationScheduler();

  NotificationScheduler(const NotificationScheduler&) = delete;
  NotificationScheduler& operator=(const NotificationScheduler&) = delete;

  // Run the loop on a background thread
  Result<void> start();

  // Stop the loop and join the background thread, if any
  void stop();

  bool isRunning() const;

  // Run the loop on the calling thread until stop() is called
  void run();

  // One sweep at the clock's current time
  std::vector<core::FiredNotification> checkNow();

  // One evaluate-and-dispatch sweep as of `now`; returns what was delivered
  std::vector<core::FiredNotification> sweep(util::TimePoint now);

  // Evaluate as of `now` without dispatching anything
  Result<std::vector<core::FiredNotification>> preview(util::TimePoint now);

  // Alert every configured task immediately, ignoring timing
  std::vector<core::FiredNotification> sendTestNotifications();

  Status status() const;

  // First boundary strictly after `now` on the local-midnight aligned grid
  static util::TimePoint nextBoundary(util::TimePoint now, std::chrono::minutes interval);

  // Time left until nextBoundary(); always in (0, interval]
  static std::chrono::milliseconds delayUntilNextBoundary(util::TimePoint now,
                                                          std::chrono::minutes interval);

 private:
  template <typename Visitor>
  Result<void> forEachTask(Visitor&& visitor);

  // Cross-process sweep lock, when configured and obtainable
  std::optional<util::FileLock> lockSweeps() const;

  store::TaskSnapshotProvider& provider_;
  const NotificationEvaluator& evaluator_;
  NotificationDispatcher& dispatcher_;
  util::Clock& clock_;
  Options options_;

  std::mutex sweep_mutex_;

  std::unique_ptr<std::thread> loop_thread_;
  std::atomic<bool> running_{false};
  std::atomic<bool> should_stop_{false};

  mutable std::mutex status_mutex_;
  Status status_;
};

}  // namespace tasknag::notify
