#pragma once

#include <chrono>
#include <optional>

#include "tasknag/core/task.hpp"
#include "tasknag/util/time.hpp"

namespace tasknag::notify {

/**
 * @brief Pure fire/no-fire decision for one task at one instant
 *
 * A reminder fires when `now` lies in the half-open window
 * [boundary, boundary + tolerance). With an aligned scheduler whose interval
 * equals the tolerance, each boundary is seen by exactly one wake.
 *
 * Recurring reminders match the weekday of `now`, not of the occurrence.
 * When the window wraps past midnight the wake after midnight is judged by
 * the new day. With quarter-hour wakes a Monday-only 23:55 reminder fires at
 * Monday 00:00 (Sunday night's crossing), while Monday night's crossing is
 * seen at Tuesday 00:00 and does not fire.
 */
class NotificationEvaluator {
 public:
  explicit NotificationEvaluator(std::chrono::minutes tolerance = std::chrono::minutes(15));

  std::optional<core::FiredNotification> evaluate(const core::Task& task, util::TimePoint now) const;

  /**
   * @brief Instant at which the due-date reminder window opens
   *
   * The due instant's local date combined with the time of day (or the due
   * instant itself when none is set), moved back by daysBefore calendar days.
   */
  static std::optional<util::TimePoint> dueWindowOpen(const core::Task& task);

  // Due instant adjusted to the configured time of day
  static std::optional<util::TimePoint> dueTarget(const core::Task& task);

  std::chrono::minutes tolerance() const noexcept { return tolerance_; }

 private:
  std::optional<core::FiredNotification> evaluateDueDate(const core::Task& task,
                                                         util::TimePoint now) const;
  std::optional<core::FiredNotification> evaluateRecurring(const core::Task& task,
                                                           util::TimePoint now) const;

  std::chrono::minutes tolerance_;
};

}  // namespace tasknag::notify
