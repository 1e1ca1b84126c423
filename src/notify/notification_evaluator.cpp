#include "tasknag/notify/notification_evaluator.hpp"

namespace tasknag::notify {

namespace {

constexpr int kSecondsPerDay = 24 * 60 * 60;

core::FiredNotification makeFired(const core::Task& task) {
  core::FiredNotification fired;
  fired.task_id = task.id;
  fired.title = task.title;
  fired.level = task.notification.level;
  fired.kind = task.notification.kind;
  return fired;
}

}  // namespace

NotificationEvaluator::NotificationEvaluator(std::chrono::minutes tolerance)
    : tolerance_(tolerance) {}

std::optional<core::FiredNotification> NotificationEvaluator::evaluate(const core::Task& task,
                                                                       util::TimePoint now) const {
  if (task.isDone()) {
    return std::nullopt;
  }

  switch (task.notification.kind) {
    case core::NotificationKind::kNone:
      return std::nullopt;
    case core::NotificationKind::kDueDate:
      return evaluateDueDate(task, now);
    case core::NotificationKind::kRecurring:
      return evaluateRecurring(task, now);
  }
  return std::nullopt;
}

std::optional<util::TimePoint> NotificationEvaluator::dueTarget(const core::Task& task) {
  if (!task.due) {
    return std::nullopt;
  }
  const auto& time_of_day = task.notification.time_of_day;
  if (!time_of_day) {
    return *task.due;
  }

  auto due_local = util::Time::toLocal(*task.due);
  auto target = util::Time::fromLocal(due_local.year, due_local.month, due_local.day,
                                      time_of_day->hour, time_of_day->minute);
  if (!target) {
    return std::nullopt;
  }
  return *target;
}

std::optional<util::TimePoint> NotificationEvaluator::dueWindowOpen(const core::Task& task) {
  auto target = dueTarget(task);
  if (!target) {
    return std::nullopt;
  }
  return util::Time::addLocalDays(*target, -task.notification.days_before);
}

std::optional<core::FiredNotification> NotificationEvaluator::evaluateDueDate(
    const core::Task& task, util::TimePoint now) const {
  auto target = dueTarget(task);
  auto open = dueWindowOpen(task);
  if (!target || !open) {
    return std::nullopt;
  }

  auto since_open = now - *open;
  if (since_open < std::chrono::system_clock::duration::zero() || since_open >= tolerance_) {
    return std::nullopt;
  }

  // The reminder belongs to [target - daysBefore, target]; only a same-day
  // reminder is allowed to land in the tolerance after its target.
  if (now > *target && task.notification.days_before > 0) {
    return std::nullopt;
  }

  auto fired = makeFired(task);
  fired.days_until_due = util::Time::localDaysBetween(now, *target);
  return fired;
}

std::optional<core::FiredNotification> NotificationEvaluator::evaluateRecurring(
    const core::Task& task, util::TimePoint now) const {
  const auto& config = task.notification;
  if (!config.time_of_day || config.days_of_week.empty()) {
    return std::nullopt;
  }

  auto local = util::Time::toLocal(now);
  if (!config.days_of_week.contains(local.weekday)) {
    return std::nullopt;
  }

  int now_second = local.minuteOfDay() * 60 + local.second;
  int target_second = config.time_of_day->minuteOfDay() * 60;
  int diff = ((now_second - target_second) % kSecondsPerDay + kSecondsPerDay) % kSecondsPerDay;

  if (diff >= std::chrono::duration_cast<std::chrono::seconds>(tolerance_).count()) {
    return std::nullopt;
  }

  return makeFired(task);
}

}  // namespace tasknag::notify
