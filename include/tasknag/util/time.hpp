#pragma once

#include <chrono>
#include <string>

#include "tasknag/common.hpp"

namespace tasknag::util {

using TimePoint = std::chrono::system_clock::time_point;

// Broken-down wall-clock time in the local timezone
struct LocalDateTime {
  int year = 1970;
  int month = 1;    // 1-12
  int day = 1;      // 1-31
  int hour = 0;
  int minute = 0;
  int second = 0;
  int weekday = 0;  // 0 = Sunday ... 6 = Saturday

  int minuteOfDay() const { return hour * 60 + minute; }
};

// Time utilities for RFC3339 formatting/parsing and local calendar math
class Time {
 public:
  // Format time as RFC3339 string (ISO 8601, UTC)
  static std::string toRfc3339(TimePoint time);

  // Parse RFC3339 string to time_point. "Z" and "+HH:MM" offsets are honored,
  // a timestamp without offset is interpreted as local time.
  static Result<TimePoint> fromRfc3339(const std::string& str);

  // Get current time
  static TimePoint now();

  // Break a time point down into local wall-clock fields
  static LocalDateTime toLocal(TimePoint time);

  // Build a time point from local wall-clock fields (out of range fields are normalized)
  static Result<TimePoint> fromLocal(int year, int month, int day, int hour, int minute,
                                     int second = 0);

  // Shift by whole calendar days keeping the local wall-clock time
  static TimePoint addLocalDays(TimePoint time, int days);

  // Number of local calendar days from `from`'s date to `to`'s date
  static int localDaysBetween(TimePoint from, TimePoint to);

  // Format in local time with a strftime pattern
  static std::string formatLocal(TimePoint time, const char* format = "%Y-%m-%d %H:%M");

  // Format duration for human reading
  static std::string formatDuration(std::chrono::nanoseconds duration);
};

}  // namespace tasknag::util
