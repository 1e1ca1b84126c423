#include "tasknag/util/time.hpp"

#include <ctime>
#include <iomanip>
#include <regex>
#include <sstream>

namespace tasknag::util {

namespace {

std::tm toLocalTm(TimePoint time) {
  auto time_t = std::chrono::system_clock::to_time_t(time);
  std::tm tm = {};
  localtime_r(&time_t, &tm);
  return tm;
}

std::chrono::sys_days civilDays(int year, int month, int day) {
  return std::chrono::sys_days{std::chrono::year{year} / std::chrono::month{static_cast<unsigned>(month)} /
                               std::chrono::day{static_cast<unsigned>(day)}};
}

}  // namespace

std::string Time::toRfc3339(TimePoint time) {
  auto time_t = std::chrono::system_clock::to_time_t(time);
  auto milliseconds = std::chrono::duration_cast<std::chrono::milliseconds>(
      time.time_since_epoch()) % 1000;
  if (milliseconds.count() < 0) {
    milliseconds += std::chrono::milliseconds(1000);
    time_t -= 1;
  }

  std::tm tm = {};
  gmtime_r(&time_t, &tm);

  std::ostringstream oss;
  oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S");
  oss << '.' << std::setfill('0') << std::setw(3) << milliseconds.count() << 'Z';

  return oss.str();
}

Result<TimePoint> Time::fromRfc3339(const std::string& str) {
  static const std::regex rfc3339_regex(
      R"((\d{4})-(\d{2})-(\d{2})[Tt ](\d{2}):(\d{2})(?::(\d{2}))?(?:\.(\d+))?([Zz]|[+-]\d{2}:?\d{2})?)");

  std::smatch match;
  if (!std::regex_match(str, match, rfc3339_regex)) {
    return std::unexpected(makeError(ErrorCode::kParseError,
                                     "Invalid RFC3339 format: " + str));
  }

  int month = std::stoi(match[2]);
  int day = std::stoi(match[3]);
  int hour = std::stoi(match[4]);
  int minute = std::stoi(match[5]);
  int second = match[6].matched ? std::stoi(match[6]) : 0;
  if (month < 1 || month > 12 || day < 1 || day > 31 || hour > 23 || minute > 59 || second > 60) {
    return std::unexpected(makeError(ErrorCode::kParseError,
                                     "Invalid time values: " + str));
  }

  std::tm tm = {};
  tm.tm_year = std::stoi(match[1]) - 1900;
  tm.tm_mon = month - 1;
  tm.tm_mday = day;
  tm.tm_hour = hour;
  tm.tm_min = minute;
  tm.tm_sec = second;

  std::time_t time_t;
  if (match[8].matched) {
    time_t = timegm(&tm);
    std::string offset = match[8];
    if (offset != "Z" && offset != "z") {
      int sign = offset[0] == '-' ? -1 : 1;
      std::string digits;
      for (char c : offset.substr(1)) {
        if (c != ':') digits += c;
      }
      int offset_minutes = std::stoi(digits.substr(0, 2)) * 60 + std::stoi(digits.substr(2, 2));
      time_t -= sign * offset_minutes * 60;
    }
  } else {
    tm.tm_isdst = -1;
    time_t = std::mktime(&tm);
  }

  if (time_t == -1) {
    return std::unexpected(makeError(ErrorCode::kParseError,
                                     "Invalid time values: " + str));
  }

  auto time_point = std::chrono::system_clock::from_time_t(time_t);

  // Fractional seconds, millisecond precision
  if (match[7].matched) {
    std::string fraction = std::string(match[7]).substr(0, 3);
    while (fraction.size() < 3) fraction += '0';
    time_point += std::chrono::milliseconds(std::stoi(fraction));
  }

  return time_point;
}

TimePoint Time::now() {
  return std::chrono::system_clock::now();
}

LocalDateTime Time::toLocal(TimePoint time) {
  std::tm tm = toLocalTm(time);
  LocalDateTime local;
  local.year = tm.tm_year + 1900;
  local.month = tm.tm_mon + 1;
  local.day = tm.tm_mday;
  local.hour = tm.tm_hour;
  local.minute = tm.tm_min;
  local.second = tm.tm_sec;
  local.weekday = tm.tm_wday;
  return local;
}

Result<TimePoint> Time::fromLocal(int year, int month, int day, int hour, int minute, int second) {
  std::tm tm = {};
  tm.tm_year = year - 1900;
  tm.tm_mon = month - 1;
  tm.tm_mday = day;
  tm.tm_hour = hour;
  tm.tm_min = minute;
  tm.tm_sec = second;
  tm.tm_isdst = -1;

  auto time_t = std::mktime(&tm);
  if (time_t == -1) {
    return std::unexpected(makeError(ErrorCode::kInvalidArgument,
                                     "Local time cannot be represented"));
  }
  return std::chrono::system_clock::from_time_t(time_t);
}

TimePoint Time::addLocalDays(TimePoint time, int days) {
  auto sub_second = time - std::chrono::time_point_cast<std::chrono::seconds>(time);
  std::tm tm = toLocalTm(time);
  tm.tm_mday += days;
  tm.tm_isdst = -1;
  auto time_t = std::mktime(&tm);
  if (time_t == -1) {
    return time + std::chrono::hours(24 * days);
  }
  return std::chrono::system_clock::from_time_t(time_t) + sub_second;
}

int Time::localDaysBetween(TimePoint from, TimePoint to) {
  auto a = toLocal(from);
  auto b = toLocal(to);
  auto diff = civilDays(b.year, b.month, b.day) - civilDays(a.year, a.month, a.day);
  return static_cast<int>(diff.count());
}

std::string Time::formatLocal(TimePoint time, const char* format) {
  std::tm tm = toLocalTm(time);
  std::ostringstream oss;
  oss << std::put_time(&tm, format);
  return oss.str();
}

std::string Time::formatDuration(std::chrono::nanoseconds duration) {
  auto hours = std::chrono::duration_cast<std::chrono::hours>(duration);
  duration -= hours;
  auto minutes = std::chrono::duration_cast<std::chrono::minutes>(duration);
  duration -= minutes;
  auto seconds = std::chrono::duration_cast<std::chrono::seconds>(duration);
  duration -= seconds;
  auto milliseconds = std::chrono::duration_cast<std::chrono::milliseconds>(duration);

  std::ostringstream oss;

  if (hours.count() > 0) {
    oss << hours.count() << "h ";
  }
  if (minutes.count() > 0) {
    oss << minutes.count() << "m ";
  }
  if (seconds.count() > 0 || (hours.count() == 0 && minutes.count() == 0)) {
    oss << seconds.count();
    if (milliseconds.count() > 0 && hours.count() == 0 && minutes.count() == 0) {
      oss << "." << std::setfill('0') << std::setw(3) << milliseconds.count();
    }
    oss << "s";
  }

  std::string result = oss.str();
  if (!result.empty() && result.back() == ' ') {
    result.pop_back();
  }

  return result.empty() ? "0s" : result;
}

}  // namespace tasknag::util
