#pragma once

#include <chrono>
#include <algorithm>
#include <condition_variable>
#include <mutex>

#include "tasknag/util/time.hpp"

namespace tasknag::util {

/**
 * @brief Source of wall-clock time and suspension for periodic work
 *
 * Everything that waits (scheduler wake-ups, browser action pacing) goes
 * through a Clock so that tests can simulate elapsed time.
 */
class Clock {
 public:
  virtual ~Clock() = default;

  virtual TimePoint now() const = 0;

  /**
   * @brief Block until the deadline is reached
   * @return false if interrupt() was called before the deadline
   */
  virtual bool sleepUntil(TimePoint deadline) = 0;

  /**
   * @brief Block for a fixed duration (not interruptible)
   */
  virtual void sleepFor(std::chrono::milliseconds duration) = 0;

  /**
   * @brief Wake every pending and future sleepUntil() with false
   */
  virtual void interrupt() = 0;

  /**
   * @brief Clear a previous interrupt() so the clock can be reused
   */
  virtual void reset() = 0;
};

// Real time backed by std::chrono::system_clock
class SystemClock : public Clock {
 public:
  TimePoint now() const override;
  bool sleepUntil(TimePoint deadline) override;
  void sleepFor(std::chrono::milliseconds duration) override;
  void interrupt() override;
  void reset() override;

 private:
  std::mutex mutex_;
  std::condition_variable cv_;
  bool interrupted_ = false;
};

}  // namespace tasknag::util
