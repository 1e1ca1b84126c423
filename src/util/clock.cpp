#include "tasknag/util/clock.hpp"

#include <thread>

namespace tasknag::util {

TimePoint SystemClock::now() const {
  return std::chrono::system_clock::now();
}

bool SystemClock::sleepUntil(TimePoint deadline) {
  std::unique_lock<std::mutex> lock(mutex_);
  // Wake on short slices so wall-clock jumps (suspend, NTP) are noticed
  while (!interrupted_) {
    auto current = std::chrono::system_clock::now();
    if (current >= deadline) {
      return true;
    }
    auto slice = std::min<std::chrono::system_clock::duration>(deadline - current,
                                                               std::chrono::seconds(30));
    cv_.wait_for(lock, slice);
  }
  return false;
}

void SystemClock::sleepFor(std::chrono::milliseconds duration) {
  std::this_thread::sleep_for(duration);
}

void SystemClock::interrupt() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    interrupted_ = true;
  }
  cv_.notify_all();
}

void SystemClock::reset() {
  std::lock_guard<std::mutex> lock(mutex_);
  interrupted_ = false;
}

}  // namespace tasknag::util
