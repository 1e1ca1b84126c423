#include "fakes.hpp"

namespace tasknag::test {

ManualClock::ManualClock(util::TimePoint start) : now_(start) {}

util::TimePoint ManualClock::now() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return now_;
}

bool ManualClock::sleepUntil(util::TimePoint deadline) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (interrupted_) {
    return false;
  }
  if (sleep_budget_) {
    if (*sleep_budget_ == 0) {
      return false;
    }
    --*sleep_budget_;
  }
  wake_deadlines_.push_back(deadline);
  if (deadline > now_) {
    now_ = deadline;
  }
  now_ += oversleep_;
  return true;
}

void ManualClock::sleepFor(std::chrono::milliseconds duration) {
  std::lock_guard<std::mutex> lock(mutex_);
  pauses_.push_back(duration);
  now_ += duration;
}

void ManualClock::interrupt() {
  std::lock_guard<std::mutex> lock(mutex_);
  interrupted_ = true;
}

void ManualClock::reset() {
  std::lock_guard<std::mutex> lock(mutex_);
  interrupted_ = false;
}

void ManualClock::set(util::TimePoint time) {
  std::lock_guard<std::mutex> lock(mutex_);
  now_ = time;
}

void ManualClock::advance(std::chrono::system_clock::duration duration) {
  std::lock_guard<std::mutex> lock(mutex_);
  now_ += duration;
}

void ManualClock::setSleepBudget(size_t sleeps) {
  std::lock_guard<std::mutex> lock(mutex_);
  sleep_budget_ = sleeps;
}

void ManualClock::setOversleep(std::chrono::system_clock::duration oversleep) {
  std::lock_guard<std::mutex> lock(mutex_);
  oversleep_ = oversleep;
}

std::vector<util::TimePoint> ManualClock::wakeDeadlines() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return wake_deadlines_;
}

std::vector<std::chrono::milliseconds> ManualClock::pauses() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return pauses_;
}

Result<void> FakePresentationSink::showAlert(const std::string& title, const std::string& body) {
  if (fail_alert_for && body.find(*fail_alert_for) != std::string::npos) {
    return std::unexpected(makeError(ErrorCode::kExternalToolError, "notifier failed"));
  }
  alerts.push_back({title, body});
  return {};
}

Result<void> FakePresentationSink::playCue() {
  ++cues;
  if (fail_cue) {
    return std::unexpected(makeError(ErrorCode::kExternalToolError, "no sound device"));
  }
  return {};
}

Result<void> FakePresentationSink::bringToFront() {
  ++focus_requests;
  if (fail_focus) {
    return std::unexpected(makeError(ErrorCode::kExternalToolError, "no window"));
  }
  return {};
}

Result<void> RecordingUrlOpener::open(const std::string& url, std::chrono::milliseconds timeout) {
  opened.push_back(url);
  timeouts.push_back(timeout);
  if (timing_out.contains(url)) {
    return std::unexpected(makeError(ErrorCode::kTimeout, "Timed out opening " + url));
  }
  if (failing.contains(url)) {
    return std::unexpected(makeError(ErrorCode::kExternalToolError, "Failed to open " + url));
  }
  return {};
}

Result<std::vector<core::TaskRecord>> InMemoryTaskSource::listActiveNotifiable() {
  ++calls;
  if (failure) {
    return std::unexpected(*failure);
  }
  return records;
}

}  // namespace tasknag::test
