#include "shortmint/core/clock.h"

#include <ctime>
#include <iomanip>
#include <sstream>
#include <thread>

namespace shortmint::core {

std::string format_iso8601(std::int64_t unix_seconds) {
  const auto time_t_value = static_cast<std::time_t>(unix_seconds);
  std::tm utc{};
  gmtime_r(&time_t_value, &utc);

  std::ostringstream oss;
  oss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%SZ");
  return oss.str();
}

std::int64_t SystemClock::now_unix_seconds() {
  const auto now = std::chrono::system_clock::now().time_since_epoch();
  return std::chrono::duration_cast<std::chrono::seconds>(now).count();
}

std::string SystemClock::now_iso8601() {
  return format_iso8601(now_unix_seconds());
}

bool SystemClock::sleep_for(std::chrono::milliseconds duration) {
  if (!stop_.stop_possible()) {
    std::this_thread::sleep_for(duration);
    return true;
  }

  // Wakes early only when stop is requested; the predicate never becomes true.
  std::unique_lock<std::mutex> lock(mutex_);
  cv_.wait_for(lock, stop_, duration, [] { return false; });
  return !stop_.stop_requested();
}

std::int64_t ManualClock::now_unix_seconds() {
  return seconds_.load();
}

std::string ManualClock::now_iso8601() {
  return format_iso8601(seconds_.load());
}

bool ManualClock::sleep_for(std::chrono::milliseconds /*duration*/) {
  const int count = sleep_count_.fetch_add(1) + 1;
  if (on_sleep_) {
    on_sleep_(count);
  }
  std::this_thread::yield();
  return !interrupted_.load();
}

void ManualClock::set(std::int64_t unix_seconds) {
  seconds_.store(unix_seconds);
}

void ManualClock::advance(std::int64_t seconds) {
  seconds_.fetch_add(seconds);
}

void ManualClock::interrupt() {
  interrupted_.store(true);
}

void ManualClock::clear_interrupt() {
  interrupted_.store(false);
}

}  // namespace shortmint::core
