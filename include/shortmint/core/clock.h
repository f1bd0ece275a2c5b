#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <stop_token>
#include <string>

namespace shortmint::core {

// Abstract clock interface for timestamp injection.
// Allows production code to use system time while tests simulate second boundaries
// without real delay.
// Following C++ Core Guidelines I.25: Prefer abstract classes as interfaces to class hierarchies.
class IClock {
 public:
  virtual ~IClock() = default;

  // Return current wall-clock time as whole seconds since the Unix epoch (truncated).
  virtual std::int64_t now_unix_seconds() = 0;

  // Return current timestamp in ISO 8601 format (UTC).
  // Contract: returned string is non-empty and valid ISO 8601.
  virtual std::string now_iso8601() = 0;

  // Suspend the caller for roughly `duration`.
  // Returns false if the sleep was interrupted; callers must treat that as fatal
  // for the operation in progress.
  [[nodiscard]] virtual bool sleep_for(std::chrono::milliseconds duration) = 0;

 protected:
  IClock() = default;
  IClock(const IClock&) = default;
  IClock& operator=(const IClock&) = default;
  IClock(IClock&&) = default;
  IClock& operator=(IClock&&) = default;
};

// Format Unix seconds as "YYYY-MM-DDTHH:MM:SSZ".
[[nodiscard]] std::string format_iso8601(std::int64_t unix_seconds);

// Production clock: returns actual system time.
// An optional stop_token makes sleep_for interruptible: once stop is requested,
// pending and future sleeps return false.
class SystemClock final : public IClock {
 public:
  SystemClock() = default;
  explicit SystemClock(std::stop_token stop) : stop_(std::move(stop)) {}
  ~SystemClock() override = default;

  SystemClock(const SystemClock&) = delete;
  SystemClock& operator=(const SystemClock&) = delete;
  SystemClock(SystemClock&&) = delete;
  SystemClock& operator=(SystemClock&&) = delete;

  std::int64_t now_unix_seconds() override;
  std::string now_iso8601() override;
  [[nodiscard]] bool sleep_for(std::chrono::milliseconds duration) override;

 private:
  std::stop_token stop_;
  std::mutex mutex_;
  std::condition_variable_any cv_;
};

// Manual clock: time only moves when told to. For deterministic tests and demos.
// Thread-safe: one thread may advance the clock while another polls it.
//
// sleep_for never blocks for the requested duration. It counts the call, runs the
// optional on_sleep hook (which may advance or interrupt the clock), and yields.
class ManualClock final : public IClock {
 public:
  explicit ManualClock(std::int64_t unix_seconds) : seconds_(unix_seconds) {}
  ~ManualClock() override = default;

  ManualClock(const ManualClock&) = delete;
  ManualClock& operator=(const ManualClock&) = delete;
  ManualClock(ManualClock&&) = delete;
  ManualClock& operator=(ManualClock&&) = delete;

  std::int64_t now_unix_seconds() override;
  std::string now_iso8601() override;
  [[nodiscard]] bool sleep_for(std::chrono::milliseconds duration) override;

  void set(std::int64_t unix_seconds);
  void advance(std::int64_t seconds);

  // Subsequent sleeps report interruption until clear_interrupt() is called.
  void interrupt();
  void clear_interrupt();

  // Hook invoked on every sleep_for call with the 1-based call count.
  // Must be installed before the clock is shared between threads.
  void on_sleep(std::function<void(int sleep_count)> hook) { on_sleep_ = std::move(hook); }

  [[nodiscard]] int sleep_count() const { return sleep_count_.load(); }

 private:
  std::atomic<std::int64_t> seconds_;
  std::atomic<bool> interrupted_{false};
  std::atomic<int> sleep_count_{0};
  std::function<void(int)> on_sleep_;
};

}  // namespace shortmint::core
