#pragma once

#include <atomic>
#include <cstdint>

namespace flakeid::core {

// Abstract millisecond clock for timestamp injection.
// Production code reads the system wall clock; tests drive a ManualClock.
// Following C++ Core Guidelines I.25: Prefer abstract classes as interfaces to class hierarchies.
class IClock {
 public:
  virtual ~IClock() = default;

  // Current time in milliseconds since the Unix epoch (1970-01-01T00:00:00Z).
  // Not guaranteed monotonic: NTP steps and VM migration can move it backwards.
  [[nodiscard]] virtual std::int64_t now_millis() = 0;

  // Called between polls by code that waits for now_millis() to advance.
  // Must return promptly; the caller re-reads the clock afterwards.
  virtual void wait_for_tick() = 0;

 protected:
  IClock() = default;
  IClock(const IClock&) = default;
  IClock& operator=(const IClock&) = default;
  IClock(IClock&&) = default;
  IClock& operator=(IClock&&) = default;
};

// Production clock: std::chrono::system_clock truncated to milliseconds.
// wait_for_tick() sleeps for a short fraction of a millisecond.
class SystemClock final : public IClock {
 public:
  SystemClock() = default;
  ~SystemClock() override = default;

  SystemClock(const SystemClock&) = default;
  SystemClock& operator=(const SystemClock&) = default;
  SystemClock(SystemClock&&) = default;
  SystemClock& operator=(SystemClock&&) = default;

  [[nodiscard]] std::int64_t now_millis() override;
  void wait_for_tick() override;
};

// Manual clock for deterministic tests and demos.
// Time only moves through set()/advance(), or by one millisecond per wait_for_tick() call,
// so a generator spinning on an exhausted millisecond always makes progress.
// Thread-safe.
class ManualClock final : public IClock {
 public:
  explicit ManualClock(std::int64_t start_millis) : now_(start_millis) {}
  ~ManualClock() override = default;

  // Not copyable or movable (contains atomic state)
  ManualClock(const ManualClock&) = delete;
  ManualClock& operator=(const ManualClock&) = delete;
  ManualClock(ManualClock&&) = delete;
  ManualClock& operator=(ManualClock&&) = delete;

  [[nodiscard]] std::int64_t now_millis() override;
  void wait_for_tick() override;

  void set(std::int64_t millis);
  void advance(std::int64_t delta_millis);

  // Number of wait_for_tick() calls observed so far.
  [[nodiscard]] std::uint64_t tick_waits() const;

 private:
  std::atomic<std::int64_t> now_;
  std::atomic<std::uint64_t> tick_waits_{0};
};

}  // namespace flakeid::core
