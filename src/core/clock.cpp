#include "flakeid/core/clock.h"

#include <chrono>
#include <thread>

namespace flakeid::core {

namespace {

// Poll interval while waiting for the next millisecond.
constexpr std::chrono::microseconds kTickPollInterval{50};

}  // namespace

std::int64_t SystemClock::now_millis() {
  const auto now = std::chrono::system_clock::now().time_since_epoch();
  return std::chrono::duration_cast<std::chrono::milliseconds>(now).count();
}

void SystemClock::wait_for_tick() {
  std::this_thread::sleep_for(kTickPollInterval);
}

std::int64_t ManualClock::now_millis() {
  return now_.load(std::memory_order_acquire);
}

void ManualClock::wait_for_tick() {
  tick_waits_.fetch_add(1, std::memory_order_relaxed);
  now_.fetch_add(1, std::memory_order_acq_rel);
}

void ManualClock::set(std::int64_t millis) {
  now_.store(millis, std::memory_order_release);
}

void ManualClock::advance(std::int64_t delta_millis) {
  now_.fetch_add(delta_millis, std::memory_order_acq_rel);
}

std::uint64_t ManualClock::tick_waits() const {
  return tick_waits_.load(std::memory_order_relaxed);
}

}  // namespace flakeid::core
