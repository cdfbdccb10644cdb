#include "flakeid/core/clock.h"
#include "flakeid/core/layout.h"

#include <catch2/catch_test_macros.hpp>

using namespace flakeid::core;

TEST_CASE("SystemClock: reads Unix milliseconds after the epoch", "[clock]") {
  SystemClock clock;
  const std::int64_t a = clock.now_millis();
  CHECK(a > kEpochMillis);

  clock.wait_for_tick();
  const std::int64_t b = clock.now_millis();
  // Not strictly monotonic in general, but a short sleep never moves it by hours.
  CHECK(b - a < 3'600'000);
  CHECK(a - b < 3'600'000);
}

TEST_CASE("ManualClock: moves only when told to", "[clock]") {
  ManualClock clock(1000);
  CHECK(clock.now_millis() == 1000);
  CHECK(clock.now_millis() == 1000);

  clock.advance(5);
  CHECK(clock.now_millis() == 1005);

  clock.set(10);
  CHECK(clock.now_millis() == 10);

  clock.advance(-3);
  CHECK(clock.now_millis() == 7);
}

TEST_CASE("ManualClock: wait_for_tick advances one millisecond", "[clock]") {
  ManualClock clock(1000);
  clock.wait_for_tick();
  clock.wait_for_tick();
  CHECK(clock.now_millis() == 1002);
  CHECK(clock.tick_waits() == 2);
}
