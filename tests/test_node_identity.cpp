#include "flakeid/core/errors.h"
#include "flakeid/core/node_identity.h"

#include <catch2/catch_test_macros.hpp>

using namespace flakeid::core;

TEST_CASE("make_node_identity: accepts the full 0-31 range", "[identity]") {
  SECTION("lower bound") {
    const auto identity = make_node_identity(0, 0);
    REQUIRE(identity.has_value());
    CHECK(identity.value().datacenter_id() == 0);
    CHECK(identity.value().worker_id() == 0);
  }

  SECTION("upper bound") {
    const auto identity = make_node_identity(31, 31);
    REQUIRE(identity.has_value());
    CHECK(identity.value().datacenter_id() == 31);
    CHECK(identity.value().worker_id() == 31);
  }
}

TEST_CASE("make_node_identity: rejects out-of-range datacenter id", "[identity]") {
  for (const std::int64_t bad : {std::int64_t{-1}, std::int64_t{32}, std::int64_t{1} << 40}) {
    const auto identity = make_node_identity(bad, 0);
    REQUIRE_FALSE(identity.has_value());
    CHECK(identity.error().field == IdentityField::kDatacenterId);
    CHECK(identity.error().value == bad);
  }
}

TEST_CASE("make_node_identity: rejects out-of-range worker id", "[identity]") {
  for (const std::int64_t bad : {std::int64_t{-1}, std::int64_t{32}}) {
    const auto identity = make_node_identity(0, bad);
    REQUIRE_FALSE(identity.has_value());
    CHECK(identity.error().field == IdentityField::kWorkerId);
    CHECK(identity.error().value == bad);
  }
}

TEST_CASE("make_node_identity: datacenter id is reported first", "[identity]") {
  const auto identity = make_node_identity(32, 32);
  REQUIRE_FALSE(identity.has_value());
  CHECK(identity.error().field == IdentityField::kDatacenterId);
}

TEST_CASE("to_string: identity and errors are human readable", "[identity][errors]") {
  const auto identity = make_node_identity(3, 7);
  REQUIRE(identity.has_value());
  CHECK(to_string(identity.value()) == "dc=3/worker=7");

  CHECK(to_string(InvalidIdentity{IdentityField::kWorkerId, 32}) ==
        "invalid worker-id 32 (must be between 0 and 31)");
  CHECK(to_string(ClockMovedBackwards{1000, 990}) ==
        "clock moved backwards: refusing to generate id for 10 ms (last timestamp 1000, "
        "observed 990)");
}
