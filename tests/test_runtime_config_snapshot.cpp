#include "flakeid/domain/runtime_config_snapshot.h"

#include <catch2/catch_test_macros.hpp>

#include <nlohmann/json.hpp>

#include <stdexcept>

using namespace flakeid;

namespace {

domain::RuntimeConfigSnapshot make_snapshot() {
  domain::RuntimeConfigSnapshot snap;
  snap.build_version = "0.3";
  snap.datacenter_id = 3;
  snap.worker_id = 7;
  snap.epoch_ms = 1735689600000;
  snap.timestamp_bits = 41;
  snap.datacenter_id_bits = 5;
  snap.worker_id_bits = 5;
  snap.sequence_bits = 12;
  return snap;
}

}  // namespace

// ── RuntimeConfigSnapshot serialization ───────────────────────────────────

TEST_CASE("to_json/from_json: roundtrip preserves all fields", "[snapshot][serialization]") {
  auto snap = make_snapshot();
  snap.state_backend = "sqlite";
  snap.state_db_path = "/var/lib/flakeid/state.db";

  const auto restored = domain::from_json(domain::to_json(snap));

  CHECK(restored.snapshot_format_version == 2);
  CHECK(restored.build_version == "0.3");
  CHECK(restored.datacenter_id == 3);
  CHECK(restored.worker_id == 7);
  CHECK(restored.epoch_ms == 1735689600000);
  CHECK(restored.timestamp_bits == 41);
  CHECK(restored.datacenter_id_bits == 5);
  CHECK(restored.worker_id_bits == 5);
  CHECK(restored.sequence_bits == 12);
  CHECK(restored.state_backend == "sqlite");
  REQUIRE(restored.state_db_path.has_value());
  CHECK(restored.state_db_path.value() == "/var/lib/flakeid/state.db");
}

TEST_CASE("to_json: absent state_db_path is emitted as null", "[snapshot][serialization]") {
  const auto snap = make_snapshot();
  const auto j = nlohmann::json::parse(domain::to_json(snap));

  REQUIRE(j.contains("state_db_path"));
  CHECK(j.at("state_db_path").is_null());
  CHECK(j.at("state_backend") == "none");

  const auto restored = domain::from_json(domain::to_json(snap));
  CHECK_FALSE(restored.state_db_path.has_value());
}

TEST_CASE("to_json: output is deterministic with sorted keys", "[snapshot][serialization]") {
  const auto snap = make_snapshot();
  const std::string a = domain::to_json(snap);
  const std::string b = domain::to_json(snap);
  CHECK(a == b);

  // "build_version" sorts first, "worker_id" last.
  CHECK(a.find("\"build_version\"") < a.find("\"datacenter_id\""));
  CHECK(a.find("\"state_db_path\"") < a.find("\"worker_id\""));

  const auto j = nlohmann::json::parse(a);
  REQUIRE(j.at("layout").is_object());
  CHECK(j.at("layout").at("sequence_bits") == 12);
}

TEST_CASE("from_json: v1 snapshot without state fields defaults to none",
          "[snapshot][serialization]") {
  const std::string v1 = R"({
    "build_version": "0.1",
    "datacenter_id": 1,
    "epoch_ms": 1735689600000,
    "layout": {"datacenter_id_bits": 5, "sequence_bits": 12,
               "timestamp_bits": 41, "worker_id_bits": 5},
    "snapshot_format_version": 1,
    "worker_id": 2
  })";

  const auto snap = domain::from_json(v1);
  CHECK(snap.snapshot_format_version == 1);
  CHECK(snap.datacenter_id == 1);
  CHECK(snap.worker_id == 2);
  CHECK(snap.state_backend == "none");
  CHECK_FALSE(snap.state_db_path.has_value());
}

TEST_CASE("from_json: malformed input throws", "[snapshot][serialization]") {
  CHECK_THROWS_AS(domain::from_json("[1, 2, 3]"), std::runtime_error);
  CHECK_THROWS(domain::from_json("{}"));
  CHECK_THROWS(domain::from_json("not json"));
}
