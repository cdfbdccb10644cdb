#include "flakeid/core/layout.h"
#include "flakeid/domain/decoded_id.h"

#include <catch2/catch_test_macros.hpp>

#include <nlohmann/json.hpp>

#include <limits>
#include <stdexcept>

using namespace flakeid;

TEST_CASE("decoded_id_to_json: exposes every field", "[decoded_id][serialization]") {
  const auto j = domain::decoded_id_to_json(core::SnowflakeId{21393408ULL + 42});

  CHECK(j.at("id") == 21393450ULL);
  CHECK(j.at("timestamp_offset_ms") == 5);
  CHECK(j.at("unix_ms") == 1735689600005);
  CHECK(j.at("datacenter_id") == 3);
  CHECK(j.at("worker_id") == 7);
  CHECK(j.at("sequence") == 42);
  CHECK(j.size() == 6);
}

TEST_CASE("decoded_id_to_json: id above 2^63 stays an unsigned number",
          "[decoded_id][serialization]") {
  const std::uint64_t max = std::numeric_limits<std::uint64_t>::max();
  const auto j = domain::decoded_id_to_json(core::SnowflakeId{max});
  CHECK(j.at("id").is_number_unsigned());
  CHECK(j.at("id").get<std::uint64_t>() == max);
}

TEST_CASE("decoded_id_from_json: reads id back from text", "[decoded_id][serialization]") {
  const auto text = domain::decoded_id_to_json(core::SnowflakeId{21393408ULL}).dump();
  const auto id = domain::decoded_id_from_json(nlohmann::json::parse(text));
  CHECK(id.value == 21393408ULL);
}

TEST_CASE("decoded_id_from_json: rejects missing or non-integer id",
          "[decoded_id][serialization]") {
  CHECK_THROWS_AS(domain::decoded_id_from_json(nlohmann::json::object()),
                  nlohmann::json::exception);
  CHECK_THROWS_AS(domain::decoded_id_from_json(nlohmann::json{{"id", "21393408"}}),
                  std::runtime_error);
  CHECK_THROWS_AS(domain::decoded_id_from_json(nlohmann::json{{"id", -1}}), std::runtime_error);
  CHECK_THROWS_AS(domain::decoded_id_from_json(nlohmann::json{{"id", 1.5}}), std::runtime_error);
}
