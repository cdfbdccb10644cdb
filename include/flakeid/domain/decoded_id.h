#pragma once

#include "flakeid/core/layout.h"

#include <nlohmann/json.hpp>

namespace flakeid::domain {

// decoded_id_to_json renders every field of an Id for operators and tooling.
//
// Shape:
//   {"datacenter_id": 3, "id": 21393408, "sequence": 0,
//    "timestamp_offset_ms": 5, "unix_ms": 1735689600005, "worker_id": 7}
//
// "id" is an unsigned 64-bit JSON number; consumers that parse JSON numbers as
// doubles lose precision above 2^53 and should read it as a string instead.
[[nodiscard]] nlohmann::json decoded_id_to_json(core::SnowflakeId id);

// decoded_id_from_json is the inverse of decoded_id_to_json. Only "id" is read;
// the field values are recomputed from it. Throws nlohmann::json::exception if "id"
// is absent, std::runtime_error if it is not an unsigned integer.
[[nodiscard]] core::SnowflakeId decoded_id_from_json(const nlohmann::json& j);

}  // namespace flakeid::domain
