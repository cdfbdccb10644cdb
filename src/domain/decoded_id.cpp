#include "flakeid/domain/decoded_id.h"

#include <stdexcept>

namespace flakeid::domain {

nlohmann::json decoded_id_to_json(core::SnowflakeId id) {
  const core::IdParts parts = core::decompose(id);

  nlohmann::json j;
  j["id"] = id.value;
  j["timestamp_offset_ms"] = parts.timestamp_offset_ms;
  j["unix_ms"] = core::unix_millis(parts);
  j["datacenter_id"] = parts.datacenter_id;
  j["worker_id"] = parts.worker_id;
  j["sequence"] = parts.sequence;
  return j;
}

core::SnowflakeId decoded_id_from_json(const nlohmann::json& j) {
  const nlohmann::json& id = j.at("id");
  if (!id.is_number_unsigned()) {
    throw std::runtime_error("decoded id: \"id\" must be an unsigned integer");
  }
  return core::SnowflakeId{id.get<std::uint64_t>()};
}

}  // namespace flakeid::domain
