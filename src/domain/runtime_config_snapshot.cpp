#include "flakeid/domain/runtime_config_snapshot.h"

#include <nlohmann/json.hpp>

#include <stdexcept>

namespace flakeid::domain {

std::string to_json(const RuntimeConfigSnapshot& snapshot) {
  using json = nlohmann::json;

  // nlohmann::json default container is std::map, so keys sort alphabetically.
  json j;
  j["build_version"] = snapshot.build_version;
  j["datacenter_id"] = snapshot.datacenter_id;
  j["epoch_ms"] = snapshot.epoch_ms;
  j["layout"] = {
      {"datacenter_id_bits", snapshot.datacenter_id_bits},
      {"sequence_bits", snapshot.sequence_bits},
      {"timestamp_bits", snapshot.timestamp_bits},
      {"worker_id_bits", snapshot.worker_id_bits},
  };
  j["snapshot_format_version"] = snapshot.snapshot_format_version;
  j["state_backend"] = snapshot.state_backend;
  if (snapshot.state_db_path.has_value()) {
    j["state_db_path"] = snapshot.state_db_path.value();
  } else {
    j["state_db_path"] = nullptr;
  }
  j["worker_id"] = snapshot.worker_id;

  return j.dump();
}

RuntimeConfigSnapshot from_json(const std::string& json_str) {
  using json = nlohmann::json;

  const json j = json::parse(json_str);
  if (!j.is_object()) {
    throw std::runtime_error("runtime config snapshot must be a JSON object");
  }

  RuntimeConfigSnapshot snapshot;

  snapshot.snapshot_format_version = j.at("snapshot_format_version").get<int>();
  snapshot.build_version = j.at("build_version").get<std::string>();
  snapshot.datacenter_id = j.at("datacenter_id").get<std::int64_t>();
  snapshot.worker_id = j.at("worker_id").get<std::int64_t>();
  snapshot.epoch_ms = j.at("epoch_ms").get<std::int64_t>();

  const json& layout = j.at("layout");
  snapshot.timestamp_bits = layout.at("timestamp_bits").get<int>();
  snapshot.datacenter_id_bits = layout.at("datacenter_id_bits").get<int>();
  snapshot.worker_id_bits = layout.at("worker_id_bits").get<int>();
  snapshot.sequence_bits = layout.at("sequence_bits").get<int>();

  // v1 snapshots predate persistent state.
  snapshot.state_backend = j.value("state_backend", std::string{"none"});
  if (j.contains("state_db_path") && !j.at("state_db_path").is_null()) {
    snapshot.state_db_path = j.at("state_db_path").get<std::string>();
  }

  return snapshot;
}

}  // namespace flakeid::domain
