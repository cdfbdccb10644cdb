#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace flakeid::domain {

// RuntimeConfigSnapshot is an immutable record of the generator configuration at
// startup. Printed by `flakeid_cli config` so operators can check which identity,
// epoch and layout a node runs with before it issues any Id.
//
// snapshot_format_version: tracks the JSON schema of this struct itself.
//   v1 = identity + epoch + layout
//   v2 = adds state_backend / state_db_path
// Keys in the JSON representation are sorted alphabetically for determinism.
struct RuntimeConfigSnapshot {
  int snapshot_format_version{2};              // NOLINT(readability-identifier-naming)
  std::string build_version;                   // NOLINT(readability-identifier-naming)
  std::int64_t datacenter_id{0};               // NOLINT(readability-identifier-naming)
  std::int64_t worker_id{0};                   // NOLINT(readability-identifier-naming)
  std::int64_t epoch_ms{0};                    // NOLINT(readability-identifier-naming)
  int timestamp_bits{0};                       // NOLINT(readability-identifier-naming)
  int datacenter_id_bits{0};                   // NOLINT(readability-identifier-naming)
  int worker_id_bits{0};                       // NOLINT(readability-identifier-naming)
  int sequence_bits{0};                        // NOLINT(readability-identifier-naming)
  std::string state_backend{"none"};           // NOLINT(readability-identifier-naming)
  std::optional<std::string> state_db_path;    // NOLINT(readability-identifier-naming)
};

// to_json serializes a RuntimeConfigSnapshot to a JSON string.
// Keys are sorted alphabetically.  Output is deterministic given the same input.
// state_db_path is emitted as null when absent.
[[nodiscard]] std::string to_json(const RuntimeConfigSnapshot& snapshot);

// from_json deserializes a RuntimeConfigSnapshot from a JSON string.
// Throws std::runtime_error (or nlohmann::json::exception) if required fields are
// absent or have wrong types.
[[nodiscard]] RuntimeConfigSnapshot from_json(const std::string& json_str);

}  // namespace flakeid::domain
