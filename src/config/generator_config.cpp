#include "flakeid/config/generator_config.h"

#include "flakeid/core/layout.h"
#include "flakeid/core/node_identity.h"
#include "flakeid/core/version.h"

#include <charconv>
#include <cstdlib>
#include <system_error>

namespace flakeid::config {

EnvLookup system_env_lookup() {
  return [](const std::string& name) -> std::optional<std::string> {
    const char* value = std::getenv(name.c_str());
    if (value == nullptr) {
      return std::nullopt;
    }
    return std::string{value};
  };
}

std::optional<std::int64_t> parse_integer_setting(std::string_view text) {
  if (text.empty()) {
    return std::nullopt;
  }

  std::int64_t value = 0;
  const auto* first = text.data();
  const auto* last = text.data() + text.size();
  const auto [ptr, ec] = std::from_chars(first, last, value);
  if (ec != std::errc{} || ptr != last) {
    return std::nullopt;
  }

  return value;
}

std::string apply_environment(GeneratorConfig& config, const EnvLookup& lookup) {
  if (const auto raw = lookup(kEnvDatacenterId); raw.has_value()) {
    const auto parsed = parse_integer_setting(raw.value());
    if (!parsed.has_value()) {
      return std::string("Error: ") + kEnvDatacenterId + "='" + raw.value() +
             "' is not an integer";
    }
    config.datacenter_id = parsed.value();
  }

  if (const auto raw = lookup(kEnvWorkerId); raw.has_value()) {
    const auto parsed = parse_integer_setting(raw.value());
    if (!parsed.has_value()) {
      return std::string("Error: ") + kEnvWorkerId + "='" + raw.value() + "' is not an integer";
    }
    config.worker_id = parsed.value();
  }

  if (const auto raw = lookup(kEnvStateDb); raw.has_value()) {
    config.state_db = raw.value();
  }

  return "";
}

std::string validate_generator_config(const GeneratorConfig& config) {
  const auto identity = core::make_node_identity(config.datacenter_id, config.worker_id);
  if (!identity.has_value()) {
    return "Error: " + core::to_string(identity.error()) +
           ".\n"
           "       Set --" +
           core::to_string(identity.error().field) + " or the matching FLAKEID_* variable.";
  }

  if (config.state_db.has_value() && config.state_db->empty()) {
    return "Error: --state-db requires a non-empty path";
  }

  return "";
}

domain::RuntimeConfigSnapshot to_runtime_snapshot(const GeneratorConfig& config) {
  domain::RuntimeConfigSnapshot snapshot;
  snapshot.build_version = core::kBuildVersion;
  snapshot.datacenter_id = config.datacenter_id;
  snapshot.worker_id = config.worker_id;
  snapshot.epoch_ms = core::kEpochMillis;
  snapshot.timestamp_bits = core::kTimestampBits;
  snapshot.datacenter_id_bits = core::kDatacenterIdBits;
  snapshot.worker_id_bits = core::kWorkerIdBits;
  snapshot.sequence_bits = core::kSequenceBits;
  snapshot.state_backend = config.state_db.has_value() ? "sqlite" : "none";
  if (config.state_db.has_value()) {
    snapshot.state_db_path = config.state_db.value();
  }
  return snapshot;
}

}  // namespace flakeid::config
