#pragma once

#include "flakeid/config/generator_config.h"

#include "shared/arg_parser.h"

#include <cstdint>
#include <iostream>
#include <string>
#include <vector>

namespace flakeid::cli {

// generator_options returns the flags shared by every subcommand that resolves a
// GeneratorConfig: --datacenter-id, --worker-id, --state-db.
// field selects the GeneratorConfig member inside the subcommand's own config struct.
// Range checks are left to config::validate_generator_config().
template <typename Config>
std::vector<apps::Option<Config>> generator_options(config::GeneratorConfig Config::*field) {
  auto integer_handler = [field](const char* flag, std::int64_t config::GeneratorConfig::*target) {
    return [field, flag, target](Config& c, const std::string& v) {
      const auto parsed = config::parse_integer_setting(v);
      if (!parsed.has_value()) {
        std::cerr << "Invalid " << flag << ": '" << v << "' is not an integer\n";
        return false;
      }
      (c.*field).*target = parsed.value();
      return true;
    };
  };

  return {
      {"--datacenter-id", true, "Datacenter id, 0-31 (env FLAKEID_DATACENTER_ID, default 0)",
       integer_handler("--datacenter-id", &config::GeneratorConfig::datacenter_id)},
      {"--worker-id", true, "Worker id, 0-31 (env FLAKEID_WORKER_ID, default 0)",
       integer_handler("--worker-id", &config::GeneratorConfig::worker_id)},
      {"--state-db", true, "SQLite file holding the timestamp watermark (env FLAKEID_STATE_DB)",
       [field](Config& c, const std::string& v) {
         (c.*field).state_db = v;
         return true;
       }},
  };
}

}  // namespace flakeid::cli
