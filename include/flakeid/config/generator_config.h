#pragma once

#include "flakeid/domain/runtime_config_snapshot.h"

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace flakeid::config {

// Environment variables recognised by apply_environment().
inline constexpr const char* kEnvDatacenterId = "FLAKEID_DATACENTER_ID";
inline constexpr const char* kEnvWorkerId = "FLAKEID_WORKER_ID";
inline constexpr const char* kEnvStateDb = "FLAKEID_STATE_DB";

// GeneratorConfig holds the node settings an entry point resolves at startup.
// Precedence: defaults < environment < command-line flags.
//
// datacenter_id / worker_id are kept as raw integers until validate_generator_config()
// so an out-of-range value can be reported with the key that produced it.
// Every deployment is expected to override the 0/0 defaults so that no two running
// instances share an identity.
struct GeneratorConfig {
  std::int64_t datacenter_id{0};        // NOLINT(readability-identifier-naming)
  std::int64_t worker_id{0};            // NOLINT(readability-identifier-naming)
  std::optional<std::string> state_db;  // NOLINT(readability-identifier-naming)
};

// EnvLookup returns the value of an environment variable, or nullopt if unset.
using EnvLookup = std::function<std::optional<std::string>(const std::string& name)>;

// system_env_lookup reads the process environment via std::getenv.
[[nodiscard]] EnvLookup system_env_lookup();

// parse_integer_setting parses a base-10 integer with an optional leading '-'.
// The whole string must be consumed; empty strings, whitespace and overflow are rejected.
[[nodiscard]] std::optional<std::int64_t> parse_integer_setting(std::string_view text);

// apply_environment overlays FLAKEID_* variables onto config.
//
// Returns: "" on success, non-empty error message naming the offending variable
// on failure. Variables after the first bad one are not applied.
[[nodiscard]] std::string apply_environment(GeneratorConfig& config, const EnvLookup& lookup);

// validate_generator_config checks startup preconditions.
//
// Returns: "" on success, non-empty error message on failure.
// Caller is responsible for printing the error and exiting with code 1.
//
// Preconditions checked (first failure is returned):
// - datacenter_id is within [0, 31]
// - worker_id is within [0, 31]
// - state_db, when present, is non-empty
[[nodiscard]] std::string validate_generator_config(const GeneratorConfig& config);

// to_runtime_snapshot records the resolved configuration together with the
// build version and Id layout constants.
[[nodiscard]] domain::RuntimeConfigSnapshot to_runtime_snapshot(const GeneratorConfig& config);

}  // namespace flakeid::config
