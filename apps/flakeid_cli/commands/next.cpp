#include "next.h"

#include "flakeid/config/generator_config.h"
#include "flakeid/core/clock.h"
#include "flakeid/core/node_identity.h"
#include "flakeid/core/version.h"
#include "flakeid/storage/inmemory_watermark_store.h"
#include "flakeid/storage/sqlite/sqlite_db.h"
#include "flakeid/storage/sqlite/sqlite_watermark_store.h"

#include "generator_options.h"
#include "next_logic.h"
#include "shared/arg_parser.h"
#include <cstdint>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

namespace {

struct NextCliConfig {
  flakeid::config::GeneratorConfig generator;
  int count{1};
  flakeid::cli::OutputFormat format{flakeid::cli::OutputFormat::kPlain};
};

// Upper bound for one invocation; larger batches belong in a library caller.
constexpr std::int64_t kMaxCount = 1'000'000;

}  // namespace

int cmd_next(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  using namespace flakeid;

  auto options = cli::generator_options(&NextCliConfig::generator);
  options.push_back({"--count", true, "Number of ids to issue (default 1)",
                     [](NextCliConfig& c, const std::string& v) {
                       const auto parsed = config::parse_integer_setting(v);
                       if (!parsed.has_value() || parsed.value() < 1 ||
                           parsed.value() > kMaxCount) {
                         std::cerr << "Invalid --count: " << v << " (valid: 1-" << kMaxCount
                                   << ")\n";
                         return false;
                       }
                       c.count = static_cast<int>(parsed.value());
                       return true;
                     }});
  options.push_back({"--json", false, "Print decoded ids as a JSON array",
                     [](NextCliConfig& c, const std::string& /*unused*/) {
                       c.format = cli::OutputFormat::kJson;
                       return true;
                     }});

  // Environment first so that flags override it.
  NextCliConfig defaults;
  const std::string env_error =
      config::apply_environment(defaults.generator, config::system_env_lookup());
  if (!env_error.empty()) {
    std::cerr << env_error << "\n";
    return 1;
  }

  auto parsed = apps::parse_options(argc, argv, options, 2, defaults);
  if (!parsed.ok || !parsed.positionals.empty()) {
    if (!parsed.positionals.empty()) {
      std::cerr << "Unexpected argument: " << parsed.positionals.front() << "\n";
    }
    apps::print_usage(std::cerr, "flakeid_cli next [options]", options);
    return 1;
  }
  const NextCliConfig& cfg = parsed.config;

  // Validate before emitting any startup output so no partial messages appear on error.
  const std::string config_error = config::validate_generator_config(cfg.generator);
  if (!config_error.empty()) {
    std::cerr << config_error << "\n";
    return 1;
  }

  const auto identity =
      core::make_node_identity(cfg.generator.datacenter_id, cfg.generator.worker_id);
  if (!identity.has_value()) {
    std::cerr << "Error: " << core::to_string(identity.error()) << "\n";
    return 1;
  }

  // ── Startup diagnostic block (stderr; stdout carries only ids) ─────────
  std::cerr << "flakeid v" << core::kBuildVersion << "\n";
  std::cerr << "Identity:    " << core::to_string(identity.value()) << "\n";

  std::unique_ptr<storage::IWatermarkStore> store;
  if (cfg.generator.state_db.has_value()) {
    const std::string& path = cfg.generator.state_db.value();
    auto db_result = storage::sqlite::SqliteDb::open(path);
    if (!db_result.has_value()) {
      std::cerr << "Failed to open state database: " << db_result.error() << "\n";
      return 1;
    }

    auto db = db_result.value();
    auto schema_result = db->ensure_schema_v1();
    if (!schema_result.has_value()) {
      std::cerr << "Failed to initialize schema: " << schema_result.error() << "\n";
      return 1;
    }

    std::cerr << "State:       SQLite -- " << path << "\n";
    store = std::make_unique<storage::sqlite::SqliteWatermarkStore>(db);
  } else {
    std::cerr << "WARNING: No --state-db specified. The timestamp watermark is EPHEMERAL.\n"
                 "         A restart onto a clock that is behind this run cannot be detected.\n"
                 "         Pass --state-db <path> to enable the restart guard.\n";
    store = std::make_unique<storage::InMemoryWatermarkStore>();
  }
  // ──────────────────────────────────────────────────────────────────────

  core::SystemClock clock;
  return cli::execute_next(identity.value(), cfg.count, cfg.format, clock, *store, std::cout,
                           std::cerr);
}
