#include "show_config.h"

#include "flakeid/config/generator_config.h"
#include "flakeid/domain/runtime_config_snapshot.h"

#include <nlohmann/json.hpp>

#include "generator_options.h"
#include "shared/arg_parser.h"
#include <exception>
#include <iostream>
#include <string>

namespace {

struct ConfigCliConfig {
  flakeid::config::GeneratorConfig generator;
};

}  // namespace

int cmd_config(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  using namespace flakeid;

  const auto options = cli::generator_options(&ConfigCliConfig::generator);

  ConfigCliConfig defaults;
  const std::string env_error =
      config::apply_environment(defaults.generator, config::system_env_lookup());
  if (!env_error.empty()) {
    std::cerr << env_error << "\n";
    return 1;
  }

  auto parsed = apps::parse_options(argc, argv, options, 2, defaults);
  if (!parsed.ok || !parsed.positionals.empty()) {
    apps::print_usage(std::cerr, "flakeid_cli config [options]", options);
    return 1;
  }

  // Print the snapshot even when invalid so operators can see what was resolved.
  const auto snapshot = config::to_runtime_snapshot(parsed.config.generator);
  try {
    std::cout << nlohmann::json::parse(domain::to_json(snapshot)).dump(2) << "\n";
  } catch (const std::exception& e) {
    std::cerr << "Error: failed to render config snapshot: " << e.what() << "\n";
    return 1;
  }

  const std::string config_error = config::validate_generator_config(parsed.config.generator);
  if (!config_error.empty()) {
    std::cerr << config_error << "\n";
    return 1;
  }
  return 0;
}
