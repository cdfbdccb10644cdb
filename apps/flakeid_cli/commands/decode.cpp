#include "decode.h"

#include "decode_logic.h"
#include "shared/arg_parser.h"
#include <iostream>
#include <string>
#include <vector>

namespace {

struct DecodeCliConfig {
  bool json{false};
};

}  // namespace

int cmd_decode(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  const std::vector<flakeid::apps::Option<DecodeCliConfig>> options = {
      {"--json", false, "Print the decoded fields as JSON",
       [](DecodeCliConfig& c, const std::string& /*unused*/) {
         c.json = true;
         return true;
       }},
  };
  auto parsed = flakeid::apps::parse_options(argc, argv, options, 2);

  if (!parsed.ok || parsed.positionals.size() != 1) {
    flakeid::apps::print_usage(std::cerr, "flakeid_cli decode <id> [--json]", options);
    return 1;
  }

  return flakeid::cli::execute_decode(parsed.positionals.front(), parsed.config.json, std::cout,
                                      std::cerr);
}
