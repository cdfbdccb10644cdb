#include "flakeid/core/version.h"

#include "commands/decode.h"
#include "commands/next.h"
#include "commands/show_config.h"
#include <iostream>
#include <string>

namespace {

void print_help() {
  std::cout << "flakeid_cli v" << flakeid::core::kBuildVersion << "\n"
            << "Usage: flakeid_cli <command> [options]\n"
            << "\n"
            << "Commands:\n"
            << "  next     Issue Snowflake ids (--count, --json, --datacenter-id, --worker-id,\n"
            << "           --state-db)\n"
            << "  decode   Print the fields of an id (--json)\n"
            << "  config   Print the resolved runtime configuration as JSON\n"
            << "  help     Show this message\n"
            << "\n"
            << "Environment: FLAKEID_DATACENTER_ID, FLAKEID_WORKER_ID, FLAKEID_STATE_DB\n";
}

}  // namespace

int main(int argc, char* argv[]) {
  if (argc < 2) {
    print_help();
    return 1;
  }

  const std::string subcommand = argv[1];
  if (subcommand == "next") {
    return cmd_next(argc, argv);
  }
  if (subcommand == "decode") {
    return cmd_decode(argc, argv);
  }
  if (subcommand == "config") {
    return cmd_config(argc, argv);
  }
  if (subcommand == "help" || subcommand == "--help" || subcommand == "-h") {
    print_help();
    return 0;
  }
  if (subcommand == "--version") {
    std::cout << flakeid::core::kBuildVersion << "\n";
    return 0;
  }

  std::cerr << "Unknown command: " << subcommand << "\n";
  print_help();
  return 1;
}
