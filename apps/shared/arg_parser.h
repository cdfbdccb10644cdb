#pragma once

#include <functional>
#include <iostream>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

namespace flakeid::apps {

// Option describes a single command-line flag accepted by a subcommand.
// Config is the caller-defined configuration struct that handlers populate.
//
// handler returns true on success, false on validation failure. Handlers report
// their own error text to stderr.
template <typename Config>
struct Option {
  std::string name;            // NOLINT(readability-identifier-naming)
  bool requires_value{false};  // NOLINT(readability-identifier-naming)
  std::string description;     // NOLINT(readability-identifier-naming)
  std::function<bool(Config&, const std::string& value)>
      handler;  // NOLINT(readability-identifier-naming)
};

template <typename Config>
struct ParsedArgs {
  Config config;                         // NOLINT(readability-identifier-naming)
  std::vector<std::string> positionals;  // NOLINT(readability-identifier-naming)
  bool ok{true};                         // NOLINT(readability-identifier-naming)
};

// parse_options iterates argv[start..argc-1] and dispatches each recognised flag to
// its handler. Values are taken from the next token or from "--flag=value".
// Non-flag tokens are collected as positionals in order.
//
// ok is false when a handler rejected its value, a value was missing, or an unknown
// flag was seen; all such problems are reported to stderr and parsing continues so
// every error surfaces in one run.
template <typename Config>
ParsedArgs<Config> parse_options(int argc, char* argv[],  // NOLINT(modernize-avoid-c-arrays)
                                 const std::vector<Option<Config>>& options, int start = 1,
                                 Config default_config = {}) {
  ParsedArgs<Config> parsed{std::move(default_config), {}, true};

  std::unordered_map<std::string, const Option<Config>*> option_map;
  for (const auto& opt : options) {
    option_map[opt.name] = &opt;
  }

  for (int i = start; i < argc; ++i) {
    std::string arg = argv[i];  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)

    if (arg.size() < 2 || arg[0] != '-') {
      parsed.positionals.push_back(std::move(arg));
      continue;
    }

    std::string inline_value;
    bool has_inline_value = false;
    if (const auto eq = arg.find('='); eq != std::string::npos) {
      inline_value = arg.substr(eq + 1);
      arg.resize(eq);
      has_inline_value = true;
    }

    auto it = option_map.find(arg);
    if (it == option_map.end()) {
      std::cerr << "Unknown option: " << arg << "\n";
      parsed.ok = false;
      continue;
    }

    const Option<Config>* opt = it->second;
    if (!opt->requires_value) {
      if (has_inline_value) {
        std::cerr << "Option " << arg << " does not take a value\n";
        parsed.ok = false;
        continue;
      }
      parsed.ok = opt->handler(parsed.config, "") && parsed.ok;
      continue;
    }

    if (has_inline_value) {
      parsed.ok = opt->handler(parsed.config, inline_value) && parsed.ok;
    } else if (i + 1 < argc) {
      parsed.ok = opt->handler(parsed.config,
                               argv[++i]) &&  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
                  parsed.ok;
    } else {
      std::cerr << "Option " << arg << " requires a value\n";
      parsed.ok = false;
    }
  }

  return parsed;
}

// print_usage lists options in registration order, one per line.
template <typename Config>
void print_usage(std::ostream& out, std::string_view synopsis,
                 const std::vector<Option<Config>>& options) {
  out << "Usage: " << synopsis << "\n";
  for (const auto& opt : options) {
    out << "  " << opt.name << (opt.requires_value ? " <value>" : "") << "\n"
        << "      " << opt.description << "\n";
  }
}

}  // namespace flakeid::apps
