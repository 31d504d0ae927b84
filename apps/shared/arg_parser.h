#pragma once

#include <functional>
#include <iostream>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace albumcat::apps {

// Option describes a single command-line flag accepted by a subcommand.
// Config is the caller-defined configuration struct that handlers populate.
//
// handler returns true on success, false when the value is rejected. A rejected
// value must leave the config untouched; the parser keeps going and counts the
// rejection so the subcommand can refuse to run with a half-applied config.
template <typename Config>
struct Option {
  std::string name;            // NOLINT(readability-identifier-naming)
  bool requires_value{false};  // NOLINT(readability-identifier-naming)
  std::string description;     // NOLINT(readability-identifier-naming)
  std::function<bool(Config&, const std::string& value)>
      handler;  // NOLINT(readability-identifier-naming)
};

// ParsedOptions is the populated config plus what the parser could not use.
template <typename Config>
struct ParsedOptions {
  Config config;                        // NOLINT(readability-identifier-naming)
  std::vector<std::string> positionals;  // NOLINT(readability-identifier-naming)
  int errors{0};                        // NOLINT(readability-identifier-naming)
};

// parse_options iterates argv[start..argc-1] and dispatches each recognised
// flag to its handler. Non-flag tokens are collected as positionals in order.
// Unknown flags, missing values and rejected values are reported to stderr
// and counted in errors.
template <typename Config>
ParsedOptions<Config> parse_options(int argc, char* argv[],  // NOLINT(modernize-avoid-c-arrays)
                                    const std::vector<Option<Config>>& options, int start = 2,
                                    Config default_config = {}) {
  ParsedOptions<Config> parsed{std::move(default_config), {}, 0};

  std::unordered_map<std::string, const Option<Config>*> option_map;
  for (const auto& opt : options) {
    option_map[opt.name] = &opt;
  }

  for (int i = start; i < argc; ++i) {
    std::string arg = argv[i];  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)

    auto it = option_map.find(arg);
    if (it != option_map.end()) {
      const Option<Config>* opt = it->second;
      std::string value;
      if (opt->requires_value) {
        if (i + 1 >= argc) {
          std::cerr << "Option " << arg << " requires a value\n";
          ++parsed.errors;
          continue;
        }
        value = argv[++i];  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
      }
      if (!opt->handler(parsed.config, value)) {
        ++parsed.errors;
      }
    } else if (arg.size() > 1 && arg[0] == '-' && arg[1] == '-') {
      std::cerr << "Unknown option: " << arg << "\n";
      ++parsed.errors;
    } else {
      parsed.positionals.push_back(arg);
    }
  }

  return parsed;
}

// print_usage writes one line per option, for subcommand help text.
template <typename Config>
void print_usage(std::ostream& out, const std::string& synopsis,
                 const std::vector<Option<Config>>& options) {
  out << "Usage: " << synopsis << "\n";
  for (const auto& opt : options) {
    out << "  " << opt.name << (opt.requires_value ? " <value>" : "") << "  " << opt.description
        << "\n";
  }
}

}  // namespace albumcat::apps
