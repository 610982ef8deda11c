#pragma once

#include <functional>
#include <iostream>
#include <string>
#include <unordered_map>
#include <vector>

namespace xid::apps {

// Option describes a single command-line flag accepted by a subcommand.
// Config is the caller-defined configuration struct that handlers populate.
//
// handler returns true on success, false on validation failure (the parser
// continues processing remaining flags regardless of the return value).
template <typename Config>
struct Option {
  std::string name;            // NOLINT(readability-identifier-naming)
  bool requires_value{false};  // NOLINT(readability-identifier-naming)
  std::string description;     // NOLINT(readability-identifier-naming)
  std::function<bool(Config&, const std::string& value)>
      handler;  // NOLINT(readability-identifier-naming)
};

// parse_options iterates argv[start..argc-1], dispatches each recognised flag
// to its handler, and returns the populated config.
// Unknown flags are reported to stderr. Non-flag tokens are appended to
// positionals when it is non-null and skipped otherwise. When args_ok is
// non-null it is cleared on an unknown flag, a flag missing its value, or a
// handler returning false.
template <typename Config>
Config parse_options(int argc, char* argv[],  // NOLINT(modernize-avoid-c-arrays)
                     const std::vector<Option<Config>>& options, int start = 1,
                     Config default_config = {},
                     std::vector<std::string>* positionals = nullptr,
                     bool* args_ok = nullptr) {
  Config config = std::move(default_config);

  std::unordered_map<std::string, const Option<Config>*> option_map;
  for (const auto& opt : options) {
    option_map[opt.name] = &opt;
  }

  const auto fail = [args_ok] {
    if (args_ok != nullptr) {
      *args_ok = false;
    }
  };

  for (int i = start; i < argc; ++i) {
    std::string arg = argv[i];  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)

    auto it = option_map.find(arg);
    if (it != option_map.end()) {
      const Option<Config>* opt = it->second;
      if (opt->requires_value) {
        if (i + 1 < argc) {
          if (!opt->handler(config, argv[++i])) {  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
            fail();
          }
        } else {
          std::cerr << "Option " << arg << " requires a value\n";
          fail();
        }
      } else if (!opt->handler(config, "")) {
        fail();
      }
    } else if (!arg.empty() && arg[0] == '-') {
      std::cerr << "Unknown option: " << arg << "\n";
      fail();
    } else if (positionals != nullptr) {
      positionals->push_back(std::move(arg));
    }
  }

  return config;
}

// print_usage lists the options of a subcommand, one per line.
template <typename Config>
void print_usage(std::ostream& os, const std::string& usage,
                 const std::vector<Option<Config>>& options) {
  os << "Usage: " << usage << "\n";
  for (const auto& opt : options) {
    os << "  " << opt.name << (opt.requires_value ? " <value>" : "") << "\n      "
       << opt.description << "\n";
  }
}

}  // namespace xid::apps
