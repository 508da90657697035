#pragma once

#include <functional>
#include <iostream>
#include <string>
#include <unordered_map>
#include <vector>

namespace cvec::apps {

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

// ParsedOptions carries the populated config plus the non-flag tokens, in order.
template <typename Config>
struct ParsedOptions {
  Config config;                            // NOLINT(readability-identifier-naming)
  std::vector<std::string> positionals;     // NOLINT(readability-identifier-naming)
  bool ok{true};                            // NOLINT(readability-identifier-naming)
};

// parse_options iterates argv[start..argc-1] and dispatches each recognised flag
// to its handler. Unknown flags and missing values are reported to stderr and
// clear ok. Non-flag tokens are collected as positionals.
template <typename Config>
ParsedOptions<Config> parse_options(int argc, char* argv[],  // NOLINT(modernize-avoid-c-arrays)
                                    const std::vector<Option<Config>>& options, int start = 1,
                                    Config default_config = {}) {
  ParsedOptions<Config> parsed{std::move(default_config), {}, true};

  std::unordered_map<std::string, const Option<Config>*> option_map;
  for (const auto& opt : options) {
    option_map[opt.name] = &opt;
  }

  for (int i = start; i < argc; ++i) {
    std::string arg = argv[i];  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)

    auto it = option_map.find(arg);
    if (it != option_map.end()) {
      const Option<Config>* opt = it->second;
      if (opt->requires_value) {
        if (i + 1 < argc) {
          if (!opt->handler(parsed.config,
                            argv[++i])) {  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
            parsed.ok = false;
          }
        } else {
          std::cerr << "Option " << arg << " requires a value\n";
          parsed.ok = false;
        }
      } else if (!opt->handler(parsed.config, "")) {
        parsed.ok = false;
      }
    } else if (arg.size() > 1 && arg[0] == '-' && arg[1] == '-') {
      std::cerr << "Unknown option: " << arg << "\n";
      parsed.ok = false;
    } else {
      parsed.positionals.push_back(std::move(arg));
    }
  }

  return parsed;
}

}  // namespace cvec::apps
