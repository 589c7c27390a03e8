#pragma once

#include <functional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace devflow::apps {

// Option describes a single command-line flag accepted by a subcommand.
// Config is the caller-defined configuration struct that handlers populate.
//
// handler returns true on success, false on validation failure; the parser
// records the failure and keeps going so every problem is reported at once.
template <typename Config>
struct Option {
  std::string name;            // NOLINT(readability-identifier-naming)
  bool requires_value{false};  // NOLINT(readability-identifier-naming)
  std::string description;     // NOLINT(readability-identifier-naming)
  std::function<bool(Config&, const std::string& value)>
      handler;  // NOLINT(readability-identifier-naming)
};

template <typename Config>
struct ParsedOptions {
  Config config;                         // NOLINT(readability-identifier-naming)
  std::vector<std::string> positionals;  // NOLINT(readability-identifier-naming)
  std::vector<std::string> errors;       // NOLINT(readability-identifier-naming)
};

// parse_options iterates argv[start..argc-1] and dispatches each recognised
// flag to its handler. Non-flag tokens are collected as positionals (the
// issue id of `show 42`). Unknown flags, missing values and handler failures
// are collected as error messages; callers treat any error as a usage error.
template <typename Config>
ParsedOptions<Config> parse_options(int argc, char* argv[],  // NOLINT(modernize-avoid-c-arrays)
                                    const std::vector<Option<Config>>& options, int start = 1,
                                    Config default_config = {}) {
  ParsedOptions<Config> parsed{std::move(default_config), {}, {}};

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
          parsed.errors.push_back("Option " + arg + " requires a value");
          continue;
        }
        value = argv[++i];  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
      }
      if (!opt->handler(parsed.config, value)) {
        parsed.errors.push_back("Invalid value for " + arg + ": '" + value + "'");
      }
    } else if (arg.size() > 1 && arg[0] == '-') {
      parsed.errors.push_back("Unknown option: " + arg);
    } else {
      parsed.positionals.push_back(arg);
    }
  }

  return parsed;
}

// Two-column help text: "  --flag VALUE   description".
template <typename Config>
std::string format_options_help(const std::vector<Option<Config>>& options) {
  std::string out;
  for (const auto& opt : options) {
    std::string left = "  " + opt.name + (opt.requires_value ? " <value>" : "");
    if (left.size() < 28) {
      left.append(28 - left.size(), ' ');
    } else {
      left += "  ";
    }
    out += left + opt.description + "\n";
  }
  return out;
}

}  // namespace devflow::apps
