#pragma once

#include <functional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace ldmcp::apps {

// Option describes a single command-line flag accepted by an app.
// Config is the caller-defined configuration struct that handlers populate.
//
// handler returns true on success, false when the value is rejected.
template <typename Config>
struct Option {
  std::string name;            // NOLINT(readability-identifier-naming)
  bool requires_value{false};  // NOLINT(readability-identifier-naming)
  std::string description;     // NOLINT(readability-identifier-naming)
  std::function<bool(Config&, const std::string& value)>
      handler;  // NOLINT(readability-identifier-naming)
};

// ParsedOptions is the populated config plus every problem found on the
// command line, in argv order. Parsing never stops early; the caller decides
// whether errors are fatal.
template <typename Config>
struct ParsedOptions {
  Config config;                    // NOLINT(readability-identifier-naming)
  std::vector<std::string> errors;  // NOLINT(readability-identifier-naming)
};

// parse_options iterates argv[start..argc-1] and dispatches each recognised
// flag to its handler. Unknown flags, missing values and rejected values are
// collected into errors. Non-flag tokens are skipped (positional arguments
// are the caller's concern).
template <typename Config>
ParsedOptions<Config> parse_options(int argc, char* argv[],  // NOLINT(modernize-avoid-c-arrays)
                                    const std::vector<Option<Config>>& options, int start = 1,
                                    Config default_config = {}) {
  ParsedOptions<Config> parsed{std::move(default_config), {}};

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
          std::string value = argv[++i];  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
          if (!opt->handler(parsed.config, value)) {
            parsed.errors.push_back("Invalid value for " + arg + ": " + value);
          }
        } else {
          parsed.errors.push_back("Option " + arg + " requires a value");
        }
      } else if (!opt->handler(parsed.config, "")) {
        parsed.errors.push_back("Option " + arg + " was rejected");
      }
    } else if (!arg.empty() && arg[0] == '-') {
      parsed.errors.push_back("Unknown option: " + arg);
    }
  }

  return parsed;
}

// format_usage renders one "  <name> [value]  <description>" line per option.
template <typename Config>
std::string format_usage(const std::string& program, const std::vector<Option<Config>>& options) {
  std::string usage = "Usage: " + program + " [options]\n\nOptions:\n";
  for (const auto& opt : options) {
    usage += "  " + opt.name + (opt.requires_value ? " <value>" : "") + "\n      " +
             opt.description + "\n";
  }
  return usage;
}

}  // namespace ldmcp::apps
