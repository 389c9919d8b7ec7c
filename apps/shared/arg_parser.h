#pragma once

#include <functional>
#include <iostream>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace deptcat::apps {

// Option describes a single command-line flag accepted by an app.
// Config is the caller-defined configuration struct that handlers populate.
//
// handler returns true on success, false on validation failure. The parser keeps
// processing remaining flags and records the failure in ParsedOptions::errors.
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
  Config config;                    // NOLINT(readability-identifier-naming)
  std::vector<std::string> errors;  // NOLINT(readability-identifier-naming)

  [[nodiscard]] bool ok() const { return errors.empty(); }
};

// parse_options iterates argv[start..argc-1] and dispatches each recognised flag
// to its handler. Unknown flags, missing values and rejected values are reported to
// stderr and collected in errors; non-flag tokens are skipped.
template <typename Config>
ParsedOptions<Config> parse_options(int argc, char* argv[],  // NOLINT(modernize-avoid-c-arrays)
                                    const std::vector<Option<Config>>& options, int start = 1,
                                    Config default_config = {}) {
  ParsedOptions<Config> parsed{std::move(default_config), {}};

  std::unordered_map<std::string, const Option<Config>*> option_map;
  for (const auto& opt : options) {
    option_map[opt.name] = &opt;
  }

  const auto fail = [&parsed](std::string message) {
    std::cerr << message << "\n";
    parsed.errors.push_back(std::move(message));
  };

  for (int i = start; i < argc; ++i) {
    std::string arg = argv[i];  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)

    auto it = option_map.find(arg);
    if (it != option_map.end()) {
      const Option<Config>* opt = it->second;
      if (opt->requires_value) {
        if (i + 1 < argc) {
          const std::string value =
              argv[++i];  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
          if (!opt->handler(parsed.config, value)) {
            fail("Invalid value for " + arg + ": " + value);
          }
        } else {
          fail("Option " + arg + " requires a value");
        }
      } else if (!opt->handler(parsed.config, "")) {
        fail("Invalid option: " + arg);
      }
    } else if (!arg.empty() && arg[0] == '-') {
      fail("Unknown option: " + arg);
    }
  }

  return parsed;
}

// usage_text lists every registered option, one per line.
template <typename Config>
std::string usage_text(const std::string& program, const std::vector<Option<Config>>& options) {
  std::string text = "Usage: " + program + " [options]\n";
  for (const auto& opt : options) {
    text += "  " + opt.name + (opt.requires_value ? " <value>" : "") + "\n      " +
            opt.description + "\n";
  }
  return text;
}

}  // namespace deptcat::apps
