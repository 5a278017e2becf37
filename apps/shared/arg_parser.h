#pragma once

#include <functional>
#include <iomanip>
#include <iostream>
#include <optional>
#include <ostream>
#include <string>
#include <unordered_map>
#include <vector>

namespace pmlink::apps {

// Option describes one flag accepted by a pmlink_cli subcommand.
// Config is the subcommand's own settings struct; handlers write into it.
//
// A handler returns false when the value is unusable (bad number, unknown
// profile). It reports the reason on stderr itself.
template <typename Config>
struct Option {
  std::string name;            // NOLINT(readability-identifier-naming)
  bool requires_value{false};  // NOLINT(readability-identifier-naming)
  std::string description;     // NOLINT(readability-identifier-naming)
  std::function<bool(Config&, const std::string& value)>
      handler;  // NOLINT(readability-identifier-naming)
};

// parse_options walks argv[start..argc-1] and dispatches each known flag.
//
// Returns nullopt when a handler rejects its value, a value is missing, or an
// unknown flag is given; all problems are reported before returning so one
// invocation shows every mistake. Non-flag tokens are skipped.
template <typename Config>
std::optional<Config> parse_options(int argc, char* argv[],  // NOLINT(modernize-avoid-c-arrays)
                                    const std::vector<Option<Config>>& options, int start = 2,
                                    Config default_config = {}) {
  Config config = std::move(default_config);
  bool ok = true;

  std::unordered_map<std::string, const Option<Config>*> by_name;
  for (const auto& opt : options) {
    by_name[opt.name] = &opt;
  }

  for (int i = start; i < argc; ++i) {
    const std::string arg = argv[i];  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)

    const auto it = by_name.find(arg);
    if (it == by_name.end()) {
      if (!arg.empty() && arg[0] == '-') {
        std::cerr << "Unknown option: " << arg << "\n";
        ok = false;
      }
      continue;
    }

    const Option<Config>* opt = it->second;
    if (!opt->requires_value) {
      ok = opt->handler(config, "") && ok;
      continue;
    }
    if (i + 1 >= argc) {
      std::cerr << "Option " << arg << " requires a value\n";
      ok = false;
      continue;
    }
    ok = opt->handler(config, argv[++i]) &&  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
         ok;
  }

  if (!ok) {
    return std::nullopt;
  }
  return config;
}

// print_options writes one aligned line per flag, for usage messages.
template <typename Config>
void print_options(std::ostream& out, const std::vector<Option<Config>>& options) {
  for (const auto& opt : options) {
    const std::string flag = opt.requires_value ? opt.name + " <value>" : opt.name;
    out << "  " << std::left << std::setw(32) << flag << opt.description << "\n";
  }
}

}  // namespace pmlink::apps
