#pragma once

#include "pmlink/core/result.h"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <string>

namespace pmlink::matching {

// MatchConfig is the externally overridable part of a run.
//
// Defaults:
//   score_cutoff          80   minimum token-set score for a best candidate
//   max_time_diff_hours   24   temporal pruning window
//   worker_threads         1   shards of the per-left-record map phase
//   reject_conflicting_bps false
struct MatchConfig {
  double score_cutoff{80.0};          // NOLINT(readability-identifier-naming)
  double max_time_diff_hours{24.0};   // NOLINT(readability-identifier-naming)
  size_t worker_threads{1};           // NOLINT(readability-identifier-naming)
  bool reject_conflicting_bps{false};  // NOLINT(readability-identifier-naming)

  // validate checks ranges: cutoff in [0, 100], window >= 0, at least one worker.
  // Returns ok(true) if valid, err(message) if invalid.
  [[nodiscard]] core::Result<bool, std::string> validate() const;
};

// Read a config object. Missing keys keep their defaults; unknown keys are ignored.
// A key holding the wrong JSON type is an error.
[[nodiscard]] core::Result<MatchConfig, std::string> match_config_from_json(
    const nlohmann::json& j);

// Read a config file from disk (see match_config_from_json).
[[nodiscard]] core::Result<MatchConfig, std::string> load_match_config_file(
    const std::string& path);

// Keys are sorted alphabetically.
[[nodiscard]] nlohmann::json match_config_to_json(const MatchConfig& config);

}  // namespace pmlink::matching
