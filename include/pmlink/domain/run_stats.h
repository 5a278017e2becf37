#pragma once

#include <nlohmann/json.hpp>

#include <cstddef>
#include <map>
#include <string>

namespace pmlink::domain {

// CatalogStats counts what happened to one catalog during normalization.
struct CatalogStats {
  size_t loaded{0};    // raw records read from the source
  size_t filtered{0};  // dropped for an empty title
  size_t rejected{0};  // contract violations (absent field, duplicate id)
  size_t accepted{0};  // records that reached matching
};

// RunStats is the bookkeeping of one pipeline run.
// Written into the RunCompleted audit payload and printed by the CLI.
struct RunStats {
  CatalogStats left;   // NOLINT(readability-identifier-naming)
  CatalogStats right;  // NOLINT(readability-identifier-naming)
  std::map<std::string, size_t> right_bucket_sizes;  // domain name -> right records
  size_t pairs_scored{0};         // similarity computations performed
  size_t best_candidates{0};      // left records with a candidate at or above cutoff
  std::map<std::string, size_t> gate_rejections;     // gate rule name -> rejected candidates
  size_t time_check_rejections{0};  // NOLINT(readability-identifier-naming)
  size_t pool_size{0};            // candidates that passed the gate
  size_t final_matches{0};        // NOLINT(readability-identifier-naming)
  size_t failed_left_records{0};  // left records whose processing threw
};

// Keys are sorted alphabetically.
[[nodiscard]] nlohmann::json catalog_stats_to_json(const CatalogStats& stats);
[[nodiscard]] nlohmann::json run_stats_to_json(const RunStats& stats);

}  // namespace pmlink::domain
