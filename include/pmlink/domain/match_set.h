#pragma once

#include "pmlink/domain/match_candidate.h"

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

namespace pmlink::domain {

// MatchingCriteria records the acceptance thresholds that produced a MatchSet.
struct MatchingCriteria {
  double min_text_similarity{80.0};       // NOLINT(readability-identifier-naming)
  double min_entity_overlap_ratio{0.3};   // NOLINT(readability-identifier-naming)
  bool strict_entity_matching{true};      // NOLINT(readability-identifier-naming)
  bool semantic_opposite_filtering{true};  // NOLINT(readability-identifier-naming)
  bool domain_exact_match{true};          // NOLINT(readability-identifier-naming)
  double max_time_diff_hours{24.0};       // NOLINT(readability-identifier-naming)
};

// MatchSet is the final artifact of a run.
// Invariant: no left_id and no right_id appears more than once in matches.
// Written once per run; read-only afterwards.
struct MatchSet {
  std::string generated_at;             // NOLINT(readability-identifier-naming)
  MatchingCriteria criteria;            // NOLINT(readability-identifier-naming)
  std::vector<MatchCandidate> matches;  // NOLINT(readability-identifier-naming)
};

// round_to rounds value to the given number of decimal places.
[[nodiscard]] double round_to(double value, int decimals);

// Deterministic JSON serialization.
// Keys are sorted alphabetically; matches keep their MatchSet order.
// time_diff_hours is rounded to 1 decimal (null when unknown), overlap ratios to 3.
[[nodiscard]] nlohmann::json match_set_to_json(const MatchSet& match_set);

// Deserialize a MatchSet from JSON. Throws nlohmann::json::exception on
// missing required fields or type mismatches, std::runtime_error on an unknown domain.
[[nodiscard]] MatchSet match_set_from_json(const nlohmann::json& j);

}  // namespace pmlink::domain
