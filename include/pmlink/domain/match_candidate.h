#pragma once

#include "pmlink/core/ids.h"
#include "pmlink/domain/market_domain.h"

#include <optional>
#include <string>
#include <vector>

namespace pmlink::domain {

// MatchCandidate is the best-scoring right record for one left record.
// At most one candidate exists per left record; candidates that pass the
// quality gate are pooled and resolved by the deduplicator.
struct MatchCandidate {
  core::RecordId left_id;                 // NOLINT(readability-identifier-naming)
  core::RecordId right_id;                // NOLINT(readability-identifier-naming)
  std::string left_title;                 // NOLINT(readability-identifier-naming)
  std::string right_title;                // NOLINT(readability-identifier-naming)
  double score{0.0};                      // token-set similarity in [cutoff, 100]
  MarketDomain domain{MarketDomain::kOther};
  std::optional<double> time_diff_hours;  // nullopt if either side lacks an end time
  double entity_overlap_ratio{0.0};       // Jaccard over entity sets
  double number_overlap_ratio{0.0};       // Jaccard over numeric-token sets
  std::vector<std::string> shared_entities;  // sorted
  std::vector<std::string> shared_numbers;   // sorted
};

}  // namespace pmlink::domain
