#pragma once

#include "pmlink/domain/match_candidate.h"

#include <vector>

namespace pmlink::matching {

// Weights of the composite ranking score.
inline constexpr double kEntityOverlapWeight = 30.0;
inline constexpr double kNumberOverlapWeight = 20.0;

// composite_score = score + 30 * entity_overlap_ratio + 20 * number_overlap_ratio
[[nodiscard]] double composite_score(const domain::MatchCandidate& candidate);

// deduplicate resolves the pooled candidates into an injective match list.
//
// Candidates are stable-sorted by descending composite score, then walked
// greedily: a candidate is kept only if neither its left_id nor its right_id
// was consumed by an earlier kept candidate. Sequential by nature; run it once
// over the complete pool.
[[nodiscard]] std::vector<domain::MatchCandidate> deduplicate(
    std::vector<domain::MatchCandidate> pool);

}  // namespace pmlink::matching
