#pragma once

#include "pmlink/domain/match_candidate.h"
#include "pmlink/domain/record.h"
#include "pmlink/matching/similarity.h"

#include <optional>
#include <set>
#include <string>
#include <vector>

namespace pmlink::matching {

// ScoredCandidate is the winner of one left record's bucket search.
struct ScoredCandidate {
  const domain::Record* right;  // NOLINT(readability-identifier-naming)
  double score;                 // NOLINT(readability-identifier-naming)
};

// find_best_candidate scores every candidate's folded text against the left
// one and returns the highest score at or above score_cutoff.
// Ties keep the earliest candidate in bucket order.
// pairs_scored is incremented once per similarity computation.
[[nodiscard]] std::optional<ScoredCandidate> find_best_candidate(
    const TextScorer& left, const std::vector<const domain::Record*>& candidates,
    double score_cutoff, size_t& pairs_scored);

// jaccard returns |a ∩ b| / |a ∪ b|, or 0 when both sets are empty.
[[nodiscard]] double jaccard(const std::set<std::string>& a, const std::set<std::string>& b);

// shared_items returns the sorted intersection of two sets.
[[nodiscard]] std::vector<std::string> shared_items(const std::set<std::string>& a,
                                                    const std::set<std::string>& b);

// make_match_candidate fills overlaps, shared sets and the exact time difference
// (nullopt unless both end times are known) for a scored pair.
[[nodiscard]] domain::MatchCandidate make_match_candidate(const domain::Record& left,
                                                          const domain::Record& right,
                                                          double score);

}  // namespace pmlink::matching
