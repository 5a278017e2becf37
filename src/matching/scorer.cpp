#include "pmlink/matching/scorer.h"

#include "pmlink/core/time.h"

#include <algorithm>
#include <iterator>

namespace pmlink::matching {

std::optional<ScoredCandidate> find_best_candidate(
    const TextScorer& left, const std::vector<const domain::Record*>& candidates,
    const double score_cutoff, size_t& pairs_scored) {
  std::optional<ScoredCandidate> best;

  for (const auto* candidate : candidates) {
    const double score = left.score(candidate->normalized_text, score_cutoff);
    ++pairs_scored;
    if (score < score_cutoff) {
      continue;
    }
    // Strict comparison: the first candidate wins a tie.
    if (!best.has_value() || score > best->score) {
      best = ScoredCandidate{candidate, score};
    }
  }

  return best;
}

double jaccard(const std::set<std::string>& a, const std::set<std::string>& b) {
  const auto shared = shared_items(a, b);
  const size_t union_size = a.size() + b.size() - shared.size();
  if (union_size == 0) {
    return 0.0;
  }
  return static_cast<double>(shared.size()) / static_cast<double>(union_size);
}

std::vector<std::string> shared_items(const std::set<std::string>& a,
                                      const std::set<std::string>& b) {
  std::vector<std::string> shared;
  std::set_intersection(a.begin(), a.end(), b.begin(), b.end(), std::back_inserter(shared));
  return shared;
}

domain::MatchCandidate make_match_candidate(const domain::Record& left, const domain::Record& right,
                                            const double score) {
  domain::MatchCandidate candidate;
  candidate.left_id = left.source_id;
  candidate.right_id = right.source_id;
  candidate.left_title = left.title;
  candidate.right_title = right.title;
  candidate.score = score;
  candidate.domain = left.domain;

  if (left.end_time.has_value() && right.end_time.has_value()) {
    candidate.time_diff_hours = core::hours_between(left.end_time.value(), right.end_time.value());
  }

  candidate.entity_overlap_ratio = jaccard(left.entities, right.entities);
  candidate.number_overlap_ratio = jaccard(left.numbers, right.numbers);
  candidate.shared_entities = shared_items(left.entities, right.entities);
  candidate.shared_numbers = shared_items(left.numbers, right.numbers);
  return candidate;
}

}  // namespace pmlink::matching
