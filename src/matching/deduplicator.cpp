#include "pmlink/matching/deduplicator.h"

#include <algorithm>
#include <set>
#include <string>

namespace pmlink::matching {

double composite_score(const domain::MatchCandidate& candidate) {
  return candidate.score + kEntityOverlapWeight * candidate.entity_overlap_ratio +
         kNumberOverlapWeight * candidate.number_overlap_ratio;
}

std::vector<domain::MatchCandidate> deduplicate(std::vector<domain::MatchCandidate> pool) {
  std::stable_sort(pool.begin(), pool.end(),
                   [](const domain::MatchCandidate& a, const domain::MatchCandidate& b) {
                     return composite_score(a) > composite_score(b);
                   });

  std::set<std::string> used_left;
  std::set<std::string> used_right;
  std::vector<domain::MatchCandidate> accepted;

  for (auto& candidate : pool) {
    if (used_left.contains(candidate.left_id.value) ||
        used_right.contains(candidate.right_id.value)) {
      continue;
    }
    used_left.insert(candidate.left_id.value);
    used_right.insert(candidate.right_id.value);
    accepted.push_back(std::move(candidate));
  }

  return accepted;
}

}  // namespace pmlink::matching
