#include "pmlink/matching/candidate_index.h"

#include "pmlink/core/time.h"

namespace pmlink::matching {

CandidateIndex::CandidateIndex(const std::vector<domain::Record>& right,
                               const double max_time_diff_hours)
    : max_time_diff_hours_(max_time_diff_hours) {
  for (const auto& record : right) {
    buckets_[record.domain].push_back(&record);
  }
}

std::vector<const domain::Record*> CandidateIndex::candidates_for(
    const domain::Record& left) const {
  std::vector<const domain::Record*> candidates;

  const auto it = buckets_.find(left.domain);
  if (it == buckets_.end()) {
    return candidates;
  }

  candidates.reserve(it->second.size());
  for (const auto* record : it->second) {
    if (left.end_time.has_value() && record->end_time.has_value()) {
      const double diff = core::hours_between(left.end_time.value(), record->end_time.value());
      if (diff > max_time_diff_hours_) {
        continue;
      }
    }
    candidates.push_back(record);
  }
  return candidates;
}

size_t CandidateIndex::bucket_size(const domain::MarketDomain domain) const {
  const auto it = buckets_.find(domain);
  return it == buckets_.end() ? 0 : it->second.size();
}

std::map<std::string, size_t> CandidateIndex::bucket_sizes() const {
  std::map<std::string, size_t> sizes;
  for (const auto& [domain, bucket] : buckets_) {
    sizes[std::string(domain::to_string(domain))] = bucket.size();
  }
  return sizes;
}

}  // namespace pmlink::matching
