#pragma once

#include "pmlink/domain/market_domain.h"
#include "pmlink/domain/record.h"

#include <map>
#include <string>
#include <vector>

namespace pmlink::matching {

// CandidateIndex buckets the right corpus by domain, once per run.
//
// Invariants:
// - A left record is only ever offered right records of its own domain.
// - Bucket order is right corpus order; it decides score ties.
// - The index borrows the right records; they must outlive it.
// - Immutable after construction, so concurrent lookups need no locking.
class CandidateIndex {
 public:
  CandidateIndex(const std::vector<domain::Record>& right, double max_time_diff_hours);

  // candidates_for returns the left record's domain bucket, narrowed by time:
  // when the left end time is known, right records with an unknown end time
  // or one within max_time_diff_hours are kept; otherwise the whole bucket is.
  [[nodiscard]] std::vector<const domain::Record*> candidates_for(const domain::Record& left) const;

  [[nodiscard]] size_t bucket_size(domain::MarketDomain domain) const;

  // Domain name -> bucket size, for non-empty buckets only.
  [[nodiscard]] std::map<std::string, size_t> bucket_sizes() const;

 private:
  std::map<domain::MarketDomain, std::vector<const domain::Record*>> buckets_;
  double max_time_diff_hours_;
};

}  // namespace pmlink::matching
