#pragma once

#include "pmlink/domain/match_candidate.h"
#include "pmlink/domain/match_set.h"

#include <optional>
#include <string>
#include <vector>

namespace pmlink::app {

struct DomainCount {
  std::string domain;  // NOLINT(readability-identifier-naming)
  size_t count{0};     // NOLINT(readability-identifier-naming)
};

struct MetricRange {
  double min{0.0};  // NOLINT(readability-identifier-naming)
  double max{0.0};  // NOLINT(readability-identifier-naming)
  double avg{0.0};  // NOLINT(readability-identifier-naming)
};

// MatchSummary is the human-facing digest of a MatchSet.
struct MatchSummary {
  size_t total_matches{0};                         // NOLINT(readability-identifier-naming)
  std::vector<DomainCount> by_domain;              // descending count, then domain name
  std::optional<MetricRange> text_score;           // nullopt for an empty set
  std::optional<MetricRange> entity_overlap;       // over non-zero overlaps only
  std::vector<domain::MatchCandidate> top_matches;  // first top_n in MatchSet order
};

[[nodiscard]] MatchSummary summarize(const domain::MatchSet& match_set, size_t top_n = 15);

// Plain-text rendering used by the CLI.
[[nodiscard]] std::string render_summary(const MatchSummary& summary);

}  // namespace pmlink::app
