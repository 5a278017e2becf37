#pragma once

#include "pmlink/domain/match_candidate.h"
#include "pmlink/domain/record.h"
#include "pmlink/domain/run_stats.h"
#include "pmlink/matching/candidate_index.h"
#include "pmlink/matching/match_config.h"
#include "pmlink/matching/quality_gate.h"

#include <optional>
#include <string>
#include <vector>

namespace pmlink::matching {

// CandidatePool is the completed output of the map phase: gate-approved
// candidates in left corpus order, at most one per left record.
// Deduplication starts only once the pool is complete.
struct CandidatePool {
  std::vector<domain::MatchCandidate> candidates;  // NOLINT(readability-identifier-naming)
};

// LeftOutcome is the private result slot of one left record in the map phase.
struct LeftOutcome {
  std::optional<domain::MatchCandidate> candidate;  // set when gate and time check pass
  size_t pairs_scored{0};                           // NOLINT(readability-identifier-naming)
  bool had_best{false};                             // a candidate cleared the score cutoff
  std::optional<GateRule> rejected_by;              // NOLINT(readability-identifier-naming)
  bool time_rejected{false};                        // NOLINT(readability-identifier-naming)
  std::optional<std::string> failure;               // exception text when processing threw
};

// MatchRun is the result of Matcher::run.
struct MatchRun {
  std::vector<domain::MatchCandidate> matches;  // injective, dedup order
  domain::RunStats stats;                       // matching counters only; catalog stats are the caller's
};

// Matcher links a left corpus to a right corpus.
// Matcher is a class (C.2): config and gate stay fixed after construction, and
// const member functions make concurrent use from worker threads safe.
class Matcher {
 public:
  Matcher(const QualityGate& gate, MatchConfig config);

  // process_left runs bucket lookup, scoring, gate and the final time check
  // for one left record. Never throws for ordinary data.
  [[nodiscard]] LeftOutcome process_left(const domain::Record& left,
                                         const CandidateIndex& index) const;

  // map_phase processes every left record, sharded across worker_threads.
  // Each record writes only its own slot, so the slots need no locking.
  // A record whose processing throws is marked failed; the others continue.
  [[nodiscard]] std::vector<LeftOutcome> map_phase(const std::vector<domain::Record>& left,
                                                   const CandidateIndex& index) const;

  // run = index the right corpus, map phase, pool, deduplicate.
  // Output is identical for every worker_threads value.
  [[nodiscard]] MatchRun run(const std::vector<domain::Record>& left,
                             const std::vector<domain::Record>& right) const;

  [[nodiscard]] const MatchConfig& config() const { return config_; }

 private:
  const QualityGate& gate_;
  MatchConfig config_;
};

}  // namespace pmlink::matching
