#include "pmlink/matching/matcher.h"

#include "pmlink/matching/deduplicator.h"
#include "pmlink/matching/scorer.h"
#include "pmlink/matching/similarity.h"

#include <algorithm>
#include <exception>
#include <iostream>
#include <thread>

namespace pmlink::matching {

namespace {

// Folds the per-record slots into run counters and the pool, in left order.
CandidatePool compact_outcomes(const std::vector<domain::Record>& left,
                               const std::vector<LeftOutcome>& outcomes,
                               domain::RunStats& stats) {
  CandidatePool pool;
  for (size_t i = 0; i < outcomes.size(); ++i) {
    const auto& outcome = outcomes[i];
    stats.pairs_scored += outcome.pairs_scored;

    if (outcome.failure.has_value()) {
      std::cerr << "Warning: left record " << left[i].source_id.value
                << " failed: " << outcome.failure.value() << "\n";
      ++stats.failed_left_records;
      continue;
    }
    if (outcome.had_best) {
      ++stats.best_candidates;
    }
    if (outcome.rejected_by.has_value()) {
      ++stats.gate_rejections[std::string(to_string(outcome.rejected_by.value()))];
    }
    if (outcome.time_rejected) {
      ++stats.time_check_rejections;
    }
    if (outcome.candidate.has_value()) {
      pool.candidates.push_back(outcome.candidate.value());
    }
  }
  return pool;
}

}  // namespace

Matcher::Matcher(const QualityGate& gate, MatchConfig config) : gate_(gate), config_(config) {}

LeftOutcome Matcher::process_left(const domain::Record& left, const CandidateIndex& index) const {
  LeftOutcome outcome;

  const auto candidates = index.candidates_for(left);
  if (candidates.empty()) {
    return outcome;
  }

  const TextScorer left_scorer(left.normalized_text);
  const auto best =
      find_best_candidate(left_scorer, candidates, config_.score_cutoff, outcome.pairs_scored);
  if (!best.has_value()) {
    return outcome;
  }
  outcome.had_best = true;

  const domain::Record& right = *best->right;
  auto candidate = make_match_candidate(left, right, best->score);

  const GateDecision decision = gate_.evaluate(candidate, left, right);
  if (!decision.accepted) {
    outcome.rejected_by = decision.failed_rule;
    return outcome;
  }

  // Pruning already bounds the window; this restates it on the exact difference.
  if (candidate.time_diff_hours.has_value() &&
      candidate.time_diff_hours.value() > config_.max_time_diff_hours) {
    outcome.time_rejected = true;
    return outcome;
  }

  outcome.candidate = std::move(candidate);
  return outcome;
}

std::vector<LeftOutcome> Matcher::map_phase(const std::vector<domain::Record>& left,
                                            const CandidateIndex& index) const {
  std::vector<LeftOutcome> outcomes(left.size());

  auto process_range = [&](const size_t begin, const size_t end) {
    for (size_t i = begin; i < end; ++i) {
      try {
        outcomes[i] = process_left(left[i], index);
      } catch (const std::exception& e) {
        outcomes[i] = LeftOutcome{};
        outcomes[i].failure = e.what();
      }
    }
  };

  const size_t workers = std::max<size_t>(1, std::min(config_.worker_threads, left.size()));
  if (workers == 1) {
    process_range(0, left.size());
    return outcomes;
  }

  const size_t chunk = (left.size() + workers - 1) / workers;
  // jthread joins on destruction: a launch that throws unwinds through the
  // already started workers instead of terminating.
  std::vector<std::jthread> threads;
  threads.reserve(workers);
  for (size_t w = 0; w < workers; ++w) {
    const size_t begin = w * chunk;
    const size_t end = std::min(left.size(), begin + chunk);
    if (begin >= end) {
      break;
    }
    threads.emplace_back(process_range, begin, end);
  }
  for (auto& thread : threads) {
    thread.join();
  }

  return outcomes;
}

MatchRun Matcher::run(const std::vector<domain::Record>& left,
                      const std::vector<domain::Record>& right) const {
  MatchRun result;

  const CandidateIndex index(right, config_.max_time_diff_hours);
  result.stats.right_bucket_sizes = index.bucket_sizes();

  const auto outcomes = map_phase(left, index);
  const CandidatePool pool = compact_outcomes(left, outcomes, result.stats);
  result.stats.pool_size = pool.candidates.size();

  result.matches = deduplicate(pool.candidates);
  result.stats.final_matches = result.matches.size();

  return result;
}

}  // namespace pmlink::matching
