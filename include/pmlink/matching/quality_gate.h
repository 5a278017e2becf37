#pragma once

#include "pmlink/domain/market_domain.h"
#include "pmlink/domain/match_candidate.h"
#include "pmlink/domain/record.h"

#include <map>
#include <optional>
#include <regex>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace pmlink::matching {

// GateRule names the acceptance rules in evaluation order.
enum class GateRule {
  kScoreFloor,
  kEntityIntersection,
  kEntityOverlap,
  kPolarity,
  kConflictingBasisPoints,  // only when GatePolicy::reject_conflicting_bps is set
  kDomainEntity,
  kNumericCloseness,
};

[[nodiscard]] std::string_view to_string(GateRule rule) noexcept;

// PolarityPair is one antonym pair. Each side is a list of word forms
// (inflections included), matched on word boundaries in the lower-cased raw
// text; multi-word phrases allow any run of whitespace. first and second name
// the pair by each side's first form.
struct PolarityPair {
  std::string first;           // NOLINT(readability-identifier-naming)
  std::string second;          // NOLINT(readability-identifier-naming)
  std::regex first_pattern;    // NOLINT(readability-identifier-naming)
  std::regex second_pattern;   // NOLINT(readability-identifier-naming)
};

// Throws std::invalid_argument when either side has no forms.
[[nodiscard]] PolarityPair make_polarity_pair(const std::vector<std::string>& first_forms,
                                              const std::vector<std::string>& second_forms);
[[nodiscard]] PolarityPair make_polarity_pair(const std::string& first, const std::string& second);

// above/below, over/under, more than/less than, increase/decrease, rise/fall,
// up/down, win/lose, outperform/underperform, cut/hike, emergency/scheduled.
// Verb pairs also carry their inflected forms ("cuts", "rising", "won").
[[nodiscard]] std::vector<PolarityPair> make_default_polarity_pairs();

// Domain -> entities of which at least one must be shared.
// Domains without an entry skip the check.
using RequiredEntities = std::map<domain::MarketDomain, std::set<std::string>>;

[[nodiscard]] RequiredEntities make_default_required_entities();

// Numeric thresholds of the gate.
struct GatePolicy {
  double min_score{80.0};              // hard floor, independent of the scorer's cutoff
  double min_entity_overlap{0.3};      // NOLINT(readability-identifier-naming)
  double numeric_abs_tolerance{50.0};  // NOLINT(readability-identifier-naming)
  double numeric_rel_tolerance{0.2};   // of the left value
  double numeric_escape_score{95.0};   // text score that waives numeric closeness
  bool reject_conflicting_bps{false};  // NOLINT(readability-identifier-naming)
};

// GateDecision is the outcome of evaluate(); failed_rule is set on rejection.
struct GateDecision {
  bool accepted{false};                 // NOLINT(readability-identifier-naming)
  std::optional<GateRule> failed_rule;  // NOLINT(readability-identifier-naming)
  std::string detail;                   // NOLINT(readability-identifier-naming)
};

// QualityGate applies the acceptance rules in order and stops at the first failure:
//   1. score >= min_score
//   2. entity sets intersect
//   3. entity Jaccard >= min_entity_overlap
//   4. no antonym pair split across the two texts (then, if enabled, no
//      disjoint basis-point amounts)
//   5. the shared entities include one required for the candidate's domain
//   6. when both sides carry numbers and none is shared, some bps/% value pair
//      is within max(abs_tolerance, left * rel_tolerance), or the score clears
//      numeric_escape_score
//
// Immutable after construction; safe to share across worker threads.
class QualityGate {
 public:
  QualityGate(std::vector<PolarityPair> polarity_pairs, RequiredEntities required_entities,
              GatePolicy policy = GatePolicy{});

  [[nodiscard]] GateDecision evaluate(const domain::MatchCandidate& candidate,
                                      const domain::Record& left,
                                      const domain::Record& right) const;

  // Boolean view of evaluate().
  [[nodiscard]] bool accept(const domain::MatchCandidate& candidate, const domain::Record& left,
                            const domain::Record& right) const;

  [[nodiscard]] const GatePolicy& policy() const { return policy_; }

 private:
  std::vector<PolarityPair> polarity_pairs_;
  RequiredEntities required_entities_;
  GatePolicy policy_;

  [[nodiscard]] std::optional<std::string> find_polarity_conflict(std::string_view left_text,
                                                                  std::string_view right_text) const;
  [[nodiscard]] bool numbers_close(const std::set<std::string>& left,
                                   const std::set<std::string>& right) const;
};

// parse_scalar_token reads the value of a "<n>bps" or "<n>%" token.
// Other token shapes (years, dollar amounts, plain literals) yield nullopt.
[[nodiscard]] std::optional<double> parse_scalar_token(std::string_view token);

}  // namespace pmlink::matching
