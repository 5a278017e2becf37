#include "pmlink/matching/quality_gate.h"

#include "pmlink/core/normalization.h"
#include "pmlink/extraction/pattern_table.h"
#include "pmlink/matching/scorer.h"

#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <stdexcept>
#include <utility>

namespace pmlink::matching {

using domain::MarketDomain;

std::string_view to_string(const GateRule rule) noexcept {
  switch (rule) {
    case GateRule::kScoreFloor:
      return "score_floor";
    case GateRule::kEntityIntersection:
      return "entity_intersection";
    case GateRule::kEntityOverlap:
      return "entity_overlap";
    case GateRule::kPolarity:
      return "polarity";
    case GateRule::kConflictingBasisPoints:
      return "conflicting_bps";
    case GateRule::kDomainEntity:
      return "domain_entity";
    case GateRule::kNumericCloseness:
      return "numeric_closeness";
  }
  return "unknown";
}

namespace {

// \b(?:form|form|...)\b, with spaces inside a form matching any whitespace run.
std::string forms_pattern(const std::vector<std::string>& forms) {
  std::string source = R"(\b(?:)";
  for (size_t i = 0; i < forms.size(); ++i) {
    if (i != 0) {
      source.push_back('|');
    }
    for (const char ch : forms[i]) {
      if (ch == ' ') {
        source += R"(\s+)";
      } else {
        source.push_back(ch);
      }
    }
  }
  source += R"()\b)";
  return source;
}

GateDecision reject(const GateRule rule, std::string detail) {
  return GateDecision{false, rule, std::move(detail)};
}

bool ends_with(const std::string_view text, const std::string_view suffix) {
  return text.size() >= suffix.size() && text.substr(text.size() - suffix.size()) == suffix;
}

std::set<std::string> basis_point_tokens(const std::set<std::string>& numbers) {
  std::set<std::string> tokens;
  for (const auto& token : numbers) {
    if (ends_with(token, "bps")) {
      tokens.insert(token);
    }
  }
  return tokens;
}

}  // namespace

PolarityPair make_polarity_pair(const std::vector<std::string>& first_forms,
                                const std::vector<std::string>& second_forms) {
  if (first_forms.empty() || second_forms.empty()) {
    throw std::invalid_argument("polarity pair needs at least one word form per side");
  }
  return PolarityPair{first_forms.front(), second_forms.front(),
                      extraction::compile_pattern(forms_pattern(first_forms)),
                      extraction::compile_pattern(forms_pattern(second_forms))};
}

PolarityPair make_polarity_pair(const std::string& first, const std::string& second) {
  return make_polarity_pair(std::vector<std::string>{first}, std::vector<std::string>{second});
}

std::vector<PolarityPair> make_default_polarity_pairs() {
  std::vector<PolarityPair> pairs;
  pairs.push_back(make_polarity_pair("above", "below"));
  pairs.push_back(make_polarity_pair("over", "under"));
  pairs.push_back(make_polarity_pair("more than", "less than"));
  pairs.push_back(make_polarity_pair({"increase", "increases", "increased", "increasing"},
                                     {"decrease", "decreases", "decreased", "decreasing"}));
  pairs.push_back(make_polarity_pair({"rise", "rises", "rising", "rose", "risen"},
                                     {"fall", "falls", "falling", "fell", "fallen"}));
  pairs.push_back(make_polarity_pair("up", "down"));
  pairs.push_back(make_polarity_pair({"win", "wins", "winning", "won"},
                                     {"lose", "loses", "losing", "lost"}));
  pairs.push_back(make_polarity_pair(
      {"outperform", "outperforms", "outperformed", "outperforming"},
      {"underperform", "underperforms", "underperformed", "underperforming"}));
  pairs.push_back(make_polarity_pair({"cut", "cuts", "cutting"},
                                     {"hike", "hikes", "hiked", "hiking"}));
  pairs.push_back(make_polarity_pair("emergency", "scheduled"));
  return pairs;
}

RequiredEntities make_default_required_entities() {
  return RequiredEntities{
      {MarketDomain::kPolitics, {"trump", "biden", "harris", "election", "president"}},
      {MarketDomain::kCrypto,
       {"bitcoin", "btc", "ethereum", "eth", "solana", "sol", "dogecoin", "doge"}},
      {MarketDomain::kMacro,
       {"federal reserve", "fed", "interest rate", "unemployment", "inflation"}},
  };
}

std::optional<double> parse_scalar_token(const std::string_view token) {
  std::string_view digits;
  if (ends_with(token, "bps")) {
    digits = token.substr(0, token.size() - 3);
  } else if (ends_with(token, "%")) {
    digits = token.substr(0, token.size() - 1);
  } else {
    return std::nullopt;
  }
  if (digits.empty()) {
    return std::nullopt;
  }

  const std::string text{digits};
  char* end = nullptr;
  const double value = std::strtod(text.c_str(), &end);
  if (end != text.c_str() + text.size()) {
    return std::nullopt;
  }
  return value;
}

QualityGate::QualityGate(std::vector<PolarityPair> polarity_pairs,
                         RequiredEntities required_entities, GatePolicy policy)
    : polarity_pairs_(std::move(polarity_pairs)),
      required_entities_(std::move(required_entities)),
      policy_(policy) {}

std::optional<std::string> QualityGate::find_polarity_conflict(
    const std::string_view left_text, const std::string_view right_text) const {
  const std::string left =
      core::normalize_ascii_lower(extraction::prepare_pattern_input(left_text));
  const std::string right =
      core::normalize_ascii_lower(extraction::prepare_pattern_input(right_text));

  for (const auto& pair : polarity_pairs_) {
    if (std::regex_search(left, pair.first_pattern) &&
        std::regex_search(right, pair.second_pattern)) {
      return pair.first + "/" + pair.second;
    }
    if (std::regex_search(left, pair.second_pattern) &&
        std::regex_search(right, pair.first_pattern)) {
      return pair.second + "/" + pair.first;
    }
  }
  return std::nullopt;
}

bool QualityGate::numbers_close(const std::set<std::string>& left,
                                const std::set<std::string>& right) const {
  std::vector<double> left_values;
  std::vector<double> right_values;
  for (const auto& token : left) {
    if (auto value = parse_scalar_token(token)) {
      left_values.push_back(*value);
    }
  }
  for (const auto& token : right) {
    if (auto value = parse_scalar_token(token)) {
      right_values.push_back(*value);
    }
  }

  for (const double l : left_values) {
    const double tolerance = std::max(policy_.numeric_abs_tolerance, l * policy_.numeric_rel_tolerance);
    for (const double r : right_values) {
      if (std::abs(l - r) <= tolerance) {
        return true;
      }
    }
  }
  return false;
}

GateDecision QualityGate::evaluate(const domain::MatchCandidate& candidate,
                                   const domain::Record& left, const domain::Record& right) const {
  // 1. Hard score floor
  if (candidate.score < policy_.min_score) {
    return reject(GateRule::kScoreFloor, "score below floor");
  }

  // 2. Shared entities
  const auto shared_entities = shared_items(left.entities, right.entities);
  if (shared_entities.empty()) {
    return reject(GateRule::kEntityIntersection, "no shared entities");
  }

  // 3. Entity overlap ratio
  if (jaccard(left.entities, right.entities) < policy_.min_entity_overlap) {
    return reject(GateRule::kEntityOverlap, "entity overlap below minimum");
  }

  // 4. Semantic polarity
  if (auto conflict = find_polarity_conflict(left.raw_text, right.raw_text)) {
    return reject(GateRule::kPolarity, "opposite wording " + *conflict);
  }

  if (policy_.reject_conflicting_bps) {
    const auto left_bps = basis_point_tokens(left.numbers);
    const auto right_bps = basis_point_tokens(right.numbers);
    if (!left_bps.empty() && !right_bps.empty() && shared_items(left_bps, right_bps).empty()) {
      return reject(GateRule::kConflictingBasisPoints, "no basis-point amount in common");
    }
  }

  // 5. Domain-specific required entity
  const auto required = required_entities_.find(candidate.domain);
  if (required != required_entities_.end()) {
    const bool found = std::any_of(shared_entities.begin(), shared_entities.end(),
                                   [&](const std::string& e) { return required->second.contains(e); });
    if (!found) {
      return reject(GateRule::kDomainEntity,
                    "no shared " + std::string(domain::to_string(candidate.domain)) + " entity");
    }
  }

  // 6. Numeric closeness
  if (!left.numbers.empty() && !right.numbers.empty() &&
      shared_items(left.numbers, right.numbers).empty()) {
    if (!numbers_close(left.numbers, right.numbers) &&
        candidate.score < policy_.numeric_escape_score) {
      return reject(GateRule::kNumericCloseness, "numbers neither shared nor close");
    }
  }

  return GateDecision{true, std::nullopt, {}};
}

bool QualityGate::accept(const domain::MatchCandidate& candidate, const domain::Record& left,
                         const domain::Record& right) const {
  return evaluate(candidate, left, right).accepted;
}

}  // namespace pmlink::matching
