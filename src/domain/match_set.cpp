#include "pmlink/domain/match_set.h"

#include <cmath>
#include <cstdint>
#include <stdexcept>

namespace pmlink::domain {

double round_to(const double value, const int decimals) {
  const double scale = std::pow(10.0, decimals);
  return std::round(value * scale) / scale;
}

namespace {

// Whole values are written as JSON integers ("24", not "24.0").
nlohmann::json number_to_json(const double value) {
  constexpr double kMaxExactInteger = 9007199254740992.0;  // 2^53
  if (std::isfinite(value) && std::floor(value) == value && std::abs(value) <= kMaxExactInteger) {
    return static_cast<std::int64_t>(value);
  }
  return value;
}

nlohmann::json candidate_to_json(const MatchCandidate& candidate) {
  nlohmann::json j;
  j["left_id"] = candidate.left_id.value;
  j["right_id"] = candidate.right_id.value;
  j["left_title"] = candidate.left_title;
  j["right_title"] = candidate.right_title;
  j["score"] = candidate.score;
  j["domain"] = std::string(to_string(candidate.domain));
  if (candidate.time_diff_hours.has_value()) {
    j["time_diff_hours"] = round_to(candidate.time_diff_hours.value(), 1);
  } else {
    j["time_diff_hours"] = nullptr;
  }
  j["entity_overlap"] = round_to(candidate.entity_overlap_ratio, 3);
  j["number_overlap"] = round_to(candidate.number_overlap_ratio, 3);
  j["shared_entities"] = candidate.shared_entities;
  j["shared_numbers"] = candidate.shared_numbers;
  return j;
}

MatchCandidate candidate_from_json(const nlohmann::json& j) {
  MatchCandidate candidate;
  candidate.left_id = core::RecordId{j.at("left_id").get<std::string>()};
  candidate.right_id = core::RecordId{j.at("right_id").get<std::string>()};
  candidate.left_title = j.at("left_title").get<std::string>();
  candidate.right_title = j.at("right_title").get<std::string>();
  candidate.score = j.at("score").get<double>();

  const auto domain_name = j.at("domain").get<std::string>();
  const auto domain = parse_market_domain(domain_name);
  if (!domain.has_value()) {
    throw std::runtime_error("unknown market domain: " + domain_name);
  }
  candidate.domain = domain.value();

  if (j.at("time_diff_hours").is_null()) {
    candidate.time_diff_hours = std::nullopt;
  } else {
    candidate.time_diff_hours = j.at("time_diff_hours").get<double>();
  }
  candidate.entity_overlap_ratio = j.at("entity_overlap").get<double>();
  candidate.number_overlap_ratio = j.at("number_overlap").get<double>();
  candidate.shared_entities = j.at("shared_entities").get<std::vector<std::string>>();
  candidate.shared_numbers = j.at("shared_numbers").get<std::vector<std::string>>();
  return candidate;
}

}  // namespace

nlohmann::json match_set_to_json(const MatchSet& match_set) {
  using json = nlohmann::json;

  json criteria;
  criteria["domain_exact_match"] = match_set.criteria.domain_exact_match;
  criteria["max_time_diff_hours"] = number_to_json(match_set.criteria.max_time_diff_hours);
  criteria["min_entity_overlap_ratio"] = match_set.criteria.min_entity_overlap_ratio;
  criteria["min_text_similarity"] = number_to_json(match_set.criteria.min_text_similarity);
  criteria["semantic_opposite_filtering"] = match_set.criteria.semantic_opposite_filtering;
  criteria["strict_entity_matching"] = match_set.criteria.strict_entity_matching;

  json matches = json::array();
  for (const auto& candidate : match_set.matches) {
    matches.push_back(candidate_to_json(candidate));
  }

  json j;
  j["generated_at"] = match_set.generated_at;
  j["matches"] = std::move(matches);
  j["matching_criteria"] = std::move(criteria);
  j["total_matches"] = match_set.matches.size();
  return j;
}

MatchSet match_set_from_json(const nlohmann::json& j) {
  MatchSet match_set;
  match_set.generated_at = j.at("generated_at").get<std::string>();

  const auto& criteria = j.at("matching_criteria");
  match_set.criteria.min_text_similarity = criteria.at("min_text_similarity").get<double>();
  match_set.criteria.min_entity_overlap_ratio =
      criteria.at("min_entity_overlap_ratio").get<double>();
  match_set.criteria.strict_entity_matching = criteria.at("strict_entity_matching").get<bool>();
  match_set.criteria.semantic_opposite_filtering =
      criteria.at("semantic_opposite_filtering").get<bool>();
  match_set.criteria.domain_exact_match = criteria.at("domain_exact_match").get<bool>();
  match_set.criteria.max_time_diff_hours = criteria.at("max_time_diff_hours").get<double>();

  for (const auto& entry : j.at("matches")) {
    match_set.matches.push_back(candidate_from_json(entry));
  }

  return match_set;
}

}  // namespace pmlink::domain
