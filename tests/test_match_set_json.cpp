#include "pmlink/domain/match_set.h"

#include <nlohmann/json.hpp>

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <stdexcept>
#include <string>

using namespace pmlink;

namespace {

domain::MatchSet sample_match_set() {
  domain::MatchCandidate m;
  m.left_id = core::RecordId{"kx-1"};
  m.right_id = core::RecordId{"pm-7"};
  m.left_title = "Fed cut in December?";
  m.right_title = "Will the Fed cut rates in December?";
  m.score = 91.66666666666667;
  m.domain = domain::MarketDomain::kMacro;
  m.time_diff_hours = 5.96;
  m.entity_overlap_ratio = 1.0 / 3.0;
  m.number_overlap_ratio = 0.0;
  m.shared_entities = {"fed"};
  m.shared_numbers = {};

  domain::MatchSet set;
  set.generated_at = "2026-01-01T00:00:00Z";
  set.matches = {m};
  return set;
}

}  // namespace

TEST_CASE("match_set_to_json layout", "[domain][match_set]") {
  const auto j = domain::match_set_to_json(sample_match_set());

  CHECK(j.at("generated_at") == "2026-01-01T00:00:00Z");
  CHECK(j.at("total_matches") == 1);

  const auto& criteria = j.at("matching_criteria");
  CHECK(criteria.at("min_text_similarity") == 80.0);
  CHECK(criteria.at("min_entity_overlap_ratio") == 0.3);
  CHECK(criteria.at("strict_entity_matching") == true);
  CHECK(criteria.at("semantic_opposite_filtering") == true);
  CHECK(criteria.at("domain_exact_match") == true);
  CHECK(criteria.at("max_time_diff_hours") == 24.0);
  CHECK(criteria.at("max_time_diff_hours").is_number_integer());
  CHECK(criteria.at("min_text_similarity").is_number_integer());
  CHECK(criteria.at("min_entity_overlap_ratio").is_number_float());

  const auto& match = j.at("matches").at(0);
  CHECK(match.at("left_id") == "kx-1");
  CHECK(match.at("right_id") == "pm-7");
  CHECK(match.at("domain") == "macro");
  CHECK(match.at("time_diff_hours").get<double>() == Catch::Approx(6.0));
  CHECK(match.at("entity_overlap").get<double>() == Catch::Approx(0.333));
  CHECK(match.at("number_overlap").get<double>() == 0.0);
  CHECK(match.at("shared_entities") == nlohmann::json::array({"fed"}));
  CHECK(match.at("shared_numbers") == nlohmann::json::array());
}

TEST_CASE("match_set_to_json writes null for unknown time difference", "[domain][match_set]") {
  auto set = sample_match_set();
  set.matches[0].time_diff_hours.reset();
  CHECK(domain::match_set_to_json(set).at("matches").at(0).at("time_diff_hours").is_null());

  set.matches[0].time_diff_hours = 0.0;
  CHECK(domain::match_set_to_json(set).at("matches").at(0).at("time_diff_hours") == 0.0);
}

TEST_CASE("match_set_to_json is deterministic", "[domain][match_set]") {
  CHECK(domain::match_set_to_json(sample_match_set()).dump(2) ==
        domain::match_set_to_json(sample_match_set()).dump(2));
}

TEST_CASE("match_set_from_json reads what was written", "[domain][match_set]") {
  const auto back = domain::match_set_from_json(domain::match_set_to_json(sample_match_set()));
  REQUIRE(back.matches.size() == 1);
  CHECK(back.generated_at == "2026-01-01T00:00:00Z");
  CHECK(back.matches[0].left_id.value == "kx-1");
  CHECK(back.matches[0].domain == domain::MarketDomain::kMacro);
  REQUIRE(back.matches[0].time_diff_hours.has_value());
  CHECK(back.matches[0].time_diff_hours.value() == Catch::Approx(6.0));
  CHECK(back.matches[0].shared_entities == std::vector<std::string>{"fed"});
}

TEST_CASE("match_set_from_json rejects bad documents", "[domain][match_set]") {
  auto j = domain::match_set_to_json(sample_match_set());
  j["matches"][0]["domain"] = "weather";
  CHECK_THROWS_AS(domain::match_set_from_json(j), std::runtime_error);

  auto missing = domain::match_set_to_json(sample_match_set());
  missing.erase("matching_criteria");
  CHECK_THROWS_AS(domain::match_set_from_json(missing), nlohmann::json::exception);
}

TEST_CASE("round_to", "[domain][match_set]") {
  CHECK(domain::round_to(5.96, 1) == Catch::Approx(6.0));
  CHECK(domain::round_to(0.33333, 3) == Catch::Approx(0.333));
  CHECK(domain::round_to(2.0, 1) == 2.0);
}

TEST_CASE("match_set_to_json writes whole criteria as integers", "[domain][match_set]") {
  auto set = sample_match_set();
  CHECK(domain::match_set_to_json(set).dump().find("\"max_time_diff_hours\":24,") !=
        std::string::npos);

  set.criteria.max_time_diff_hours = 12.5;
  set.criteria.min_text_similarity = 85.0;
  const auto j = domain::match_set_to_json(set);
  const auto& criteria = j.at("matching_criteria");
  CHECK(criteria.at("max_time_diff_hours").is_number_float());
  CHECK(criteria.at("max_time_diff_hours").get<double>() == 12.5);
  CHECK(criteria.at("min_text_similarity") == 85);

  const auto parsed = domain::match_set_from_json(j);
  CHECK(parsed.criteria.max_time_diff_hours == 12.5);
  CHECK(parsed.criteria.min_text_similarity == 85.0);
}
