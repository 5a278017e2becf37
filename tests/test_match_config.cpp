#include "pmlink/matching/match_config.h"

#include <nlohmann/json.hpp>

#include <catch2/catch_test_macros.hpp>

#include <filesystem>
#include <fstream>

using namespace pmlink;

TEST_CASE("MatchConfig defaults", "[config]") {
  const matching::MatchConfig config;
  CHECK(config.score_cutoff == 80.0);
  CHECK(config.max_time_diff_hours == 24.0);
  CHECK(config.worker_threads == 1);
  CHECK_FALSE(config.reject_conflicting_bps);
  CHECK(config.validate().has_value());
}

TEST_CASE("MatchConfig validate ranges", "[config]") {
  matching::MatchConfig config;

  config.score_cutoff = 101.0;
  CHECK_FALSE(config.validate().has_value());
  config.score_cutoff = -1.0;
  CHECK_FALSE(config.validate().has_value());
  config.score_cutoff = 70.0;
  CHECK(config.validate().has_value());

  config.max_time_diff_hours = -0.5;
  CHECK_FALSE(config.validate().has_value());
  config.max_time_diff_hours = 0.0;
  CHECK(config.validate().has_value());

  config.worker_threads = 0;
  const auto invalid = config.validate();
  REQUIRE_FALSE(invalid.has_value());
  CHECK(invalid.error().find("worker_threads") != std::string::npos);
}

TEST_CASE("match_config_from_json reads known keys", "[config]") {
  const auto j = nlohmann::json::parse(R"({
    "score_cutoff": 85,
    "max_time_diff_hours": 48.5,
    "worker_threads": 4,
    "reject_conflicting_bps": true,
    "comment": "unknown keys are ignored"
  })");
  const auto result = matching::match_config_from_json(j);
  REQUIRE(result.has_value());
  CHECK(result.value().score_cutoff == 85.0);
  CHECK(result.value().max_time_diff_hours == 48.5);
  CHECK(result.value().worker_threads == 4);
  CHECK(result.value().reject_conflicting_bps);
}

TEST_CASE("match_config_from_json keeps defaults for missing keys", "[config]") {
  const auto result = matching::match_config_from_json(nlohmann::json::object());
  REQUIRE(result.has_value());
  CHECK(result.value().score_cutoff == 80.0);
}

TEST_CASE("match_config_from_json rejects wrong types", "[config]") {
  CHECK_FALSE(matching::match_config_from_json(nlohmann::json::array()).has_value());
  CHECK_FALSE(
      matching::match_config_from_json(nlohmann::json{{"score_cutoff", "80"}}).has_value());
  CHECK_FALSE(
      matching::match_config_from_json(nlohmann::json{{"worker_threads", -2}}).has_value());
  CHECK_FALSE(
      matching::match_config_from_json(nlohmann::json{{"worker_threads", 1.5}}).has_value());
  CHECK_FALSE(matching::match_config_from_json(nlohmann::json{{"reject_conflicting_bps", 1}})
                  .has_value());
}

TEST_CASE("match_config_to_json round-trips", "[config]") {
  matching::MatchConfig config;
  config.score_cutoff = 90.0;
  config.worker_threads = 3;
  const auto j = matching::match_config_to_json(config);
  CHECK(j.dump() ==
        R"({"max_time_diff_hours":24.0,"reject_conflicting_bps":false,"score_cutoff":90.0,"worker_threads":3})");

  const auto back = matching::match_config_from_json(j);
  REQUIRE(back.has_value());
  CHECK(back.value().score_cutoff == 90.0);
  CHECK(back.value().worker_threads == 3);
}

TEST_CASE("load_match_config_file", "[config]") {
  const auto dir = std::filesystem::temp_directory_path();
  const auto good = (dir / "pmlink_test_config_good.json").string();
  const auto bad = (dir / "pmlink_test_config_bad.json").string();
  {
    std::ofstream(good) << R"({"score_cutoff": 90})";
    std::ofstream(bad) << "{ not json";
  }

  const auto loaded = matching::load_match_config_file(good);
  REQUIRE(loaded.has_value());
  CHECK(loaded.value().score_cutoff == 90.0);

  CHECK_FALSE(matching::load_match_config_file(bad).has_value());
  CHECK_FALSE(matching::load_match_config_file((dir / "pmlink_missing.json").string()).has_value());

  std::filesystem::remove(good);
  std::filesystem::remove(bad);
}
