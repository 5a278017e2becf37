#include "pmlink/app/app_service.h"
#include "pmlink/core/clock.h"
#include "pmlink/core/id_generator.h"
#include "pmlink/core/services.h"
#include "pmlink/storage/audit_log.h"
#include "pmlink/storage/match_set_store.h"
#include "pmlink/storage/sqlite/sqlite_audit_log.h"
#include "pmlink/storage/sqlite/sqlite_db.h"
#include "pmlink/storage/sqlite/sqlite_match_set_store.h"

#include <nlohmann/json.hpp>

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <set>
#include <stdexcept>
#include <string>
#include <vector>

using namespace pmlink;

namespace {

domain::RawRecord raw(const std::string& id, const std::string& title,
                      std::optional<std::string> end_date = std::nullopt) {
  return domain::RawRecord{id, title, std::string{}, std::move(end_date)};
}

app::MatchPipelineRequest sample_request() {
  app::MatchPipelineRequest req;
  req.left_name = "kalshi.json";
  req.right_name = "polymarket.json";
  req.left = {
      raw("kx-fed", "Will the Fed cut interest rates in December?", "2025-12-10T19:00:00Z"),
      raw("kx-fed-short", "Fed cut interest rates December"),
      raw("kx-btc", "Will Bitcoin trade above the record high this year?", "2025-12-31T23:59:59Z"),
      raw("kx-trump", "Will Trump win the election?"),
      raw("kx-empty", "   "),
      domain::RawRecord{std::nullopt, std::string{"No id here"}, std::nullopt, std::nullopt},
  };
  req.right = {
      raw("pm-1", "Will the Fed cut interest rates in December meeting?", "2025-12-11T01:00:00Z"),
      raw("pm-2", "Will Bitcoin trade above the record high in this year?",
          "2025-12-31T12:00:00Z"),
      raw("pm-3", "Will Trump win the presidential election?"),
      raw("pm-4", "Lakers win the NBA championship?"),
  };
  return req;
}

struct Harness {
  storage::InMemoryAuditLog audit_log;
  storage::InMemoryMatchSetStore match_sets;
  core::Services services{audit_log, match_sets};
  core::DeterministicIdGenerator id_gen;
  core::FixedClock clock{"2026-01-01T00:00:00Z"};

  app::MatchPipelineResponse run(const app::MatchPipelineRequest& req) {
    return app::run_match_pipeline(req, services, id_gen, clock);
  }
};

std::vector<std::string> event_types(const std::vector<storage::AuditEvent>& events) {
  std::vector<std::string> types;
  for (const auto& event : events) {
    types.push_back(event.event_type);
  }
  return types;
}

}  // namespace

TEST_CASE("match pipeline links the sample catalogs", "[app][pipeline]") {
  Harness h;
  const auto response = h.run(sample_request());

  const auto& matches = response.match_set.matches;
  REQUIRE(matches.size() == 3);
  CHECK(matches[0].left_id.value == "kx-fed");
  CHECK(matches[0].right_id.value == "pm-1");
  CHECK(matches[1].left_id.value == "kx-btc");
  CHECK(matches[1].right_id.value == "pm-2");
  CHECK(matches[2].left_id.value == "kx-trump");
  CHECK(matches[2].right_id.value == "pm-3");

  CHECK(matches[0].domain == domain::MarketDomain::kMacro);
  CHECK(matches[1].domain == domain::MarketDomain::kCrypto);
  CHECK(matches[2].domain == domain::MarketDomain::kPolitics);

  REQUIRE(matches[0].time_diff_hours.has_value());
  CHECK(matches[0].time_diff_hours.value() == Catch::Approx(6.0));
  CHECK_FALSE(matches[2].time_diff_hours.has_value());
  CHECK(matches[2].shared_entities == std::vector<std::string>{"election", "trump"});

  CHECK(response.match_set.generated_at == "2026-01-01T00:00:00Z");
  CHECK(response.match_set.criteria.min_text_similarity == 80.0);
}

TEST_CASE("match pipeline output is injective and domain-closed", "[app][pipeline]") {
  Harness h;
  const auto response = h.run(sample_request());

  std::set<std::string> lefts;
  std::set<std::string> rights;
  for (const auto& m : response.match_set.matches) {
    CHECK(lefts.insert(m.left_id.value).second);
    CHECK(rights.insert(m.right_id.value).second);
    CHECK(m.score >= 80.0);
    CHECK(m.score <= 100.0);
    CHECK_FALSE(m.shared_entities.empty());
    CHECK(m.entity_overlap_ratio >= 0.3);
    if (m.time_diff_hours.has_value()) {
      CHECK(m.time_diff_hours.value() <= 24.0);
    }
  }
  CHECK_FALSE(rights.contains("pm-4"));
}

TEST_CASE("match pipeline reports catalog and matching stats", "[app][pipeline]") {
  Harness h;
  const auto response = h.run(sample_request());
  const auto& stats = response.stats;

  CHECK(stats.left.loaded == 6);
  CHECK(stats.left.filtered == 1);
  CHECK(stats.left.rejected == 1);
  CHECK(stats.left.accepted == 4);
  CHECK(stats.right.accepted == 4);
  REQUIRE(response.left_rejections.size() == 1);
  CHECK(response.left_rejections[0].kind == ingest::NormalizeErrorKind::kMissingField);

  CHECK(stats.right_bucket_sizes.at("sports") == 1);
  CHECK(stats.best_candidates == 4);
  CHECK(stats.pool_size == 4);
  CHECK(stats.final_matches == 3);
  CHECK(stats.failed_left_records == 0);
}

TEST_CASE("match pipeline emits the run events in order", "[app][pipeline]") {
  Harness h;
  auto req = sample_request();
  req.trace_id = "trace-fixed";
  const auto response = h.run(req);
  CHECK(response.trace_id == "trace-fixed");

  const auto events = app::fetch_audit_trace("trace-fixed", h.services);
  CHECK(event_types(events) == std::vector<std::string>{"RunStarted", "CatalogsNormalized",
                                                        "CandidatesScored",
                                                        "DeduplicationCompleted",
                                                        "MatchSetPersisted", "RunCompleted"});
  REQUIRE_FALSE(events.empty());
  CHECK(events[0].refs == std::vector<std::string>{"kalshi.json", "polymarket.json"});
  for (const auto& event : events) {
    CHECK(event.trace_id == "trace-fixed");
    CHECK(event.created_at == "2026-01-01T00:00:00Z");
  }

  const auto completed = nlohmann::json::parse(events.back().payload);
  CHECK(completed.at("status") == "success");
  CHECK(completed.at("elapsed_seconds") == 0.0);
  CHECK(completed.at("stats").at("final_matches") == 3);

  const auto stored = app::fetch_match_set("trace-fixed", h.services);
  REQUIRE(stored.has_value());
  CHECK(stored->matches.size() == 3);
  REQUIRE(app::list_runs(h.services).size() == 1);
}

TEST_CASE("match pipeline generates a trace id when none is given", "[app][pipeline]") {
  Harness h;
  const auto response = h.run(sample_request());
  CHECK(response.trace_id == "run-0");
  CHECK(app::fetch_audit_trace(response.trace_id, h.services).size() == 6);
  CHECK(app::fetch_match_set(response.trace_id, h.services).has_value());
}

TEST_CASE("match pipeline rejects opposite wording", "[app][pipeline][gate]") {
  Harness h;
  app::MatchPipelineRequest req;
  req.left = {raw("kx-hike", "Will the Fed hike rates in March?")};
  req.right = {raw("pm-cut", "Will the Fed cut rates in March?")};

  const auto response = h.run(req);
  CHECK(response.match_set.matches.empty());
  CHECK(response.stats.best_candidates == 1);
  CHECK(response.stats.gate_rejections.at("polarity") == 1);
  CHECK(response.stats.pool_size == 0);
}

TEST_CASE("match pipeline is idempotent", "[app][pipeline][determinism]") {
  Harness first;
  Harness second;
  const auto a = first.run(sample_request());
  const auto b = second.run(sample_request());

  CHECK(a.trace_id == b.trace_id);
  CHECK(domain::match_set_to_json(a.match_set).dump(2) ==
        domain::match_set_to_json(b.match_set).dump(2));
}

TEST_CASE("match pipeline output does not depend on worker count", "[app][pipeline][determinism]") {
  auto single = sample_request();
  single.config.worker_threads = 1;
  auto parallel = sample_request();
  parallel.config.worker_threads = 4;

  Harness a;
  Harness b;
  const auto one = a.run(single);
  const auto four = b.run(parallel);

  CHECK(domain::match_set_to_json(one.match_set).dump(2) ==
        domain::match_set_to_json(four.match_set).dump(2));
  CHECK(one.stats.pairs_scored == four.stats.pairs_scored);
}

TEST_CASE("match pipeline rejects an invalid config", "[app][pipeline]") {
  Harness h;
  auto req = sample_request();
  req.config.worker_threads = 0;
  CHECK_THROWS_AS(h.run(req), std::invalid_argument);
  CHECK(h.audit_log.query("").empty());
}

TEST_CASE("match pipeline fails when the run cannot be persisted", "[app][pipeline]") {
  Harness h;
  auto req = sample_request();
  req.trace_id = "trace-dup";
  (void)h.run(req);

  CHECK_THROWS_AS(h.run(req), std::runtime_error);
  const auto events = app::fetch_audit_trace("trace-dup", h.services);
  REQUIRE_FALSE(events.empty());
  CHECK(events.back().event_type == "RunFailed");
  CHECK(events.back().payload.find("conflict") != std::string::npos);
}

TEST_CASE("match pipeline persists to SQLite", "[app][pipeline][sqlite]") {
  auto db_result = storage::sqlite::SqliteDb::open(":memory:");
  REQUIRE(db_result.has_value());
  auto db = db_result.value();
  REQUIRE(db->ensure_schema_v1().has_value());

  storage::sqlite::SqliteAuditLog audit_log(db);
  storage::sqlite::SqliteMatchSetStore match_sets(db);
  core::Services services(audit_log, match_sets);
  core::DeterministicIdGenerator id_gen;
  core::FixedClock clock("2026-01-01T00:00:00Z");

  const auto response = app::run_match_pipeline(sample_request(), services, id_gen, clock);

  const auto stored = app::fetch_match_set(response.trace_id, services);
  REQUIRE(stored.has_value());
  CHECK(domain::match_set_to_json(stored.value()).dump(2) ==
        domain::match_set_to_json(response.match_set).dump(2));
  CHECK(app::fetch_audit_trace(response.trace_id, services).size() == 6);
}

TEST_CASE("matching_criteria_for reports the enforced floor", "[app][pipeline]") {
  matching::MatchConfig config;
  config.score_cutoff = 70.0;
  CHECK(app::matching_criteria_for(config).min_text_similarity == 80.0);

  config.score_cutoff = 90.0;
  config.max_time_diff_hours = 12.0;
  const auto criteria = app::matching_criteria_for(config);
  CHECK(criteria.min_text_similarity == 90.0);
  CHECK(criteria.max_time_diff_hours == 12.0);
  CHECK(criteria.min_entity_overlap_ratio == 0.3);
}
