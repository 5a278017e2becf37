#include "pmlink/core/result.h"
#include "pmlink/domain/match_set.h"
#include "pmlink/storage/match_set_store.h"
#include "pmlink/storage/sqlite/sqlite_db.h"
#include "pmlink/storage/sqlite/sqlite_match_set_store.h"

#include <catch2/catch_test_macros.hpp>

#include <sqlite3.h>

#include <string>

using namespace pmlink;

namespace {

domain::MatchCandidate pair(const std::string& left, const std::string& right) {
  domain::MatchCandidate m;
  m.left_id = core::RecordId{left};
  m.right_id = core::RecordId{right};
  m.left_title = "Left " + left;
  m.right_title = "Right " + right;
  m.score = 90.0;
  m.domain = domain::MarketDomain::kCrypto;
  m.entity_overlap_ratio = 1.0;
  m.shared_entities = {"bitcoin"};
  return m;
}

domain::MatchSet match_set_of(std::vector<domain::MatchCandidate> matches) {
  domain::MatchSet set;
  set.generated_at = "2026-01-01T00:00:00Z";
  set.matches = std::move(matches);
  return set;
}

std::shared_ptr<storage::sqlite::SqliteDb> open_memory_db() {
  auto db_result = storage::sqlite::SqliteDb::open(":memory:");
  REQUIRE(db_result.has_value());
  auto db = db_result.value();
  REQUIRE(db->ensure_schema_v1().has_value());
  return db;
}

int count_rows(storage::sqlite::SqliteDb& db, const std::string& sql) {
  storage::sqlite::PreparedStatement stmt(db.connection(), sql);
  REQUIRE(stmt.is_valid());
  REQUIRE(sqlite3_step(stmt.get()) == SQLITE_ROW);
  return sqlite3_column_int(stmt.get(), 0);
}

}  // namespace

TEST_CASE("InMemoryMatchSetStore save, get and list", "[storage][match_set]") {
  storage::InMemoryMatchSetStore store;

  REQUIRE(store.save("trace-2", match_set_of({pair("l1", "r1")})).has_value());
  REQUIRE(store.save("trace-1", match_set_of({})).has_value());

  const auto fetched = store.get("trace-2");
  REQUIRE(fetched.has_value());
  REQUIRE(fetched->matches.size() == 1);
  CHECK(fetched->matches[0].left_id.value == "l1");
  CHECK_FALSE(store.get("trace-9").has_value());

  const auto runs = store.list_runs();
  REQUIRE(runs.size() == 2);
  CHECK(runs[0].run_id == "trace-1");
  CHECK(runs[0].total_matches == 0);
  CHECK(runs[1].run_id == "trace-2");
  CHECK(runs[1].total_matches == 1);
}

TEST_CASE("InMemoryMatchSetStore refuses to overwrite a run", "[storage][match_set]") {
  storage::InMemoryMatchSetStore store;
  REQUIRE(store.save("trace-1", match_set_of({})).has_value());
  const auto again = store.save("trace-1", match_set_of({pair("l1", "r1")}));
  REQUIRE_FALSE(again.has_value());
  CHECK(again.error() == core::StorageError::kConflict);
  CHECK(store.get("trace-1")->matches.empty());
}

TEST_CASE("SqliteDb schema v1", "[sqlite][schema]") {
  auto db = open_memory_db();
  CHECK(db->get_schema_version() == 1);
  // Applying twice is a no-op.
  CHECK(db->ensure_schema_v1().has_value());
  CHECK(db->get_schema_version() == 1);
}

TEST_CASE("SqliteMatchSetStore persists the set and its pairs", "[sqlite][match_set]") {
  auto db = open_memory_db();
  storage::sqlite::SqliteMatchSetStore store(db);

  const auto original = match_set_of({pair("l1", "r1"), pair("l2", "r2")});
  REQUIRE(store.save("trace-1", original).has_value());

  const auto fetched = store.get("trace-1");
  REQUIRE(fetched.has_value());
  CHECK(domain::match_set_to_json(fetched.value()) == domain::match_set_to_json(original));

  CHECK(count_rows(*db, "SELECT COUNT(*) FROM match_pairs WHERE run_id = 'trace-1'") == 2);

  const auto runs = store.list_runs();
  REQUIRE(runs.size() == 1);
  CHECK(runs[0].run_id == "trace-1");
  CHECK(runs[0].generated_at == "2026-01-01T00:00:00Z");
  CHECK(runs[0].total_matches == 2);

  CHECK_FALSE(store.get("trace-404").has_value());
}

TEST_CASE("SqliteMatchSetStore rejects duplicate runs", "[sqlite][match_set]") {
  auto db = open_memory_db();
  storage::sqlite::SqliteMatchSetStore store(db);

  REQUIRE(store.save("trace-1", match_set_of({pair("l1", "r1")})).has_value());
  const auto again = store.save("trace-1", match_set_of({pair("l9", "r9")}));
  REQUIRE_FALSE(again.has_value());
  CHECK(again.error() == core::StorageError::kConflict);
  CHECK(count_rows(*db, "SELECT COUNT(*) FROM match_pairs") == 1);
}

TEST_CASE("SqliteMatchSetStore refuses a non-injective set atomically", "[sqlite][match_set]") {
  auto db = open_memory_db();
  storage::sqlite::SqliteMatchSetStore store(db);

  const auto result = store.save("trace-1", match_set_of({pair("l1", "r1"), pair("l2", "r1")}));
  REQUIRE_FALSE(result.has_value());
  CHECK(result.error() == core::StorageError::kConflict);

  CHECK_FALSE(store.get("trace-1").has_value());
  CHECK(count_rows(*db, "SELECT COUNT(*) FROM match_runs") == 0);
  CHECK(count_rows(*db, "SELECT COUNT(*) FROM match_pairs") == 0);

  // The connection is usable after the rollback.
  CHECK(store.save("trace-2", match_set_of({pair("l1", "r1")})).has_value());
}
