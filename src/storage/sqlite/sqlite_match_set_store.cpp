#include "pmlink/storage/sqlite/sqlite_match_set_store.h"

#include <sqlite3.h>

#include <iostream>
#include <stdexcept>

namespace pmlink::storage::sqlite {

using SaveResult = core::Result<bool, core::StorageError>;

SqliteMatchSetStore::SqliteMatchSetStore(std::shared_ptr<SqliteDb> db) : db_(std::move(db)) {}

void SqliteMatchSetStore::rollback() {
  const auto result = db_->exec("ROLLBACK");
  if (!result.has_value()) {
    std::cerr << "Warning: " << result.error() << "\n";
  }
}

SaveResult SqliteMatchSetStore::save(const std::string& run_id,
                                     const domain::MatchSet& match_set) {
  std::lock_guard<std::mutex> lock(mutex_);

  if (!db_->exec("BEGIN TRANSACTION").has_value()) {
    return SaveResult::err(core::StorageError::kUnavailable);
  }

  const std::string match_set_json = domain::match_set_to_json(match_set).dump(2);

  PreparedStatement run_stmt(db_->connection(), R"(
    INSERT INTO match_runs (run_id, generated_at, total_matches, match_set_json)
    VALUES (?, ?, ?, ?)
  )");
  if (!run_stmt.is_valid()) {
    rollback();
    return SaveResult::err(core::StorageError::kUnavailable);
  }

  sqlite3_bind_text(run_stmt.get(), 1, run_id.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(run_stmt.get(), 2, match_set.generated_at.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_int64(run_stmt.get(), 3, static_cast<sqlite3_int64>(match_set.matches.size()));
  sqlite3_bind_text(run_stmt.get(), 4, match_set_json.c_str(), -1, SQLITE_TRANSIENT);

  int rc = sqlite3_step(run_stmt.get());
  if (rc != SQLITE_DONE) {
    const bool conflict = (rc == SQLITE_CONSTRAINT);
    rollback();
    return SaveResult::err(conflict ? core::StorageError::kConflict
                                    : core::StorageError::kUnavailable);
  }

  PreparedStatement pair_stmt(db_->connection(), R"(
    INSERT INTO match_pairs
      (run_id, position, left_id, right_id, score, domain, time_diff_hours,
       entity_overlap, number_overlap)
    VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?)
  )");
  if (!pair_stmt.is_valid()) {
    rollback();
    return SaveResult::err(core::StorageError::kUnavailable);
  }

  for (size_t i = 0; i < match_set.matches.size(); ++i) {
    const auto& match = match_set.matches[i];
    const std::string domain_name{domain::to_string(match.domain)};

    sqlite3_reset(pair_stmt.get());
    sqlite3_clear_bindings(pair_stmt.get());
    sqlite3_bind_text(pair_stmt.get(), 1, run_id.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int64(pair_stmt.get(), 2, static_cast<sqlite3_int64>(i));
    sqlite3_bind_text(pair_stmt.get(), 3, match.left_id.value.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(pair_stmt.get(), 4, match.right_id.value.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_double(pair_stmt.get(), 5, match.score);
    sqlite3_bind_text(pair_stmt.get(), 6, domain_name.c_str(), -1, SQLITE_TRANSIENT);
    if (match.time_diff_hours.has_value()) {
      sqlite3_bind_double(pair_stmt.get(), 7, domain::round_to(match.time_diff_hours.value(), 1));
    } else {
      sqlite3_bind_null(pair_stmt.get(), 7);
    }
    sqlite3_bind_double(pair_stmt.get(), 8, domain::round_to(match.entity_overlap_ratio, 3));
    sqlite3_bind_double(pair_stmt.get(), 9, domain::round_to(match.number_overlap_ratio, 3));

    rc = sqlite3_step(pair_stmt.get());
    if (rc != SQLITE_DONE) {
      const bool conflict = (rc == SQLITE_CONSTRAINT);
      rollback();
      return SaveResult::err(conflict ? core::StorageError::kConflict
                                      : core::StorageError::kUnavailable);
    }
  }

  if (!db_->exec("COMMIT").has_value()) {
    rollback();
    return SaveResult::err(core::StorageError::kUnavailable);
  }

  return SaveResult::ok(true);
}

std::optional<domain::MatchSet> SqliteMatchSetStore::get(const std::string& run_id) const {
  std::lock_guard<std::mutex> lock(mutex_);

  PreparedStatement stmt(db_->connection(),
                         "SELECT match_set_json FROM match_runs WHERE run_id = ?");
  if (!stmt.is_valid()) {
    return std::nullopt;
  }

  sqlite3_bind_text(stmt.get(), 1, run_id.c_str(), -1, SQLITE_TRANSIENT);
  if (sqlite3_step(stmt.get()) != SQLITE_ROW) {
    return std::nullopt;
  }

  const std::string stored = column_text(stmt.get(), 0);
  try {
    return domain::match_set_from_json(nlohmann::json::parse(stored));
  } catch (const nlohmann::json::exception& e) {
    std::cerr << "Warning: stored run " << run_id << " is unreadable: " << e.what() << "\n";
  } catch (const std::runtime_error& e) {
    std::cerr << "Warning: stored run " << run_id << " is unreadable: " << e.what() << "\n";
  }
  return std::nullopt;
}

std::vector<StoredRun> SqliteMatchSetStore::list_runs() const {
  std::lock_guard<std::mutex> lock(mutex_);

  PreparedStatement stmt(db_->connection(),
                         "SELECT run_id, generated_at, total_matches FROM match_runs ORDER BY run_id");
  if (!stmt.is_valid()) {
    return {};
  }

  std::vector<StoredRun> runs;
  while (sqlite3_step(stmt.get()) == SQLITE_ROW) {
    StoredRun run;
    run.run_id = column_text(stmt.get(), 0);
    run.generated_at = column_text(stmt.get(), 1);
    run.total_matches = static_cast<size_t>(sqlite3_column_int64(stmt.get(), 2));
    runs.push_back(std::move(run));
  }
  return runs;
}

}  // namespace pmlink::storage::sqlite
