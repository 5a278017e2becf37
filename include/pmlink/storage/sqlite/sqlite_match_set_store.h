#pragma once

#include "pmlink/storage/match_set_store.h"
#include "pmlink/storage/sqlite/sqlite_db.h"

#include <memory>
#include <mutex>

namespace pmlink::storage::sqlite {

// SqliteMatchSetStore implements IMatchSetStore with SQLite backend.
// Each run is stored twice in one transaction: the whole MatchSet as JSON in
// match_runs (the artifact, byte-identical to the written file), and one row
// per pair in match_pairs for downstream queries. match_pairs carries UNIQUE
// constraints on (run_id, left_id) and (run_id, right_id), so a non-injective
// set cannot be persisted.
class SqliteMatchSetStore final : public IMatchSetStore {
 public:
  explicit SqliteMatchSetStore(std::shared_ptr<SqliteDb> db);

  [[nodiscard]] core::Result<bool, core::StorageError> save(
      const std::string& run_id, const domain::MatchSet& match_set) override;
  [[nodiscard]] std::optional<domain::MatchSet> get(const std::string& run_id) const override;
  [[nodiscard]] std::vector<StoredRun> list_runs() const override;

 private:
  std::shared_ptr<SqliteDb> db_;
  mutable std::mutex mutex_;

  void rollback();
};

}  // namespace pmlink::storage::sqlite
