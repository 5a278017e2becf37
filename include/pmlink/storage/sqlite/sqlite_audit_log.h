#pragma once

#include "pmlink/storage/audit_log.h"
#include "pmlink/storage/sqlite/sqlite_db.h"

#include <map>
#include <memory>
#include <mutex>

namespace pmlink::storage::sqlite {

// SqliteAuditLog implements IAuditLog with SQLite backend.
// Maintains append-only log with deterministic ordering via idx column.
// Thread-safe append operations using mutex for the idx counter.
class SqliteAuditLog final : public IAuditLog {
 public:
  explicit SqliteAuditLog(std::shared_ptr<SqliteDb> db);

  // Write failures are reported on std::cerr; the run is not interrupted.
  void append(const AuditEvent& event) override;
  [[nodiscard]] std::vector<AuditEvent> query(const std::string& trace_id) const override;
  [[nodiscard]] std::vector<std::string> list_trace_ids() const override;

 private:
  std::shared_ptr<SqliteDb> db_;

  mutable std::mutex mutex_;
  std::map<std::string, int> trace_indices_;

  // Next idx for the trace; must be called with mutex_ held.
  int next_index(const std::string& trace_id);
};

}  // namespace pmlink::storage::sqlite
