#include "runs.h"

#include "pmlink/core/services.h"
#include "pmlink/storage/sqlite/sqlite_audit_log.h"
#include "pmlink/storage/sqlite/sqlite_db.h"
#include "pmlink/storage/sqlite/sqlite_match_set_store.h"

#include "runs_logic.h"
#include "shared/arg_parser.h"

#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace {

struct RunsCliConfig {
  std::string db_path{"data/pmlink.db"};
  std::optional<std::string> run_id;
  std::optional<std::string> trace_id;
};

// Open DB, apply schema v1, and return the shared_ptr; print error and return nullptr on failure.
std::shared_ptr<pmlink::storage::sqlite::SqliteDb> open_db(const std::string& path) {
  auto db_result = pmlink::storage::sqlite::SqliteDb::open(path);
  if (!db_result.has_value()) {
    std::cerr << "Failed to open database: " << db_result.error() << "\n";
    return nullptr;
  }
  auto db = db_result.value();
  auto schema_result = db->ensure_schema_v1();
  if (!schema_result.has_value()) {
    std::cerr << "Failed to initialize schema: " << schema_result.error() << "\n";
    return nullptr;
  }
  return db;
}

pmlink::apps::Option<RunsCliConfig> db_option() {
  return {"--db", true, "Path to SQLite database file (default data/pmlink.db)",
          [](RunsCliConfig& c, const std::string& v) {
            c.db_path = v;
            return true;
          }};
}

}  // namespace

int cmd_show_run(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  const std::vector<pmlink::apps::Option<RunsCliConfig>> options = {
      db_option(),
      {"--run-id", true, "Run to print; omit to list all runs",
       [](RunsCliConfig& c, const std::string& v) {
         c.run_id = v;
         return true;
       }},
  };
  const auto config = pmlink::apps::parse_options(argc, argv, options, 2);
  if (!config.has_value()) {
    return 1;
  }

  auto db = open_db(config->db_path);
  if (!db) {
    return 1;
  }

  pmlink::storage::sqlite::SqliteAuditLog audit_log(db);
  pmlink::storage::sqlite::SqliteMatchSetStore match_sets(db);
  pmlink::core::Services services{audit_log, match_sets};
  return execute_show_run(config->run_id, services);
}

int cmd_audit(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  const std::vector<pmlink::apps::Option<RunsCliConfig>> options = {
      db_option(),
      {"--trace-id", true, "Trace ID of the run",
       [](RunsCliConfig& c, const std::string& v) {
         c.trace_id = v;
         return true;
       }},
  };
  const auto config = pmlink::apps::parse_options(argc, argv, options, 2);
  if (!config.has_value()) {
    return 1;
  }

  if (!config->trace_id.has_value()) {
    std::cerr << "Error: --trace-id <id> is required\n";
    return 1;
  }

  auto db = open_db(config->db_path);
  if (!db) {
    return 1;
  }

  pmlink::storage::sqlite::SqliteAuditLog audit_log(db);
  pmlink::storage::sqlite::SqliteMatchSetStore match_sets(db);
  pmlink::core::Services services{audit_log, match_sets};
  return execute_audit(config->trace_id.value(), services);
}
