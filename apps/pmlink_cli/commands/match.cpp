#include "match.h"

#include "pmlink/app/app_service.h"
#include "pmlink/core/clock.h"
#include "pmlink/core/id_generator.h"
#include "pmlink/core/services.h"
#include "pmlink/ingest/catalog_loader.h"
#include "pmlink/ingest/catalog_profile.h"
#include "pmlink/matching/match_config.h"
#include "pmlink/storage/audit_log.h"
#include "pmlink/storage/match_set_store.h"
#include "pmlink/storage/sqlite/sqlite_audit_log.h"
#include "pmlink/storage/sqlite/sqlite_db.h"
#include "pmlink/storage/sqlite/sqlite_match_set_store.h"

#include "match_logic.h"
#include "shared/arg_parser.h"

#include <cstddef>
#include <exception>
#include <iostream>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

namespace {

struct MatchCliConfig {
  std::optional<std::string> left_path;
  std::optional<std::string> right_path;
  pmlink::ingest::CatalogProfile left_profile{pmlink::ingest::generic_profile()};
  pmlink::ingest::CatalogProfile right_profile{pmlink::ingest::generic_profile()};
  std::string output_path{"strict_matches.json"};
  std::optional<std::string> db_path;
  std::optional<std::string> config_path;
  std::size_t top_n{15};

  // Command-line overrides, applied on top of --config.
  std::optional<double> score_cutoff;
  std::optional<double> max_time_diff_hours;
  std::optional<std::size_t> worker_threads;
  bool reject_conflicting_bps{false};
};

bool parse_profile(pmlink::ingest::CatalogProfile& target, const std::string& flag,
                   const std::string& v) {
  auto profile = pmlink::ingest::profile_by_name(v);
  if (!profile.has_value()) {
    std::cerr << "Invalid " << flag << ": " << v << " (valid: kalshi, polymarket, generic)\n";
    return false;
  }
  target = std::move(profile.value());
  return true;
}

template <typename T>
bool parse_number(std::optional<T>& target, const std::string& flag, const std::string& v) {
  try {
    std::size_t consumed = 0;
    if constexpr (std::is_floating_point_v<T>) {
      target = std::stod(v, &consumed);
    } else {
      const long long parsed = std::stoll(v, &consumed);
      if (parsed < 0) {
        std::cerr << "Invalid " << flag << ": " << v << " (must not be negative)\n";
        return false;
      }
      target = static_cast<T>(parsed);
    }
    if (consumed != v.size()) {
      std::cerr << "Invalid " << flag << ": " << v << "\n";
      return false;
    }
    return true;
  } catch (const std::exception&) {
    std::cerr << "Invalid " << flag << ": " << v << "\n";
    return false;
  }
}

std::vector<pmlink::apps::Option<MatchCliConfig>> match_options() {
  return {
      {"--left", true, "Left catalog JSON file",
       [](MatchCliConfig& c, const std::string& v) {
         c.left_path = v;
         return true;
       }},
      {"--right", true, "Right catalog JSON file",
       [](MatchCliConfig& c, const std::string& v) {
         c.right_path = v;
         return true;
       }},
      {"--left-profile", true, "Field layout of the left catalog (default generic)",
       [](MatchCliConfig& c, const std::string& v) {
         return parse_profile(c.left_profile, "--left-profile", v);
       }},
      {"--right-profile", true, "Field layout of the right catalog (default generic)",
       [](MatchCliConfig& c, const std::string& v) {
         return parse_profile(c.right_profile, "--right-profile", v);
       }},
      {"--output", true, "MatchSet output file (default strict_matches.json)",
       [](MatchCliConfig& c, const std::string& v) {
         c.output_path = v;
         return true;
       }},
      {"--db", true, "SQLite database for the audit log and stored runs",
       [](MatchCliConfig& c, const std::string& v) {
         c.db_path = v;
         return true;
       }},
      {"--config", true, "JSON file with match settings",
       [](MatchCliConfig& c, const std::string& v) {
         c.config_path = v;
         return true;
       }},
      {"--score-cutoff", true, "Minimum token-set score for a candidate (0-100)",
       [](MatchCliConfig& c, const std::string& v) {
         return parse_number(c.score_cutoff, "--score-cutoff", v);
       }},
      {"--max-time-diff-hours", true, "Maximum end-time distance in hours",
       [](MatchCliConfig& c, const std::string& v) {
         return parse_number(c.max_time_diff_hours, "--max-time-diff-hours", v);
       }},
      {"--workers", true, "Worker threads for candidate scoring",
       [](MatchCliConfig& c, const std::string& v) {
         return parse_number(c.worker_threads, "--workers", v);
       }},
      {"--reject-conflicting-bps", false, "Reject pairs citing different basis-point moves",
       [](MatchCliConfig& c, const std::string&) {
         c.reject_conflicting_bps = true;
         return true;
       }},
      {"--top", true, "Matches listed in the summary (default 15)",
       [](MatchCliConfig& c, const std::string& v) {
         std::optional<std::size_t> top;
         if (!parse_number(top, "--top", v)) {
           return false;
         }
         c.top_n = top.value();
         return true;
       }},
  };
}

// Resolve file settings first, then command-line overrides.
std::optional<pmlink::matching::MatchConfig> resolve_match_config(const MatchCliConfig& cli) {
  pmlink::matching::MatchConfig config;
  if (cli.config_path.has_value()) {
    auto loaded = pmlink::matching::load_match_config_file(cli.config_path.value());
    if (!loaded.has_value()) {
      std::cerr << "Failed to load config: " << loaded.error() << "\n";
      return std::nullopt;
    }
    config = loaded.value();
  }
  if (cli.score_cutoff.has_value()) {
    config.score_cutoff = cli.score_cutoff.value();
  }
  if (cli.max_time_diff_hours.has_value()) {
    config.max_time_diff_hours = cli.max_time_diff_hours.value();
  }
  if (cli.worker_threads.has_value()) {
    config.worker_threads = cli.worker_threads.value();
  }
  if (cli.reject_conflicting_bps) {
    config.reject_conflicting_bps = true;
  }

  const auto valid = config.validate();
  if (!valid.has_value()) {
    std::cerr << "Invalid match config: " << valid.error() << "\n";
    return std::nullopt;
  }
  return config;
}

}  // namespace

int cmd_match(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  const auto options = match_options();
  const auto parsed = pmlink::apps::parse_options(argc, argv, options, 2);
  if (!parsed.has_value()) {
    std::cerr << "Usage: pmlink_cli match --left <file> --right <file> [options]\n";
    pmlink::apps::print_options(std::cerr, options);
    return 1;
  }
  const auto& cli = parsed.value();

  if (!cli.left_path.has_value() || !cli.right_path.has_value()) {
    std::cerr << "Error: --left <file> and --right <file> are required\n";
    return 1;
  }

  const auto config = resolve_match_config(cli);
  if (!config.has_value()) {
    return 1;
  }

  auto left = pmlink::ingest::load_catalog_file(cli.left_path.value(), cli.left_profile);
  if (!left.has_value()) {
    std::cerr << "Failed to load left catalog: " << left.error() << "\n";
    return 1;
  }
  auto right = pmlink::ingest::load_catalog_file(cli.right_path.value(), cli.right_profile);
  if (!right.has_value()) {
    std::cerr << "Failed to load right catalog: " << right.error() << "\n";
    return 1;
  }

  pmlink::app::MatchPipelineRequest request;
  request.left = std::move(left.value());
  request.right = std::move(right.value());
  request.left_name = cli.left_path.value();
  request.right_name = cli.right_path.value();
  request.config = config.value();

  pmlink::core::SystemClock clock;
  pmlink::core::SystemIdGenerator id_gen(clock);

  if (cli.db_path.has_value()) {
    auto db_result = pmlink::storage::sqlite::SqliteDb::open(cli.db_path.value());
    if (!db_result.has_value()) {
      std::cerr << "Failed to open database: " << db_result.error() << "\n";
      return 1;
    }

    auto db = db_result.value();
    auto schema_result = db->ensure_schema_v1();
    if (!schema_result.has_value()) {
      std::cerr << "Failed to initialize schema: " << schema_result.error() << "\n";
      return 1;
    }
    std::cout << "Using SQLite database: " << cli.db_path.value() << "\n";

    pmlink::storage::sqlite::SqliteAuditLog audit_log(db);
    pmlink::storage::sqlite::SqliteMatchSetStore match_sets(db);
    pmlink::core::Services services{audit_log, match_sets};
    return execute_match(request, cli.output_path, cli.top_n, services, id_gen, clock);
  }

  pmlink::storage::InMemoryAuditLog audit_log;
  pmlink::storage::InMemoryMatchSetStore match_sets;
  pmlink::core::Services services{audit_log, match_sets};
  return execute_match(request, cli.output_path, cli.top_n, services, id_gen, clock);
}
