#include "pmlink/domain/run_stats.h"

namespace pmlink::domain {

nlohmann::json catalog_stats_to_json(const CatalogStats& stats) {
  nlohmann::json j;
  j["accepted"] = stats.accepted;
  j["filtered"] = stats.filtered;
  j["loaded"] = stats.loaded;
  j["rejected"] = stats.rejected;
  return j;
}

nlohmann::json run_stats_to_json(const RunStats& stats) {
  nlohmann::json j;
  j["best_candidates"] = stats.best_candidates;
  j["failed_left_records"] = stats.failed_left_records;
  j["final_matches"] = stats.final_matches;
  j["gate_rejections"] = stats.gate_rejections;
  j["left"] = catalog_stats_to_json(stats.left);
  j["pairs_scored"] = stats.pairs_scored;
  j["pool_size"] = stats.pool_size;
  j["right"] = catalog_stats_to_json(stats.right);
  j["right_bucket_sizes"] = stats.right_bucket_sizes;
  j["time_check_rejections"] = stats.time_check_rejections;
  return j;
}

}  // namespace pmlink::domain
