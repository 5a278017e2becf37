#include "match_logic.h"

#include "pmlink/app/match_summary.h"
#include "pmlink/domain/match_set.h"
#include "pmlink/domain/run_stats.h"
#include "pmlink/ingest/normalizer.h"

#include <nlohmann/json.hpp>

#include <exception>
#include <fstream>
#include <iostream>
#include <vector>

namespace {

void report_rejections(const std::string& side,
                       const std::vector<pmlink::ingest::NormalizeError>& rejections) {
  if (rejections.empty()) {
    return;
  }
  std::cerr << side << ": " << rejections.size() << " record(s) not usable\n";
}

bool write_match_set(const std::string& path, const pmlink::domain::MatchSet& match_set) {
  std::ofstream out(path);
  if (!out) {
    std::cerr << "Error: cannot open output file: " << path << "\n";
    return false;
  }
  out << pmlink::domain::match_set_to_json(match_set).dump(2) << "\n";
  if (!out) {
    std::cerr << "Error: failed writing output file: " << path << "\n";
    return false;
  }
  return true;
}

}  // namespace

int execute_match(const pmlink::app::MatchPipelineRequest& request, const std::string& output_path,
                  std::size_t top_n, pmlink::core::Services& services,
                  pmlink::core::IIdGenerator& id_gen, pmlink::core::IClock& clock) {
  std::cout << "Loaded " << request.left.size() << " " << request.left_name << " and "
            << request.right.size() << " " << request.right_name << " records\n";

  pmlink::app::MatchPipelineResponse response;
  try {
    response = pmlink::app::run_match_pipeline(request, services, id_gen, clock);
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << "\n";
    return 1;
  }

  report_rejections(request.left_name, response.left_rejections);
  report_rejections(request.right_name, response.right_rejections);

  const auto& stats = response.stats;
  std::cout << "Scored " << stats.pairs_scored << " pairs; " << stats.best_candidates
            << " best candidates, " << stats.pool_size << " passed the quality gate\n";
  if (stats.failed_left_records > 0) {
    std::cerr << "Warning: " << stats.failed_left_records
              << " left record(s) failed during matching\n";
  }

  if (!write_match_set(output_path, response.match_set)) {
    return 1;
  }
  std::cout << "Saved " << response.match_set.matches.size() << " matches to " << output_path
            << " (run " << response.trace_id << ")\n\n";

  std::cout << pmlink::app::render_summary(pmlink::app::summarize(response.match_set, top_n));
  return 0;
}
