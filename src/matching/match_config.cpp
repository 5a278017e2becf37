#include "pmlink/matching/match_config.h"

#include <fstream>

namespace pmlink::matching {

using ConfigResult = core::Result<MatchConfig, std::string>;

core::Result<bool, std::string> MatchConfig::validate() const {
  if (score_cutoff < 0.0 || score_cutoff > 100.0) {
    return core::Result<bool, std::string>::err("score_cutoff must be within [0, 100]");
  }
  if (max_time_diff_hours < 0.0) {
    return core::Result<bool, std::string>::err("max_time_diff_hours must not be negative");
  }
  if (worker_threads == 0) {
    return core::Result<bool, std::string>::err("worker_threads must be at least 1");
  }
  return core::Result<bool, std::string>::ok(true);
}

ConfigResult match_config_from_json(const nlohmann::json& j) {
  if (!j.is_object()) {
    return ConfigResult::err("config must be a JSON object");
  }

  MatchConfig config;

  if (j.contains("score_cutoff")) {
    if (!j.at("score_cutoff").is_number()) {
      return ConfigResult::err("score_cutoff must be a number");
    }
    config.score_cutoff = j.at("score_cutoff").get<double>();
  }

  if (j.contains("max_time_diff_hours")) {
    if (!j.at("max_time_diff_hours").is_number()) {
      return ConfigResult::err("max_time_diff_hours must be a number");
    }
    config.max_time_diff_hours = j.at("max_time_diff_hours").get<double>();
  }

  if (j.contains("worker_threads")) {
    const auto& workers = j.at("worker_threads");
    if (!workers.is_number_unsigned() &&
        !(workers.is_number_integer() && workers.get<long long>() >= 0)) {
      return ConfigResult::err("worker_threads must be a non-negative integer");
    }
    config.worker_threads = workers.get<size_t>();
  }

  if (j.contains("reject_conflicting_bps")) {
    if (!j.at("reject_conflicting_bps").is_boolean()) {
      return ConfigResult::err("reject_conflicting_bps must be a boolean");
    }
    config.reject_conflicting_bps = j.at("reject_conflicting_bps").get<bool>();
  }

  return ConfigResult::ok(config);
}

ConfigResult load_match_config_file(const std::string& path) {
  std::ifstream file(path);
  if (!file.is_open()) {
    return ConfigResult::err("Failed to open config: " + path);
  }

  nlohmann::json j;
  try {
    j = nlohmann::json::parse(file);
  } catch (const nlohmann::json::parse_error& e) {
    return ConfigResult::err("Invalid JSON in " + path + ": " + e.what());
  }

  return match_config_from_json(j);
}

nlohmann::json match_config_to_json(const MatchConfig& config) {
  nlohmann::json j;
  j["max_time_diff_hours"] = config.max_time_diff_hours;
  j["reject_conflicting_bps"] = config.reject_conflicting_bps;
  j["score_cutoff"] = config.score_cutoff;
  j["worker_threads"] = config.worker_threads;
  return j;
}

}  // namespace pmlink::matching
