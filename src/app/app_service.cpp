#include "pmlink/app/app_service.h"

#include "pmlink/app/text_analyzer.h"
#include "pmlink/core/ids.h"
#include "pmlink/matching/matcher.h"
#include "pmlink/matching/quality_gate.h"
#include "pmlink/storage/audit_event.h"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <chrono>
#include <stdexcept>

namespace pmlink::app {

using storage::make_run_event;
using storage::RunEventType;

namespace {

std::string storage_error_name(const core::StorageError error) {
  switch (error) {
    case core::StorageError::kNotFound:
      return "not_found";
    case core::StorageError::kConflict:
      return "conflict";
    case core::StorageError::kUnavailable:
      return "unavailable";
  }
  return "unknown";
}

}  // namespace

domain::MatchingCriteria matching_criteria_for(const matching::MatchConfig& config) {
  const matching::GatePolicy policy;
  domain::MatchingCriteria criteria;
  criteria.min_text_similarity = std::max(policy.min_score, config.score_cutoff);
  criteria.min_entity_overlap_ratio = policy.min_entity_overlap;
  criteria.max_time_diff_hours = config.max_time_diff_hours;
  return criteria;
}

MatchPipelineResponse run_match_pipeline(const MatchPipelineRequest& req, core::Services& services,
                                         core::IIdGenerator& id_gen, core::IClock& clock) {
  const auto valid = req.config.validate();
  if (!valid.has_value()) {
    throw std::invalid_argument("Invalid match config: " + valid.error());
  }

  const core::Timestamp started = clock.now();

  // Generate or use provided trace_id
  const std::string trace_id =
      req.trace_id.has_value() ? req.trace_id.value() : core::new_trace_id(id_gen).value;

  {
    nlohmann::json payload;
    payload["config"] = matching::match_config_to_json(req.config);
    payload["left_records"] = req.left.size();
    payload["operation"] = "match_pipeline";
    payload["right_records"] = req.right.size();
    services.audit_log.append(make_run_event(id_gen, clock, trace_id, RunEventType::kRunStarted,
                                             payload, {req.left_name, req.right_name}));
  }

  // Tables are built once per run and shared read-only by every worker.
  const TextAnalyzer analyzer;
  const auto left = analyzer.normalizer().normalize_catalog(req.left, req.left_name);
  const auto right = analyzer.normalizer().normalize_catalog(req.right, req.right_name);

  {
    nlohmann::json payload;
    payload["left"] = domain::catalog_stats_to_json(left.stats);
    payload["right"] = domain::catalog_stats_to_json(right.stats);
    services.audit_log.append(make_run_event(id_gen, clock, trace_id,
                                             RunEventType::kCatalogsNormalized, payload,
                                             {req.left_name, req.right_name}));
  }

  matching::GatePolicy policy;
  policy.reject_conflicting_bps = req.config.reject_conflicting_bps;
  const matching::QualityGate gate(matching::make_default_polarity_pairs(),
                                   matching::make_default_required_entities(), policy);
  const matching::Matcher matcher(gate, req.config);

  auto run = matcher.run(left.records, right.records);
  run.stats.left = left.stats;
  run.stats.right = right.stats;

  {
    nlohmann::json payload;
    payload["best_candidates"] = run.stats.best_candidates;
    payload["failed_left_records"] = run.stats.failed_left_records;
    payload["gate_rejections"] = run.stats.gate_rejections;
    payload["pairs_scored"] = run.stats.pairs_scored;
    payload["pool_size"] = run.stats.pool_size;
    payload["right_bucket_sizes"] = run.stats.right_bucket_sizes;
    payload["time_check_rejections"] = run.stats.time_check_rejections;
    services.audit_log.append(
        make_run_event(id_gen, clock, trace_id, RunEventType::kCandidatesScored, payload));
  }

  {
    nlohmann::json payload;
    payload["final_matches"] = run.stats.final_matches;
    payload["pool_size"] = run.stats.pool_size;
    services.audit_log.append(
        make_run_event(id_gen, clock, trace_id, RunEventType::kDeduplicationCompleted, payload));
  }

  domain::MatchSet match_set;
  match_set.generated_at = clock.now_iso8601();
  match_set.criteria = matching_criteria_for(req.config);
  match_set.matches = std::move(run.matches);

  const auto saved = services.match_sets.save(trace_id, match_set);
  if (!saved.has_value()) {
    const std::string reason = storage_error_name(saved.error());
    nlohmann::json payload;
    payload["error"] = reason;
    payload["stage"] = "persist";
    services.audit_log.append(make_run_event(id_gen, clock, trace_id, RunEventType::kRunFailed,
                                             payload, {trace_id}));
    throw std::runtime_error("Failed to persist match set " + trace_id + ": " + reason);
  }

  {
    nlohmann::json payload;
    payload["run_id"] = trace_id;
    payload["total_matches"] = match_set.matches.size();
    services.audit_log.append(make_run_event(id_gen, clock, trace_id,
                                             RunEventType::kMatchSetPersisted, payload,
                                             {trace_id}));
  }

  {
    nlohmann::json payload;
    payload["elapsed_seconds"] =
        std::chrono::duration<double>(clock.now() - started).count();
    payload["stats"] = domain::run_stats_to_json(run.stats);
    payload["status"] = "success";
    services.audit_log.append(
        make_run_event(id_gen, clock, trace_id, RunEventType::kRunCompleted, payload));
  }

  return MatchPipelineResponse{
      .trace_id = trace_id,
      .match_set = std::move(match_set),
      .stats = run.stats,
      .left_rejections = left.rejections,
      .right_rejections = right.rejections,
  };
}

std::vector<storage::AuditEvent> fetch_audit_trace(const std::string& trace_id,
                                                   core::Services& services) {
  return services.audit_log.query(trace_id);
}

std::optional<domain::MatchSet> fetch_match_set(const std::string& run_id,
                                                core::Services& services) {
  return services.match_sets.get(run_id);
}

std::vector<storage::StoredRun> list_runs(core::Services& services) {
  return services.match_sets.list_runs();
}

}  // namespace pmlink::app
