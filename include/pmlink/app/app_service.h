#pragma once

#include "pmlink/core/clock.h"
#include "pmlink/core/id_generator.h"
#include "pmlink/core/services.h"
#include "pmlink/domain/match_set.h"
#include "pmlink/domain/raw_record.h"
#include "pmlink/domain/run_stats.h"
#include "pmlink/ingest/normalizer.h"
#include "pmlink/matching/match_config.h"
#include "pmlink/storage/audit_event.h"
#include "pmlink/storage/match_set_store.h"

#include <optional>
#include <string>
#include <vector>

namespace pmlink::app {

// ────────────────────────────────────────────────────────────────
// Match Pipeline
// ────────────────────────────────────────────────────────────────

struct MatchPipelineRequest {
  std::vector<domain::RawRecord> left;   // NOLINT(readability-identifier-naming)
  std::vector<domain::RawRecord> right;  // NOLINT(readability-identifier-naming)

  // Catalog labels used in diagnostics and audit refs (e.g. file paths)
  std::string left_name{"left"};    // NOLINT(readability-identifier-naming)
  std::string right_name{"right"};  // NOLINT(readability-identifier-naming)

  matching::MatchConfig config;  // NOLINT(readability-identifier-naming)

  // Optional trace_id (if not provided, will be generated); also the run id
  std::optional<std::string> trace_id;  // NOLINT(readability-identifier-naming)
};

struct MatchPipelineResponse {
  std::string trace_id;                                    // NOLINT(readability-identifier-naming)
  domain::MatchSet match_set;                              // NOLINT(readability-identifier-naming)
  domain::RunStats stats;                                  // NOLINT(readability-identifier-naming)
  std::vector<ingest::NormalizeError> left_rejections;     // NOLINT(readability-identifier-naming)
  std::vector<ingest::NormalizeError> right_rejections;    // NOLINT(readability-identifier-naming)
};

// Run normalization, matching and deduplication over two raw catalogs, then
// persist the MatchSet under the trace id.
//
// Emits audit events: RunStarted, CatalogsNormalized, CandidatesScored,
// DeduplicationCompleted, MatchSetPersisted, RunCompleted.
//
// Throws std::invalid_argument on an invalid config, std::runtime_error when the
// MatchSet cannot be persisted (a RunFailed event is emitted first).
// Malformed individual records never throw; they are counted in stats.
[[nodiscard]] MatchPipelineResponse run_match_pipeline(const MatchPipelineRequest& req,
                                                       core::Services& services,
                                                       core::IIdGenerator& id_gen,
                                                       core::IClock& clock);

// matching_criteria_for reports the thresholds a config actually enforces:
// the gate's floor of 80 wins over a lower score_cutoff.
[[nodiscard]] domain::MatchingCriteria matching_criteria_for(const matching::MatchConfig& config);

// ────────────────────────────────────────────────────────────────
// Audit Trace / Stored Runs
// ────────────────────────────────────────────────────────────────

// Fetch all audit events for a given trace_id
[[nodiscard]] std::vector<storage::AuditEvent> fetch_audit_trace(const std::string& trace_id,
                                                                 core::Services& services);

// Fetch a persisted MatchSet by run id. Returns nullopt if not found.
[[nodiscard]] std::optional<domain::MatchSet> fetch_match_set(const std::string& run_id,
                                                              core::Services& services);

// List persisted runs, ordered by run id.
[[nodiscard]] std::vector<storage::StoredRun> list_runs(core::Services& services);

}  // namespace pmlink::app
