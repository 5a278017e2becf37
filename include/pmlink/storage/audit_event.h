#pragma once

#include "pmlink/core/clock.h"
#include "pmlink/core/id_generator.h"

#include <nlohmann/json.hpp>

#include <string>
#include <string_view>
#include <vector>

namespace pmlink::storage {

// RunEventType names the steps a match run records, in emission order.
// A run ends with exactly one of kRunCompleted or kRunFailed.
enum class RunEventType {
  kRunStarted,              // config and corpus sizes
  kCatalogsNormalized,      // per-catalog accept/reject counts
  kCandidatesScored,        // map phase counters and gate rejections
  kDeduplicationCompleted,  // pool size and final match count
  kMatchSetPersisted,       // run id and total matches
  kRunCompleted,            // elapsed time and full run stats
  kRunFailed,               // failing stage and reason
};

// Stored names are PascalCase: "RunStarted", "MatchSetPersisted", ...
[[nodiscard]] std::string_view to_string(RunEventType type) noexcept;

// AuditEvent is one recorded step of a match run.
// trace_id is the run id; refs name the catalogs or MatchSet the step touched.
struct AuditEvent {
  std::string event_id;
  std::string trace_id;
  std::string event_type;
  std::string payload;     // JSON object, keys sorted
  std::string created_at;  // ISO-8601 UTC from the run clock
  std::vector<std::string> refs;
};

// make_run_event stamps a step of run trace_id with a fresh event id and the
// clock's current time, and serializes the payload.
[[nodiscard]] AuditEvent make_run_event(core::IIdGenerator& id_gen, core::IClock& clock,
                                        const std::string& trace_id, RunEventType type,
                                        const nlohmann::json& payload,
                                        std::vector<std::string> refs = {});

}  // namespace pmlink::storage
