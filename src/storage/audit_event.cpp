#include "pmlink/storage/audit_event.h"

#include "pmlink/core/ids.h"

#include <utility>

namespace pmlink::storage {

std::string_view to_string(const RunEventType type) noexcept {
  switch (type) {
    case RunEventType::kRunStarted:
      return "RunStarted";
    case RunEventType::kCatalogsNormalized:
      return "CatalogsNormalized";
    case RunEventType::kCandidatesScored:
      return "CandidatesScored";
    case RunEventType::kDeduplicationCompleted:
      return "DeduplicationCompleted";
    case RunEventType::kMatchSetPersisted:
      return "MatchSetPersisted";
    case RunEventType::kRunCompleted:
      return "RunCompleted";
    case RunEventType::kRunFailed:
      return "RunFailed";
  }
  return "Unknown";
}

AuditEvent make_run_event(core::IIdGenerator& id_gen, core::IClock& clock,
                          const std::string& trace_id, const RunEventType type,
                          const nlohmann::json& payload, std::vector<std::string> refs) {
  return AuditEvent{core::new_event_id(id_gen),
                    trace_id,
                    std::string(to_string(type)),
                    payload.dump(),
                    clock.now_iso8601(),
                    std::move(refs)};
}

}  // namespace pmlink::storage
