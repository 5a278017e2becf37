#pragma once

#include "pmlink/core/id_generator.h"

#include <string>
#include <string_view>

namespace pmlink::core {

// Strong ID types (C.11): prevent mixing a catalog record id with a run trace id.

// RecordId is the catalog-assigned identifier of a market record.
// Unique within its catalog; the same value may appear in the other catalog.
struct RecordId {
  std::string value;
  auto operator<=>(const RecordId&) const = default;
};

// TraceId identifies one pipeline run; it doubles as the run id of the persisted MatchSet.
struct TraceId {
  std::string value;
  auto operator<=>(const TraceId&) const = default;
};

// Id prefixes of a match run.
inline constexpr std::string_view kRunIdPrefix = "run";
inline constexpr std::string_view kEventIdPrefix = "evt";

inline TraceId new_trace_id(IIdGenerator& gen) { return TraceId{gen.next(kRunIdPrefix)}; }

inline std::string new_event_id(IIdGenerator& gen) { return gen.next(kEventIdPrefix); }

}  // namespace pmlink::core
