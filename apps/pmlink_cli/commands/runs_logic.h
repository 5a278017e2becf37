#pragma once

#include "pmlink/core/services.h"

#include <optional>
#include <string>

// execute_show_run: print the MatchSet stored under run_id, or the run list when
// run_id is empty. execute_audit: print every audit event of trace_id in order.
// Both take only interface types; no concrete storage headers may be included in this TU.
int execute_show_run(const std::optional<std::string>& run_id, pmlink::core::Services& services);
int execute_audit(const std::string& trace_id, pmlink::core::Services& services);
