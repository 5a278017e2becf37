#include "runs_logic.h"

#include "pmlink/app/app_service.h"
#include "pmlink/domain/match_set.h"

#include <iostream>

int execute_show_run(const std::optional<std::string>& run_id, pmlink::core::Services& services) {
  if (!run_id.has_value()) {
    const auto runs = pmlink::app::list_runs(services);
    if (runs.empty()) {
      std::cout << "No stored runs\n";
      return 0;
    }
    for (const auto& run : runs) {
      std::cout << run.run_id << "  " << run.generated_at << "  " << run.total_matches
                << " matches\n";
    }
    return 0;
  }

  const auto match_set = pmlink::app::fetch_match_set(run_id.value(), services);
  if (!match_set.has_value()) {
    std::cerr << "Run not found: " << run_id.value() << "\n";
    return 1;
  }
  std::cout << pmlink::domain::match_set_to_json(match_set.value()).dump(2) << "\n";
  return 0;
}

int execute_audit(const std::string& trace_id, pmlink::core::Services& services) {
  const auto events = pmlink::app::fetch_audit_trace(trace_id, services);
  if (events.empty()) {
    std::cerr << "No audit events for trace_id: " << trace_id << "\n";
    return 1;
  }

  std::cout << "--- Audit Trail (trace_id=" << trace_id << ") ---\n";
  for (const auto& event : events) {
    std::cout << event.created_at << " [" << event.event_type << "] " << event.payload << "\n";
  }
  return 0;
}
