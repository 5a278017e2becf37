#pragma once

#include "pmlink/storage/audit_log.h"
#include "pmlink/storage/match_set_store.h"

namespace pmlink::core {

// Services is a composition root that bundles the stores a run writes to.
// It holds references (not ownership); the CLI or test creates the concrete
// instances and manages their lifetimes.
struct Services {
  storage::IAuditLog& audit_log;        // NOLINT(readability-identifier-naming)
  storage::IMatchSetStore& match_sets;  // NOLINT(readability-identifier-naming)

  Services(storage::IAuditLog& audit_log, storage::IMatchSetStore& match_sets)
      : audit_log(audit_log), match_sets(match_sets) {}

  ~Services() = default;

  // Prevent copying and moving to avoid accidental lifetime issues
  Services(const Services&) = delete;
  Services& operator=(const Services&) = delete;
  Services(Services&&) = delete;
  Services& operator=(Services&&) = delete;
};

}  // namespace pmlink::core
