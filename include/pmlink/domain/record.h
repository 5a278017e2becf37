#pragma once

#include "pmlink/core/ids.h"
#include "pmlink/core/result.h"
#include "pmlink/core/time.h"
#include "pmlink/domain/market_domain.h"

#include <optional>
#include <set>
#include <string>

namespace pmlink::domain {

// Record is one market question from one catalog, in canonical form.
//
// Schema:
// - source_id: non-empty, unique within its catalog
// - title: non-empty, trimmed
// - raw_text: "<title>. <description>" trimmed; human-facing
// - normalized_text: fold_text(raw_text); used only for similarity scoring
// - end_time: nullopt when absent or unparsable
// - entities / numbers: sorted sets, possibly empty
// - domain: exactly one tag
//
// Records are built once per run and never mutated afterwards.
struct Record {
  core::RecordId source_id;
  std::string title;
  std::string raw_text;
  std::string normalized_text;
  std::optional<core::Timestamp> end_time;
  std::set<std::string> entities;
  std::set<std::string> numbers;
  MarketDomain domain{MarketDomain::kOther};

  // validate checks schema invariants.
  // Returns ok(true) if valid, err(message) if invalid.
  [[nodiscard]] core::Result<bool, std::string> validate() const;
};

}  // namespace pmlink::domain
