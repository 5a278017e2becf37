#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace pmlink::ingest {

/// Field layout of one catalog source.
/// Each list is tried in order; the first key present on the object wins.
struct CatalogProfile {
  std::string name;                             // NOLINT(readability-identifier-naming)
  std::vector<std::string> id_fields;           // NOLINT(readability-identifier-naming)
  std::vector<std::string> title_fields;        // NOLINT(readability-identifier-naming)
  std::vector<std::string> description_fields;  // NOLINT(readability-identifier-naming)
  std::vector<std::string> end_date_fields;     // NOLINT(readability-identifier-naming)
};

/// Kalshi export: ticker-style ids, "title", "endDate" or "close_time".
[[nodiscard]] CatalogProfile kalshi_profile();

/// Polymarket export: numeric or string "id", the question text under "question".
[[nodiscard]] CatalogProfile polymarket_profile();

/// Neutral layout: "id", "title", "description", "end_time".
[[nodiscard]] CatalogProfile generic_profile();

/// Look up a preset by name ("kalshi", "polymarket", "generic").
[[nodiscard]] std::optional<CatalogProfile> profile_by_name(std::string_view name);

}  // namespace pmlink::ingest
