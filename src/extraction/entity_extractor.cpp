#include "pmlink/extraction/entity_extractor.h"

#include "pmlink/core/normalization.h"

#include <utility>

namespace pmlink::extraction {

EntityExtractor::EntityExtractor(EntityTable table) : table_(std::move(table)) {}

std::set<std::string> EntityExtractor::extract(const std::string_view text) const {
  const std::string lowered = core::normalize_ascii_lower(prepare_pattern_input(text));

  std::set<std::string> entities;
  for (const auto& row : table_) {
    if (std::regex_search(lowered, row.pattern)) {
      entities.insert(row.label);
    }
  }
  return entities;
}

}  // namespace pmlink::extraction
