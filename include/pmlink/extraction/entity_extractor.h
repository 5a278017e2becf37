#pragma once

#include "pmlink/extraction/pattern_table.h"

#include <set>
#include <string>
#include <string_view>

namespace pmlink::extraction {

// EntityExtractor tags a text with every curated entity whose pattern matches.
// Extraction is non-exclusive: each table row is tested independently against
// the lower-cased text. Safe to share across threads once constructed.
class EntityExtractor {
 public:
  explicit EntityExtractor(EntityTable table);

  [[nodiscard]] std::set<std::string> extract(std::string_view text) const;

  [[nodiscard]] const EntityTable& table() const { return table_; }

 private:
  EntityTable table_;
};

}  // namespace pmlink::extraction
