#pragma once

#include <optional>
#include <string>

namespace pmlink::domain {

// RawRecord is a catalog entry as read from its source, before normalization.
// Each field is nullopt when the source object does not carry it at all, and
// an empty string when it carries an empty value. The distinction matters:
// an absent id or title is an interface violation, an empty title is ordinary
// missing data that filters the record out.
struct RawRecord {
  std::optional<std::string> source_id;
  std::optional<std::string> title;
  std::optional<std::string> description;
  std::optional<std::string> end_date;
};

}  // namespace pmlink::domain
