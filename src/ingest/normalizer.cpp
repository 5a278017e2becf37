#include "pmlink/ingest/normalizer.h"

#include "pmlink/core/normalization.h"
#include "pmlink/core/time.h"

#include <iostream>
#include <set>

namespace pmlink::ingest {

using NormalizeResult = core::Result<domain::Record, NormalizeError>;

Normalizer::Normalizer(const extraction::EntityExtractor& entities,
                       const extraction::NumberExtractor& numbers,
                       const classification::DomainClassifier& classifier)
    : entities_(entities), numbers_(numbers), classifier_(classifier) {}

NormalizeResult Normalizer::normalize(const domain::RawRecord& raw) const {
  if (!raw.source_id.has_value() || core::trim(raw.source_id.value()).empty()) {
    return NormalizeResult::err(
        NormalizeError{NormalizeErrorKind::kMissingField, "record has no identifier"});
  }
  const std::string id = core::trim(raw.source_id.value());

  if (!raw.title.has_value()) {
    return NormalizeResult::err(
        NormalizeError{NormalizeErrorKind::kMissingField, "record " + id + " has no title field"});
  }

  std::string title = core::trim(raw.title.value());
  if (title.empty()) {
    return NormalizeResult::err(
        NormalizeError{NormalizeErrorKind::kEmptyTitle, "record " + id + " has an empty title"});
  }

  const std::string description = core::trim(raw.description.value_or(""));

  domain::Record record;
  record.source_id = core::RecordId{id};
  record.raw_text = core::trim(title + ". " + description);
  record.normalized_text = core::fold_text(record.raw_text);
  record.title = std::move(title);

  // Unparsable end dates degrade to unknown.
  if (raw.end_date.has_value()) {
    record.end_time = core::parse_iso8601(raw.end_date.value());
  }

  record.entities = entities_.extract(record.raw_text);
  record.numbers = numbers_.extract(record.raw_text);
  record.domain = classifier_.classify(record.raw_text);

  return NormalizeResult::ok(std::move(record));
}

NormalizedCatalog Normalizer::normalize_catalog(const std::vector<domain::RawRecord>& raw,
                                                const std::string& catalog_name) const {
  NormalizedCatalog catalog;
  catalog.stats.loaded = raw.size();
  catalog.records.reserve(raw.size());

  std::set<std::string> seen_ids;
  for (size_t i = 0; i < raw.size(); ++i) {
    auto result = normalize(raw[i]);
    if (!result.has_value()) {
      const auto& error = result.error();
      if (error.kind == NormalizeErrorKind::kEmptyTitle) {
        ++catalog.stats.filtered;
        continue;
      }
      std::cerr << "Warning: " << catalog_name << " entry " << i << " rejected: " << error.message
                << "\n";
      ++catalog.stats.rejected;
      catalog.rejections.push_back(error);
      continue;
    }

    auto& record = result.value();
    if (!seen_ids.insert(record.source_id.value).second) {
      NormalizeError error{NormalizeErrorKind::kDuplicateId,
                           "duplicate identifier " + record.source_id.value};
      std::cerr << "Warning: " << catalog_name << " entry " << i << " rejected: " << error.message
                << "\n";
      ++catalog.stats.rejected;
      catalog.rejections.push_back(std::move(error));
      continue;
    }

    catalog.records.push_back(std::move(record));
  }

  catalog.stats.accepted = catalog.records.size();
  return catalog;
}

}  // namespace pmlink::ingest
