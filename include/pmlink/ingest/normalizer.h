#pragma once

#include "pmlink/classification/domain_classifier.h"
#include "pmlink/core/result.h"
#include "pmlink/domain/raw_record.h"
#include "pmlink/domain/record.h"
#include "pmlink/domain/run_stats.h"
#include "pmlink/extraction/entity_extractor.h"
#include "pmlink/extraction/number_extractor.h"

#include <string>
#include <vector>

namespace pmlink::ingest {

/// Why a raw record did not become a Record.
enum class NormalizeErrorKind {
  kEmptyTitle,    // ordinary missing data: the record is filtered out
  kMissingField,  // id or title key absent: upstream interface violation
  kDuplicateId,   // id already used earlier in the same catalog
};

struct NormalizeError {
  NormalizeErrorKind kind;  // NOLINT(readability-identifier-naming)
  std::string message;      // NOLINT(readability-identifier-naming)
};

/// A catalog after normalization: accepted records in source order plus the
/// contract violations that were rejected along the way.
struct NormalizedCatalog {
  std::vector<domain::Record> records;     // NOLINT(readability-identifier-naming)
  std::vector<NormalizeError> rejections;  // NOLINT(readability-identifier-naming)
  domain::CatalogStats stats;              // NOLINT(readability-identifier-naming)
};

/// Builds canonical Records from raw catalog entries.
/// Holds references to the shared, read-only extractor and classifier tables.
class Normalizer {
 public:
  Normalizer(const extraction::EntityExtractor& entities, const extraction::NumberExtractor& numbers,
             const classification::DomainClassifier& classifier);

  /// Normalize a single raw record.
  /// Duplicate ids are not detected here; see normalize_catalog.
  [[nodiscard]] core::Result<domain::Record, NormalizeError> normalize(
      const domain::RawRecord& raw) const;

  /// Normalize every record of one catalog.
  /// One bad record never stops the rest: empty titles are counted as filtered,
  /// absent fields and repeated ids are counted as rejected and reported on std::cerr.
  [[nodiscard]] NormalizedCatalog normalize_catalog(const std::vector<domain::RawRecord>& raw,
                                                    const std::string& catalog_name) const;

 private:
  const extraction::EntityExtractor& entities_;
  const extraction::NumberExtractor& numbers_;
  const classification::DomainClassifier& classifier_;
};

}  // namespace pmlink::ingest
