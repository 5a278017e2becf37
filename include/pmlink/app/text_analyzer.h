#pragma once

#include "pmlink/classification/domain_classifier.h"
#include "pmlink/domain/market_domain.h"
#include "pmlink/extraction/entity_extractor.h"
#include "pmlink/extraction/number_extractor.h"
#include "pmlink/ingest/normalizer.h"

#include <set>
#include <string>
#include <string_view>

namespace pmlink::app {

// TextProfile is everything the engine derives from one text.
struct TextProfile {
  std::string normalized_text;    // NOLINT(readability-identifier-naming)
  std::set<std::string> entities;  // NOLINT(readability-identifier-naming)
  std::set<std::string> numbers;   // NOLINT(readability-identifier-naming)
  domain::MarketDomain domain{domain::MarketDomain::kOther};
};

// TextAnalyzer owns the default extraction and classification tables.
// Build one per process or per run; every member is read-only after construction.
class TextAnalyzer {
 public:
  TextAnalyzer();

  TextAnalyzer(const TextAnalyzer&) = delete;
  TextAnalyzer& operator=(const TextAnalyzer&) = delete;
  TextAnalyzer(TextAnalyzer&&) = delete;
  TextAnalyzer& operator=(TextAnalyzer&&) = delete;
  ~TextAnalyzer() = default;

  [[nodiscard]] TextProfile analyze(std::string_view text) const;

  // Normalizer bound to this analyzer's tables.
  [[nodiscard]] const ingest::Normalizer& normalizer() const { return normalizer_; }

 private:
  extraction::EntityExtractor entities_;
  extraction::NumberExtractor numbers_;
  classification::DomainClassifier classifier_;
  ingest::Normalizer normalizer_;
};

}  // namespace pmlink::app
