#include "pmlink/app/text_analyzer.h"

#include "pmlink/core/normalization.h"

namespace pmlink::app {

TextAnalyzer::TextAnalyzer()
    : entities_(extraction::make_default_entity_table()),
      classifier_(classification::make_default_domain_rules()),
      normalizer_(entities_, numbers_, classifier_) {}

TextProfile TextAnalyzer::analyze(const std::string_view text) const {
  TextProfile profile;
  profile.normalized_text = core::fold_text(text);
  profile.entities = entities_.extract(text);
  profile.numbers = numbers_.extract(text);
  profile.domain = classifier_.classify(text);
  return profile;
}

}  // namespace pmlink::app
