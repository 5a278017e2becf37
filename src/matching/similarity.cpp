#include "pmlink/matching/similarity.h"

namespace pmlink::matching {

double token_set_ratio(const std::string_view left, const std::string_view right) {
  return rapidfuzz::fuzz::token_set_ratio(std::string(left), std::string(right));
}

TextScorer::TextScorer(const std::string& normalized_text) : cached_(normalized_text) {}

double TextScorer::score(const std::string& normalized_text, const double score_cutoff) const {
  return cached_.similarity(normalized_text, score_cutoff);
}

}  // namespace pmlink::matching
