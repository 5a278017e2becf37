#pragma once

#include <rapidfuzz/fuzz.hpp>

#include <string>
#include <string_view>

namespace pmlink::matching {

// token_set_ratio scores two folded texts in [0, 100], insensitive to word
// order, repeated words and one text's vocabulary being a subset of the
// other's. Either text having no tokens scores 0.
[[nodiscard]] double token_set_ratio(std::string_view left, std::string_view right);

// TextScorer holds one left text's split token set and scores right texts
// against it, so a left record is tokenized once per bucket search.
//
// Not copyable: the cached tokens view into the scorer's own copy of the text.
class TextScorer {
 public:
  explicit TextScorer(const std::string& normalized_text);

  TextScorer(const TextScorer&) = delete;
  TextScorer& operator=(const TextScorer&) = delete;
  TextScorer(TextScorer&&) = delete;
  TextScorer& operator=(TextScorer&&) = delete;
  ~TextScorer() = default;

  // score returns the token set ratio, or 0 when it falls below score_cutoff.
  [[nodiscard]] double score(const std::string& normalized_text, double score_cutoff = 0.0) const;

 private:
  rapidfuzz::fuzz::CachedTokenSetRatio<char> cached_;
};

}  // namespace pmlink::matching
