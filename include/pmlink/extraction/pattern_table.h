#pragma once

#include <cstddef>
#include <regex>
#include <string>
#include <string_view>
#include <vector>

namespace pmlink::extraction {

// EntityCategory groups the curated vocabulary.
enum class EntityCategory {
  kPerson,
  kCryptoAsset,
  kOrganization,
  kPlace,
  kEventConcept,
};

[[nodiscard]] std::string_view to_string(EntityCategory category) noexcept;

// EntityPattern is one (tag, compiled pattern) row of the entity table.
// Patterns are word-boundary anchored, written in lower case, and may carry a
// negative lookahead that excludes a following word ("fed" but not "fedex").
struct EntityPattern {
  std::string label;        // NOLINT(readability-identifier-naming)
  EntityCategory category;  // NOLINT(readability-identifier-naming)
  std::string source;       // pattern text, kept for diagnostics
  std::regex pattern;       // NOLINT(readability-identifier-naming)
};

using EntityTable = std::vector<EntityPattern>;

// compile_pattern builds an ECMAScript regex for table rows.
// Throws std::regex_error on a malformed pattern.
[[nodiscard]] std::regex compile_pattern(const std::string& source);

// kMaxPatternInput bounds the bytes any pattern is run against. std::regex
// recurses per matched character and overflows the stack on runs in the tens
// of thousands.
inline constexpr std::size_t kMaxPatternInput = 4096;

// prepare_pattern_input is applied to every text before pattern matching.
// Whitespace runs collapse to one space, then the text is cut to
// kMaxPatternInput bytes, backing off to the last space when the cut would
// split a word.
[[nodiscard]] std::string prepare_pattern_input(std::string_view text);

// make_default_entity_table returns the curated vocabulary in evaluation order:
// people, crypto assets, organizations, places, event concepts.
// Built once at startup and shared read-only afterwards.
[[nodiscard]] EntityTable make_default_entity_table();

}  // namespace pmlink::extraction
