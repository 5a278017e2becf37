#include "pmlink/extraction/number_extractor.h"

#include "pmlink/core/normalization.h"
#include "pmlink/extraction/pattern_table.h"

#include <cstdlib>

namespace pmlink::extraction {

namespace {

// Parses a literal with thousands separators; commas are dropped.
double literal_value(const std::string& literal) {
  std::string digits;
  digits.reserve(literal.size());
  for (const char ch : literal) {
    if (ch != ',') {
      digits.push_back(ch);
    }
  }
  return std::strtod(digits.c_str(), nullptr);
}

}  // namespace

NumberExtractor::NumberExtractor()
    : year_(compile_pattern(R"(\b(202[0-9])\b)")),
      percent_(compile_pattern(R"(\b(\d+(?:\.\d+)?)\s*%)")),
      dollar_(compile_pattern(R"(\$(\d+(?:,\d+)*(?:\.\d+)?)\s*([kmb]?))")),
      basis_points_(compile_pattern(R"(\b(\d+)\s*bps?\b)")),
      literal_(compile_pattern(R"(\b(\d+(?:,\d+)*(?:\.\d+)?)\b)")) {}

std::set<std::string> NumberExtractor::extract(const std::string_view text) const {
  const std::string original = prepare_pattern_input(text);
  const std::string lowered = core::normalize_ascii_lower(original);

  std::set<std::string> numbers;

  for (auto it = std::sregex_iterator(original.begin(), original.end(), year_);
       it != std::sregex_iterator(); ++it) {
    numbers.insert((*it)[1].str());
  }

  for (auto it = std::sregex_iterator(original.begin(), original.end(), percent_);
       it != std::sregex_iterator(); ++it) {
    numbers.insert((*it)[1].str() + "%");
  }

  for (auto it = std::sregex_iterator(lowered.begin(), lowered.end(), dollar_);
       it != std::sregex_iterator(); ++it) {
    numbers.insert("$" + (*it)[1].str() + (*it)[2].str());
  }

  for (auto it = std::sregex_iterator(lowered.begin(), lowered.end(), basis_points_);
       it != std::sregex_iterator(); ++it) {
    numbers.insert((*it)[1].str() + "bps");
  }

  for (auto it = std::sregex_iterator(original.begin(), original.end(), literal_);
       it != std::sregex_iterator(); ++it) {
    const std::string literal = (*it)[1].str();
    if (literal_value(literal) >= kMinSignificantNumber) {
      numbers.insert(literal);
    }
  }

  return numbers;
}

}  // namespace pmlink::extraction
