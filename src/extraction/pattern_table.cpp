#include "pmlink/extraction/pattern_table.h"

#include <algorithm>
#include <iterator>

namespace pmlink::extraction {

std::string_view to_string(const EntityCategory category) noexcept {
  switch (category) {
    case EntityCategory::kPerson:
      return "person";
    case EntityCategory::kCryptoAsset:
      return "crypto_asset";
    case EntityCategory::kOrganization:
      return "organization";
    case EntityCategory::kPlace:
      return "place";
    case EntityCategory::kEventConcept:
      return "event_concept";
  }
  return "unknown";
}

std::string prepare_pattern_input(const std::string_view text) {
  std::string bounded;
  bounded.reserve(std::min(text.size(), kMaxPatternInput));

  bool in_space = false;
  for (const char ch : text) {
    const bool space =
        ch == ' ' || ch == '\t' || ch == '\n' || ch == '\r' || ch == '\f' || ch == '\v';
    if (space) {
      if (!in_space) {
        bounded.push_back(' ');
      }
      in_space = true;
    } else {
      bounded.push_back(ch);
      in_space = false;
    }
    if (bounded.size() > kMaxPatternInput) {
      break;
    }
  }

  if (bounded.size() > kMaxPatternInput) {
    // The byte past the limit tells whether the cut lands inside a word.
    const bool splits_word = bounded[kMaxPatternInput] != ' ';
    bounded.resize(kMaxPatternInput);
    if (splits_word) {
      const auto last_space = bounded.rfind(' ');
      if (last_space != std::string::npos) {
        bounded.resize(last_space);
      }
    }
  }
  return bounded;
}

std::regex compile_pattern(const std::string& source) {
  return std::regex(source, std::regex_constants::ECMAScript | std::regex_constants::optimize);
}

namespace {

struct Row {
  const char* label;
  EntityCategory category;
  const char* source;
};

// clang-format off
constexpr Row kDefaultRows[] = {
    // People
    {"trump", EntityCategory::kPerson, R"(\b(donald\s+)?trump\b)"},
    {"biden", EntityCategory::kPerson, R"(\b(joe\s+)?biden\b)"},
    {"harris", EntityCategory::kPerson, R"(\b(kamala\s+)?harris\b)"},
    {"musk", EntityCategory::kPerson, R"(\b(elon\s+)?musk\b)"},
    {"putin", EntityCategory::kPerson, R"(\b(vladimir\s+)?putin\b)"},
    {"xi jinping", EntityCategory::kPerson, R"(\bxi\s+jinping\b)"},
    {"taylor swift", EntityCategory::kPerson, R"(\btaylor\s+swift\b)"},
    {"netanyahu", EntityCategory::kPerson, R"(\bnetanyahu\b)"},

    // Crypto assets
    {"bitcoin", EntityCategory::kCryptoAsset, R"(\bbitcoin\b)"},
    {"btc", EntityCategory::kCryptoAsset, R"(\bbtc\b)"},
    {"ethereum", EntityCategory::kCryptoAsset, R"(\bethereum\b)"},
    {"eth", EntityCategory::kCryptoAsset, R"(\beth\b(?!\s*(flipped|flip)))"},
    {"solana", EntityCategory::kCryptoAsset, R"(\bsolana\b)"},
    {"sol", EntityCategory::kCryptoAsset, R"(\bsol\b(?!\s*\w))"},
    {"dogecoin", EntityCategory::kCryptoAsset, R"(\bdogecoin\b)"},
    {"doge", EntityCategory::kCryptoAsset, R"(\bdoge\b)"},

    // Organizations
    {"federal reserve", EntityCategory::kOrganization, R"(\bfederal\s+reserve\b)"},
    {"fed", EntityCategory::kOrganization, R"(\bfed\b(?!\s*(cup|ex)))"},
    {"openai", EntityCategory::kOrganization, R"(\bopenai\b)"},
    {"tesla", EntityCategory::kOrganization, R"(\btesla\b)"},
    {"apple", EntityCategory::kOrganization, R"(\bapple\b(?!\s*(music|tv)))"},
    {"microsoft", EntityCategory::kOrganization, R"(\bmicrosoft\b)"},
    {"google", EntityCategory::kOrganization, R"(\bgoogle\b)"},
    {"meta", EntityCategory::kOrganization, R"(\bmeta\b(?!\s*\w))"},
    {"netflix", EntityCategory::kOrganization, R"(\bnetflix\b)"},

    // Places
    {"usa", EntityCategory::kPlace, R"(\b(usa|united\s+states|america)\b)"},
    {"china", EntityCategory::kPlace, R"(\bchina\b)"},
    {"russia", EntityCategory::kPlace, R"(\brussia\b)"},
    {"ukraine", EntityCategory::kPlace, R"(\bukraine\b)"},
    {"israel", EntityCategory::kPlace, R"(\bisrael\b)"},
    {"iran", EntityCategory::kPlace, R"(\biran\b)"},
    {"germany", EntityCategory::kPlace, R"(\bgermany\b)"},
    {"france", EntityCategory::kPlace, R"(\bfrance\b)"},
    {"netherlands", EntityCategory::kPlace, R"(\bnetherlands\b)"},
    {"norway", EntityCategory::kPlace, R"(\bnorway\b)"},

    // Event concepts
    {"election", EntityCategory::kEventConcept, R"(\belection\b)"},
    {"recession", EntityCategory::kEventConcept, R"(\brecession\b)"},
    {"inflation", EntityCategory::kEventConcept, R"(\binflation\b)"},
    {"unemployment", EntityCategory::kEventConcept, R"(\bunemployment\b)"},
    {"interest rate", EntityCategory::kEventConcept, R"(\binterest\s+rate\b)"},
};
// clang-format on

}  // namespace

EntityTable make_default_entity_table() {
  EntityTable table;
  table.reserve(std::size(kDefaultRows));
  for (const auto& row : kDefaultRows) {
    table.push_back(EntityPattern{row.label, row.category, row.source, compile_pattern(row.source)});
  }
  return table;
}

}  // namespace pmlink::extraction
