#include "pmlink/classification/domain_classifier.h"

#include "pmlink/core/normalization.h"
#include "pmlink/extraction/pattern_table.h"

#include <utility>

namespace pmlink::classification {

using domain::MarketDomain;

namespace {

DomainRule keyword_rule(const MarketDomain tag, const std::string& alternatives) {
  std::string source = R"(\b()" + alternatives + R"()\b)";
  auto pattern = extraction::compile_pattern(source);
  return DomainRule{tag, std::move(source), std::move(pattern)};
}

}  // namespace

DomainRuleList make_default_domain_rules() {
  DomainRuleList rules;
  rules.reserve(7);
  rules.push_back(keyword_rule(
      MarketDomain::kPolitics,
      "election|president|presidential|trump|biden|harris|mayor|governor|senate|congress|vote|"
      "political|party|democrat|republican|prime minister"));
  rules.push_back(keyword_rule(MarketDomain::kMacro,
                               "federal reserve|fomc|fed|interest rate|inflation|unemployment|gdp|"
                               "recession|monetary policy|basis points|bps"));
  rules.push_back(keyword_rule(
      MarketDomain::kCrypto,
      "bitcoin|btc|ethereum|eth|crypto|blockchain|solana|sol|dogecoin|doge|defi|nft"));
  rules.push_back(keyword_rule(MarketDomain::kFinance,
                               "s&p|spx|nasdaq|dow|stock market|index|tesla|apple|microsoft|amazon|"
                               "earnings|revenue|market cap"));
  rules.push_back(keyword_rule(MarketDomain::kTech,
                               "openai|gpt|ai|artificial intelligence|iphone|android|app|software|"
                               "tech|google|apple|microsoft"));
  rules.push_back(keyword_rule(MarketDomain::kSports,
                               "nfl|nba|mlb|nhl|soccer|football|basketball|baseball|hockey|"
                               "championship|super bowl|world cup|olympics"));
  rules.push_back(keyword_rule(MarketDomain::kEntertainment,
                               "taylor swift|album|billboard|rotten tomatoes|movie|oscar|grammy|"
                               "netflix|box office|streaming"));
  return rules;
}

DomainClassifier::DomainClassifier(DomainRuleList rules) : rules_(std::move(rules)) {}

MarketDomain DomainClassifier::classify(const std::string_view text) const {
  const std::string lowered =
      core::normalize_ascii_lower(extraction::prepare_pattern_input(text));
  for (const auto& rule : rules_) {
    if (std::regex_search(lowered, rule.pattern)) {
      return rule.domain;
    }
  }
  return MarketDomain::kOther;
}

}  // namespace pmlink::classification
