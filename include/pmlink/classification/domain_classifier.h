#pragma once

#include "pmlink/domain/market_domain.h"

#include <regex>
#include <string>
#include <string_view>
#include <vector>

namespace pmlink::classification {

// DomainRule maps a keyword pattern to a domain tag.
struct DomainRule {
  domain::MarketDomain domain;  // NOLINT(readability-identifier-naming)
  std::string source;           // pattern text, kept for diagnostics
  std::regex pattern;           // NOLINT(readability-identifier-naming)
};

using DomainRuleList = std::vector<DomainRule>;

// make_default_domain_rules returns the seven keyword rules in priority order:
// politics, macro, crypto, finance, tech, sports, entertainment.
// The order is part of the contract: "election" + "bitcoin" is politics.
[[nodiscard]] DomainRuleList make_default_domain_rules();

// DomainClassifier assigns exactly one domain to a text.
// Rules are evaluated linearly in list order against the lower-cased text;
// the first match wins, and a text no rule matches is kOther.
class DomainClassifier {
 public:
  explicit DomainClassifier(DomainRuleList rules);

  [[nodiscard]] domain::MarketDomain classify(std::string_view text) const;

  [[nodiscard]] const DomainRuleList& rules() const { return rules_; }

 private:
  DomainRuleList rules_;
};

}  // namespace pmlink::classification
