#include "pmlink/domain/market_domain.h"

namespace pmlink::domain {

std::string_view to_string(const MarketDomain domain) noexcept {
  switch (domain) {
    case MarketDomain::kPolitics:
      return "politics";
    case MarketDomain::kMacro:
      return "macro";
    case MarketDomain::kCrypto:
      return "crypto";
    case MarketDomain::kFinance:
      return "finance";
    case MarketDomain::kTech:
      return "tech";
    case MarketDomain::kSports:
      return "sports";
    case MarketDomain::kEntertainment:
      return "entertainment";
    case MarketDomain::kOther:
      return "other";
  }
  return "other";
}

std::optional<MarketDomain> parse_market_domain(const std::string_view name) {
  for (const auto domain : kAllMarketDomains) {
    if (to_string(domain) == name) {
      return domain;
    }
  }
  return std::nullopt;
}

}  // namespace pmlink::domain
