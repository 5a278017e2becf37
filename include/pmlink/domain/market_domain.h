#pragma once

#include <array>
#include <optional>
#include <string_view>

namespace pmlink::domain {

// MarketDomain is the coarse category of a market question.
// The set is closed: every record carries exactly one of these tags.
enum class MarketDomain {
  kPolitics,
  kMacro,
  kCrypto,
  kFinance,
  kTech,
  kSports,
  kEntertainment,
  kOther,
};

inline constexpr std::array<MarketDomain, 8> kAllMarketDomains = {
    MarketDomain::kPolitics, MarketDomain::kMacro,  MarketDomain::kCrypto,
    MarketDomain::kFinance,  MarketDomain::kTech,   MarketDomain::kSports,
    MarketDomain::kEntertainment, MarketDomain::kOther,
};

// to_string returns the lower-case wire name ("politics", "macro", ...).
[[nodiscard]] std::string_view to_string(MarketDomain domain) noexcept;

// parse_market_domain is the inverse of to_string; nullopt for unknown names.
[[nodiscard]] std::optional<MarketDomain> parse_market_domain(std::string_view name);

}  // namespace pmlink::domain
