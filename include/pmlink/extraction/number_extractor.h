#pragma once

#include <regex>
#include <set>
#include <string>
#include <string_view>

namespace pmlink::extraction {

// NumberExtractor pulls meaningful numeric tokens out of a text.
//
// Token classes (unioned into one set):
//   years         "2024"            202x only
//   percentages   "3.5%"            number immediately or space-followed by '%'
//   dollars       "$2.5m", "$100k"  optional k/m/b suffix, lower-cased
//   basis points  "25bps"           "25 bp", "25bps" and "25 bps" all fold here
//   other numbers "1,000", "150.5"  kept verbatim when the value is >= 10
//
// Numbers below 10 without a unit are noise and never produce a token.
class NumberExtractor {
 public:
  NumberExtractor();

  [[nodiscard]] std::set<std::string> extract(std::string_view text) const;

 private:
  std::regex year_;
  std::regex percent_;
  std::regex dollar_;
  std::regex basis_points_;
  std::regex literal_;
};

// Minimum value of a unit-less literal to be kept.
inline constexpr double kMinSignificantNumber = 10.0;

}  // namespace pmlink::extraction
