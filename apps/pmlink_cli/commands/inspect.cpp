#include "inspect.h"

#include "pmlink/app/text_analyzer.h"
#include "pmlink/domain/market_domain.h"

#include <nlohmann/json.hpp>

#include "shared/arg_parser.h"

#include <iostream>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace {

struct InspectCliConfig {
  std::optional<std::string> text;
  bool as_json{false};
};

std::string join(const std::set<std::string>& items) {
  std::string out;
  for (const auto& item : items) {
    if (!out.empty()) {
      out += ", ";
    }
    out += item;
  }
  return out.empty() ? "(none)" : out;
}

}  // namespace

int cmd_inspect(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  const std::vector<pmlink::apps::Option<InspectCliConfig>> options = {
      {"--text", true, "Market question to analyze",
       [](InspectCliConfig& c, const std::string& v) {
         c.text = v;
         return true;
       }},
      {"--json", false, "Print the result as JSON",
       [](InspectCliConfig& c, const std::string&) {
         c.as_json = true;
         return true;
       }},
  };
  const auto config = pmlink::apps::parse_options(argc, argv, options, 2);
  if (!config.has_value()) {
    return 1;
  }
  if (!config->text.has_value()) {
    std::cerr << "Error: --text \"<text>\" is required\n";
    return 1;
  }

  const pmlink::app::TextAnalyzer analyzer;
  const auto profile = analyzer.analyze(config->text.value());

  if (config->as_json) {
    nlohmann::json out;
    out["domain"] = std::string(pmlink::domain::to_string(profile.domain));
    out["entities"] = profile.entities;
    out["normalized_text"] = profile.normalized_text;
    out["numbers"] = profile.numbers;
    std::cout << out.dump(2) << "\n";
    return 0;
  }

  std::cout << "Normalized: " << profile.normalized_text << "\n";
  std::cout << "Domain:     " << pmlink::domain::to_string(profile.domain) << "\n";
  std::cout << "Entities:   " << join(profile.entities) << "\n";
  std::cout << "Numbers:    " << join(profile.numbers) << "\n";
  return 0;
}
