#include "pmlink/app/text_analyzer.h"
#include "pmlink/core/time.h"
#include "pmlink/ingest/normalizer.h"

#include <catch2/catch_test_macros.hpp>

#include <set>
#include <string>
#include <vector>

using namespace pmlink;
using domain::MarketDomain;

namespace {

domain::RawRecord raw(std::optional<std::string> id, std::optional<std::string> title,
                      std::optional<std::string> description = std::nullopt,
                      std::optional<std::string> end_date = std::nullopt) {
  return domain::RawRecord{std::move(id), std::move(title), std::move(description),
                           std::move(end_date)};
}

}  // namespace

TEST_CASE("Normalizer builds a canonical record", "[ingest][normalizer]") {
  const app::TextAnalyzer analyzer;
  const auto result = analyzer.normalizer().normalize(
      raw(" FED-1 ", "  Will the Fed cut rates by 25bps in 2024? ", "Resolves on the FOMC statement.",
          "2024-12-18T19:00:00Z"));
  REQUIRE(result.has_value());
  const auto& record = result.value();

  CHECK(record.source_id.value == "FED-1");
  CHECK(record.title == "Will the Fed cut rates by 25bps in 2024?");
  CHECK(record.raw_text ==
        "Will the Fed cut rates by 25bps in 2024?. Resolves on the FOMC statement.");
  CHECK(record.normalized_text ==
        "will the fed cut rates by 25bps in 2024 resolves on the fomc statement");
  REQUIRE(record.end_time.has_value());
  CHECK(core::format_iso8601(record.end_time.value()) == "2024-12-18T19:00:00Z");
  CHECK(record.entities == std::set<std::string>{"fed"});
  CHECK(record.numbers == std::set<std::string>{"2024", "25bps"});
  CHECK(record.domain == MarketDomain::kMacro);
  CHECK(record.validate().has_value());
}

TEST_CASE("Normalizer degrades bad end dates to unknown", "[ingest][normalizer]") {
  const app::TextAnalyzer analyzer;
  const auto result =
      analyzer.normalizer().normalize(raw("a", "Question", std::nullopt, "sometime soon"));
  REQUIRE(result.has_value());
  CHECK_FALSE(result.value().end_time.has_value());
  CHECK(result.value().raw_text == "Question.");
}

TEST_CASE("Normalizer separates empty data from missing fields", "[ingest][normalizer]") {
  const app::TextAnalyzer analyzer;
  const auto& normalizer = analyzer.normalizer();

  const auto empty_title = normalizer.normalize(raw("a", "   "));
  REQUIRE_FALSE(empty_title.has_value());
  CHECK(empty_title.error().kind == ingest::NormalizeErrorKind::kEmptyTitle);

  const auto no_title = normalizer.normalize(raw("a", std::nullopt));
  REQUIRE_FALSE(no_title.has_value());
  CHECK(no_title.error().kind == ingest::NormalizeErrorKind::kMissingField);

  const auto no_id = normalizer.normalize(raw(std::nullopt, "Question"));
  REQUIRE_FALSE(no_id.has_value());
  CHECK(no_id.error().kind == ingest::NormalizeErrorKind::kMissingField);

  const auto blank_id = normalizer.normalize(raw("", "Question"));
  REQUIRE_FALSE(blank_id.has_value());
  CHECK(blank_id.error().kind == ingest::NormalizeErrorKind::kMissingField);
}

TEST_CASE("normalize_catalog counts and continues past bad records", "[ingest][normalizer]") {
  const app::TextAnalyzer analyzer;
  const std::vector<domain::RawRecord> input = {
      raw("a", "Will Trump win?"),
      raw("b", ""),
      raw(std::nullopt, "No id"),
      raw("a", "Duplicate id"),
      raw("c", "Bitcoin above 100k?"),
  };

  const auto catalog = analyzer.normalizer().normalize_catalog(input, "test");
  CHECK(catalog.stats.loaded == 5);
  CHECK(catalog.stats.filtered == 1);
  CHECK(catalog.stats.rejected == 2);
  CHECK(catalog.stats.accepted == 2);

  REQUIRE(catalog.records.size() == 2);
  CHECK(catalog.records[0].source_id.value == "a");
  CHECK(catalog.records[0].title == "Will Trump win?");
  CHECK(catalog.records[1].source_id.value == "c");

  REQUIRE(catalog.rejections.size() == 2);
  CHECK(catalog.rejections[0].kind == ingest::NormalizeErrorKind::kMissingField);
  CHECK(catalog.rejections[1].kind == ingest::NormalizeErrorKind::kDuplicateId);
}

TEST_CASE("TextAnalyzer profiles a text", "[app][analyzer]") {
  const app::TextAnalyzer analyzer;
  const auto profile = analyzer.analyze("Will Bitcoin close above $100K in 2025?");
  CHECK(profile.normalized_text == "will bitcoin close above 100k in 2025");
  CHECK(profile.entities == std::set<std::string>{"bitcoin"});
  CHECK(profile.numbers == std::set<std::string>{"$100k", "2025"});
  CHECK(profile.domain == MarketDomain::kCrypto);
}

TEST_CASE("Normalizer survives very long descriptions", "[ingest][normalizer]") {
  const app::TextAnalyzer analyzer;
  const std::string description =
      std::string(100000, ' ') + "price " + std::string(50000, '9');
  const auto result =
      analyzer.normalizer().normalize(raw("sol-1", "Will Solana hit $500 in 2025?", description));
  REQUIRE(result.has_value());
  const auto& record = result.value();
  CHECK(record.entities == std::set<std::string>{"solana"});
  CHECK(record.numbers.count("2025") == 1);
  CHECK(record.numbers.count("$500") == 1);
  CHECK(record.domain == MarketDomain::kCrypto);
}
