#include "pmlink/app/text_analyzer.h"
#include "pmlink/matching/candidate_index.h"
#include "pmlink/matching/matcher.h"
#include "pmlink/matching/quality_gate.h"

#include <catch2/catch_test_macros.hpp>

#include <optional>
#include <utility>
#include <string>
#include <vector>

using namespace pmlink;

namespace {

std::vector<domain::Record> build(const app::TextAnalyzer& analyzer,
                                  const std::vector<std::pair<std::string, std::string>>& rows) {
  std::vector<domain::Record> records;
  for (const auto& [id, title] : rows) {
    auto result = analyzer.normalizer().normalize(
        domain::RawRecord{id, title, std::string{}, std::nullopt});
    REQUIRE(result.has_value());
    records.push_back(std::move(result.value()));
  }
  return records;
}

// One line per left record: pairs scored, then the right id or the rejecting rule.
std::vector<std::string> summarize(const std::vector<matching::LeftOutcome>& outcomes) {
  std::vector<std::string> lines;
  for (const auto& outcome : outcomes) {
    std::string line = std::to_string(outcome.pairs_scored) + ":";
    if (outcome.candidate.has_value()) {
      line += outcome.candidate->right_id.value;
    } else if (outcome.rejected_by.has_value()) {
      line += std::string(matching::to_string(outcome.rejected_by.value()));
    } else {
      line += "-";
    }
    lines.push_back(line);
  }
  return lines;
}

}  // namespace

TEST_CASE("Matcher map phase is the same for any number of workers", "[matching][matcher]") {
  const app::TextAnalyzer analyzer;
  const auto left = build(analyzer, {
                                        {"l1", "Will the Fed cut interest rates in December?"},
                                        {"l2", "Will Bitcoin close above $100k in 2025?"},
                                        {"l3", "Will Trump win the election?"},
                                        {"l4", "Fed rate hike in June"},
                                        {"l5", "Will Ethereum flip Bitcoin?"},
                                        {"l6", "Lakers win the NBA championship?"},
                                        {"l7", "Will inflation rise in 2025?"},
                                    });
  const auto right = build(analyzer, {
                                         {"r1", "Will the Fed cut interest rates in December meeting?"},
                                         {"r2", "Bitcoin above $100k in 2025?"},
                                         {"r3", "Will Trump win the presidential election?"},
                                         {"r4", "Fed rate cut in June"},
                                     });
  const matching::CandidateIndex index(right, 24.0);
  const matching::QualityGate gate(matching::make_default_polarity_pairs(),
                                   matching::make_default_required_entities(), {});

  matching::MatchConfig serial_config;
  serial_config.worker_threads = 1;
  const auto serial = summarize(matching::Matcher(gate, serial_config).map_phase(left, index));
  REQUIRE(serial.size() == left.size());
  CHECK(serial[0].ends_with(":r1"));
  CHECK(serial[3].ends_with(":polarity"));

  // Uneven shards, one record per worker, and more workers than records.
  for (const size_t workers : {size_t{3}, size_t{7}, size_t{64}}) {
    matching::MatchConfig config;
    config.worker_threads = workers;
    const auto sharded = summarize(matching::Matcher(gate, config).map_phase(left, index));
    CHECK(sharded == serial);
  }
}

TEST_CASE("Matcher map phase of an empty corpus starts no work", "[matching][matcher]") {
  const matching::QualityGate gate(matching::make_default_polarity_pairs(),
                                   matching::make_default_required_entities(), {});
  matching::MatchConfig config;
  config.worker_threads = 8;
  const std::vector<domain::Record> right;
  const matching::CandidateIndex index(right, 24.0);
  CHECK(matching::Matcher(gate, config).map_phase({}, index).empty());
}
