#include "pmlink/extraction/number_extractor.h"

#include <catch2/catch_test_macros.hpp>

#include <set>
#include <string>

using namespace pmlink;

TEST_CASE("NumberExtractor reconstructs unit tokens", "[extraction][numbers]") {
  const extraction::NumberExtractor extractor;
  CHECK(extractor.extract("a $2.5m grant at 25bps over 2024") ==
        std::set<std::string>{"$2.5m", "2024", "25bps"});
}

TEST_CASE("NumberExtractor token classes", "[extraction][numbers]") {
  const extraction::NumberExtractor extractor;

  SECTION("percentages keep their sign") {
    CHECK(extractor.extract("Inflation above 3.5% in 2025") ==
          std::set<std::string>{"2025", "3.5%"});
  }

  SECTION("dollar suffixes are lower-cased") {
    CHECK(extractor.extract("Bitcoin above $100K") == std::set<std::string>{"$100k"});
  }

  SECTION("basis point spellings fold to bps") {
    CHECK(extractor.extract("hike of 50 bps").count("50bps") == 1);
    CHECK(extractor.extract("hike of 50bp").count("50bps") == 1);
  }

  SECTION("thousands separators are kept verbatim") {
    CHECK(extractor.extract("$1,000,000 prize") ==
          std::set<std::string>{"$1,000,000", "1,000,000"});
  }

  SECTION("years outside 202x are plain literals") {
    CHECK(extractor.extract("since 1999") == std::set<std::string>{"1999"});
  }
}

TEST_CASE("NumberExtractor drops small unit-less numbers", "[extraction][numbers]") {
  const extraction::NumberExtractor extractor;
  CHECK(extractor.extract("3 seats in 2 states").empty());
  CHECK(extractor.extract("over 9.5 goals").empty());
  CHECK(extractor.extract("over 10 goals") == std::set<std::string>{"10"});
}

TEST_CASE("NumberExtractor handles very long digit and space runs", "[extraction][numbers]") {
  const extraction::NumberExtractor extractor;
  CHECK(extractor.extract("price in 2025 " + std::string(50000, '9')) ==
        std::set<std::string>{"2025"});
  CHECK(extractor.extract("25" + std::string(100000, ' ') + "bps").count("25bps") == 1);
}
