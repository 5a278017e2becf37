#include "pmlink/core/normalization.h"

#include <catch2/catch_test_macros.hpp>

#include <string>

using namespace pmlink;

TEST_CASE("fold_text lowercases and strips punctuation", "[core][normalization]") {
  CHECK(core::fold_text("Will BTC hit $100k?!") == "will btc hit 100k");
  CHECK(core::fold_text("  Fed:  rate-cut   (25bps)  ") == "fed rate cut 25bps");
  CHECK(core::fold_text("") == "");
  CHECK(core::fold_text("?!...") == "");
}

TEST_CASE("fold_text is insensitive to case, punctuation and spacing", "[core][normalization]") {
  CHECK(core::fold_text("Trump wins, 2024.") == core::fold_text("trump   WINS 2024"));
}

TEST_CASE("fold_text keeps non-ASCII letters as word characters", "[core][normalization]") {
  CHECK(core::fold_text("Caf\xC3\xA9 OPEN") == "caf\xC3\xA9 open");
  CHECK(core::fold_text("Z\xC3\xBCrich") == "z\xC3\xBCrich");
}

TEST_CASE("fold_text treats typographic punctuation like ASCII punctuation",
          "[core][normalization]") {
  // U+2019 right single quote and U+2014 em dash
  const std::string typographic = "Will Trump\xE2\x80\x99s tariff \xE2\x80\x94 passed?";
  CHECK(core::fold_text(typographic) == "will trump s tariff passed");
  CHECK(core::fold_text(typographic) == core::fold_text("Will Trump's tariff - passed?"));

  // U+201C/U+201D curly double quotes, U+2026 ellipsis
  CHECK(core::fold_text("\xE2\x80\x9C" "Fed\xE2\x80\x9D cut\xE2\x80\xA6") == "fed cut");
  // U+00A0 no-break space, U+2013 en dash
  CHECK(core::fold_text("2024\xC2\xA0\xE2\x80\x93\xC2\xA0" "2025") == "2024 2025");
  // U+20AC euro sign, U+FF1F fullwidth question mark
  CHECK(core::fold_text("\xE2\x82\xAC" "100k\xEF\xBC\x9F") == "100k");
}

TEST_CASE("fold_text keeps malformed UTF-8 bytes verbatim", "[core][normalization]") {
  CHECK(core::fold_text("a\xE2\x80") == "a\xE2\x80");
  CHECK(core::fold_text("x\xFFy") == "x\xFFy");
}

TEST_CASE("trim", "[core][normalization]") {
  CHECK(core::trim("\t  hello world \n") == "hello world");
  CHECK(core::trim("   ") == "");
}

TEST_CASE("normalize_ascii_lower only touches A-Z", "[core][normalization]") {
  CHECK(core::normalize_ascii_lower("ETH $2.5M") == "eth $2.5m");
}
