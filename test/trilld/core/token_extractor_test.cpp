#include "trilld/core/token_extractor.hpp"

#include <string_view>

#include <catch2/catch_all.hpp>
#include <spdlog/spdlog.h>

constexpr auto kLogLevel = spdlog::level::debug;

auto main(int argc, char* argv[]) -> int {
  spdlog::set_level(kLogLevel);
  spdlog::set_pattern("[%l] %v");
  return Catch::Session().run(argc, argv);
}

using trilld::ExtractToken;
using trilld::ExtractTokenAt;
using trilld::PositionEncoding;

constexpr std::string_view kSeparator = "::";

TEST_CASE("ExtractTokenAt splits a qualified path", "[token]") {
  constexpr std::string_view kText = "x = math_pkg::add";

  auto token = ExtractTokenAt(kText, kText.size(), kSeparator);

  REQUIRE(token.has_value());
  REQUIRE(token->text == "math_pkg::add");
  REQUIRE(token->ns == "math_pkg");
  REQUIRE(token->member == "add");
  REQUIRE(token->start == 4);
  REQUIRE(token->end == kText.size());
  REQUIRE(token->IsQualified());
}

TEST_CASE("ExtractTokenAt returns an unqualified identifier", "[token]") {
  constexpr std::string_view kText = "bar";

  auto token = ExtractTokenAt(kText, 3, kSeparator);

  REQUIRE(token.has_value());
  REQUIRE(token->text == "bar");
  REQUIRE_FALSE(token->ns.has_value());
  REQUIRE(token->member == "bar");
}

TEST_CASE("ExtractTokenAt never reads past the cursor", "[token]") {
  constexpr std::string_view kText = "math_pkg::multiply(a, b)";

  // Cursor after "math_pkg::mul"
  auto token = ExtractTokenAt(kText, 13, kSeparator);

  REQUIRE(token.has_value());
  REQUIRE(token->text == "math_pkg::mul");
  REQUIRE(token->member == "mul");
  REQUIRE(token->end == 13);
}

TEST_CASE("ExtractTokenAt keeps a trailing separator", "[token]") {
  constexpr std::string_view kText = "y = util::";

  auto token = ExtractTokenAt(kText, kText.size(), kSeparator);

  REQUIRE(token.has_value());
  REQUIRE(token->ns == "util");
  REQUIRE(token->member.empty());
}

TEST_CASE("ExtractTokenAt splits on the last separator", "[token]") {
  constexpr std::string_view kText = "a::b::c";

  auto token = ExtractTokenAt(kText, kText.size(), kSeparator);

  REQUIRE(token.has_value());
  REQUIRE(token->ns == "a::b");
  REQUIRE(token->member == "c");
}

TEST_CASE("ExtractTokenAt gives an empty namespace for a leading separator",
          "[token]") {
  constexpr std::string_view kText = " ::foo";

  auto token = ExtractTokenAt(kText, kText.size(), kSeparator);

  REQUIRE(token.has_value());
  REQUIRE(token->ns.has_value());
  REQUIRE(token->ns->empty());
  REQUIRE(token->member == "foo");
}

TEST_CASE("ExtractTokenAt stops at a lone colon", "[token]") {
  constexpr std::string_view kText = "a:b";

  auto token = ExtractTokenAt(kText, kText.size(), kSeparator);

  REQUIRE(token.has_value());
  REQUIRE(token->text == "b");
}

TEST_CASE("ExtractTokenAt finds nothing after whitespace or punctuation",
          "[token]") {
  auto cursor = GENERATE(
      std::string_view{"foo "}, std::string_view{"foo("},
      std::string_view{"a, "}, std::string_view{""});

  REQUIRE_FALSE(ExtractTokenAt(cursor, cursor.size(), kSeparator).has_value());
}

TEST_CASE("ExtractToken maps a position before scanning", "[token]") {
  constexpr std::string_view kText = "line one\n  pkg::fn(x);\n";

  SECTION("cursor inside the identifier") {
    auto token = ExtractToken(
        kText, {.line = 1, .column = 9}, kSeparator, PositionEncoding::kUtf16);
    REQUIRE(token.has_value());
    REQUIRE(token->text == "pkg::fn");
    REQUIRE(token->ns == "pkg");
  }

  SECTION("column past the end of the line clamps") {
    auto token = ExtractToken(
        kText, {.line = 0, .column = 40}, kSeparator, PositionEncoding::kUtf16);
    REQUIRE(token.has_value());
    REQUIRE(token->text == "one");
  }

  SECTION("line past the end gives nothing") {
    auto token = ExtractToken(
        kText, {.line = 5, .column = 0}, kSeparator, PositionEncoding::kUtf16);
    REQUIRE_FALSE(token.has_value());
  }
}
