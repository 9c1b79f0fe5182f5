#include "trilld/features/hover_provider.hpp"

#include <memory>
#include <string>

#include <catch2/catch_all.hpp>
#include <spdlog/spdlog.h>

#include "../common/fake_language.hpp"

constexpr auto kLogLevel = spdlog::level::debug;

auto main(int argc, char* argv[]) -> int {
  spdlog::set_level(kLogLevel);
  spdlog::set_pattern("[%l] %v");
  return Catch::Session().run(argc, argv);
}

using trilld::HoverProvider;
using trilld::PositionEncoding;
using trilld::SourcePosition;
using trilld::SourceRange;
using trilld::test::FakeLanguage;

namespace {

auto CreateLanguage() -> std::shared_ptr<FakeLanguage> {
  auto language = std::make_shared<FakeLanguage>();
  language->AddFunction(
      "math_pkg", "add", {"a", "b"}, "Adds `a` and `b`.");
  return language;
}

}  // namespace

TEST_CASE("HoverProvider renders the documentation of a qualified name",
          "[hover]") {
  HoverProvider provider(CreateLanguage(), PositionEncoding::kUtf16);
  const std::string text = "y = math_pkg::add(1, 2);";

  // Cursor right after "add"
  auto doc = provider.Run(text, {.line = 0, .column = 17});

  REQUIRE(doc.has_value());
  REQUIRE(doc->markdown == "```fake\nadd(a, b)\n```\n\nAdds `a` and `b`.");
  REQUIRE(
      doc->range == SourceRange{
                        .start = {.line = 0, .column = 4},
                        .end = {.line = 0, .column = 17}});
}

TEST_CASE("HoverProvider range is measured in the configured encoding",
          "[hover]") {
  HoverProvider provider(CreateLanguage(), PositionEncoding::kUtf16);
  // Two-byte character before the token
  const std::string text = "\xC3\xA9 math_pkg::add";

  auto doc = provider.Run(text, {.line = 0, .column = 15});

  REQUIRE(doc.has_value());
  REQUIRE(doc->range.start == SourcePosition{.line = 0, .column = 2});
  REQUIRE(doc->range.end == SourcePosition{.line = 0, .column = 15});
}

TEST_CASE("HoverProvider ignores unqualified names", "[hover]") {
  auto language = CreateLanguage();
  // A bare entry under the same name is still not looked up
  language->docs["add"] = trilld::FunctionDoc{
      .signature = {.name = "add", .args = {"x"}},
      .description = "Unqualified add."};
  HoverProvider provider(language, PositionEncoding::kUtf16);
  const std::string text = "y = add";

  REQUIRE(language->GetFunctionDoc("add").has_value());
  REQUIRE_FALSE(provider.Run(text, {.line = 0, .column = 7}).has_value());
}

TEST_CASE("HoverProvider needs the cursor at the end of the name", "[hover]") {
  HoverProvider provider(CreateLanguage(), PositionEncoding::kUtf16);
  const std::string text = "y = math_pkg::add";

  // Cursor after "math_pkg::ad" looks up a name that doesn't exist
  REQUIRE_FALSE(provider.Run(text, {.line = 0, .column = 16}).has_value());
}

TEST_CASE("HoverProvider returns nothing for unknown functions", "[hover]") {
  HoverProvider provider(CreateLanguage(), PositionEncoding::kUtf16);
  const std::string text = "math_pkg::sub";

  REQUIRE_FALSE(provider.Run(text, {.line = 0, .column = 13}).has_value());
}
