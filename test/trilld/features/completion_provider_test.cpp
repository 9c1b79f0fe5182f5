#include "trilld/features/completion_provider.hpp"

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

using trilld::CompletionProvider;
using trilld::FunctionSignature;
using trilld::PositionEncoding;
using trilld::SourcePosition;
using trilld::test::FakeLanguage;

namespace {

auto CreateMathLanguage() -> std::shared_ptr<FakeLanguage> {
  auto language = std::make_shared<FakeLanguage>();
  language->AddFunction("math_pkg", "add", {"a", "b"}, "Adds two numbers.");
  language->AddFunction("math_pkg", "negate", {"x"});
  language->AddFunction("math_pkg", "pi", {});
  return language;
}

// Cursor at the end of `text`, which must be a single line
auto EndOf(const std::string& text) -> SourcePosition {
  return SourcePosition{.line = 0, .column = static_cast<int>(text.size())};
}

}  // namespace

TEST_CASE("CompletionProvider lists every member of a namespace", "[completion]") {
  CompletionProvider provider(CreateMathLanguage(), PositionEncoding::kUtf16);
  const std::string text = "x = math_pkg::";

  auto candidates = provider.Run(text, EndOf(text));

  REQUIRE(candidates.size() == 3);
  REQUIRE(candidates[0].label == "add");
  REQUIRE(candidates[1].label == "negate");
  REQUIRE(candidates[2].label == "pi");

  REQUIRE(candidates[0].detail == "add(a, b)");
  REQUIRE(candidates[0].documentation == "Adds two numbers.");
  REQUIRE(candidates[0].insert_text == "add(${1:a}, ${2:b})");

  REQUIRE(candidates[1].insert_text == "negate(${1:x})");
  REQUIRE_FALSE(candidates[1].documentation.has_value());

  REQUIRE(candidates[2].insert_text == "pi()");
}

TEST_CASE("CompletionProvider does not filter by the typed prefix", "[completion]") {
  CompletionProvider provider(CreateMathLanguage(), PositionEncoding::kUtf16);
  const std::string text = "x = math_pkg::ne";

  auto candidates = provider.Run(text, EndOf(text));

  REQUIRE(candidates.size() == 3);
}

TEST_CASE("CompletionProvider placeholders follow the arguments", "[completion]") {
  auto language = std::make_shared<FakeLanguage>();
  language->AddFunction("p", "f0", {});
  language->AddFunction("p", "f1", {"a"});
  language->AddFunction("p", "f3", {"a", "b", "c"});
  CompletionProvider provider(language, PositionEncoding::kUtf16);
  const std::string text = "p::";

  auto candidates = provider.Run(text, EndOf(text));

  REQUIRE(candidates.size() == 3);
  for (const auto& candidate : candidates) {
    auto doc = language->GetFunctionDoc("p::" + candidate.label);
    REQUIRE(doc.has_value());
    REQUIRE(candidate.insert_text.has_value());
    for (std::size_t i = 1; i <= doc->signature.args.size(); ++i) {
      REQUIRE_THAT(
          *candidate.insert_text,
          Catch::Matchers::ContainsSubstring("${" + std::to_string(i) + ":"));
    }
    REQUIRE_THAT(
        *candidate.insert_text,
        !Catch::Matchers::ContainsSubstring(
            "${" + std::to_string(doc->signature.args.size() + 1) + ":"));
  }
}

TEST_CASE("CompletionProvider keeps undocumented members as bare labels",
          "[completion]") {
  auto language = CreateMathLanguage();
  language->AddUndocumented("math_pkg", "internal_helper");
  CompletionProvider provider(language, PositionEncoding::kUtf16);
  const std::string text = "math_pkg::";

  auto candidates = provider.Run(text, EndOf(text));

  REQUIRE(candidates.size() == 4);
  const auto& bare = candidates.back();
  REQUIRE(bare.label == "internal_helper");
  REQUIRE_FALSE(bare.detail.has_value());
  REQUIRE_FALSE(bare.documentation.has_value());
  REQUIRE_FALSE(bare.insert_text.has_value());
}

TEST_CASE("CompletionProvider needs a namespace", "[completion]") {
  // Namespaces named like the bare token, and an unnamed one, must not leak
  // into unqualified completion
  auto language = CreateMathLanguage();
  language->AddFunction("add", "shadow", {"s"});
  language->AddFunction("", "global_fn", {});
  language->AddUndocumented("", "global_undocumented");
  CompletionProvider provider(language, PositionEncoding::kUtf16);

  SECTION("unqualified identifier") {
    const std::string text = "x = add";
    REQUIRE(provider.Run(text, EndOf(text)).empty());
  }

  SECTION("empty namespace") {
    const std::string text = "x = ::add";
    REQUIRE(provider.Run(text, EndOf(text)).empty());
  }

  SECTION("cursor on whitespace") {
    const std::string text = "x = ";
    REQUIRE(provider.Run(text, EndOf(text)).empty());
  }

  SECTION("unknown namespace") {
    const std::string text = "nope::";
    REQUIRE(provider.Run(text, EndOf(text)).empty());
  }
}

TEST_CASE("BuildSnippet escapes placeholder syntax", "[completion]") {
  FunctionSignature signature{.name = "f", .args = {"a$b", "c}d", "e\\f"}};

  REQUIRE(
      CompletionProvider::BuildSnippet(signature) ==
      "f(${1:a\\$b}, ${2:c\\}d}, ${3:e\\\\f})");
}
