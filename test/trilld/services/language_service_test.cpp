#include "trilld/services/language_service.hpp"

#include <exception>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <asio.hpp>
#include <catch2/catch_all.hpp>
#include <spdlog/spdlog.h>

#include "../common/async_fixture.hpp"
#include "../common/fake_language.hpp"

constexpr auto kLogLevel = spdlog::level::debug;

auto main(int argc, char* argv[]) -> int {
  spdlog::set_level(kLogLevel);
  spdlog::set_pattern("[%l] %v");
  return Catch::Session().run(argc, argv);
}

using lsp::error::LspErrorCode;
using trilld::ClosePolicy;
using trilld::DiagnosticRecord;
using trilld::RawError;
using trilld::services::LanguageService;
using trilld::services::LanguageServiceOptions;
using trilld::test::FakeLanguage;
using trilld::test::RunAsyncTest;

namespace {

constexpr std::string_view kUri = "file:///work/top.sv";

struct PublishedDiagnostics {
  std::string uri;
  std::optional<int> version;
  std::vector<DiagnosticRecord> records;
};

auto CreateLanguage() -> std::shared_ptr<FakeLanguage> {
  auto language = std::make_shared<FakeLanguage>();
  language->AddFunction("math_pkg", "add", {"a", "b"}, "Adds.");
  return language;
}

auto CreateService(
    asio::any_io_executor executor, std::shared_ptr<FakeLanguage> language,
    std::vector<PublishedDiagnostics>& published,
    ClosePolicy close_policy = ClosePolicy::kRemove)
    -> std::unique_ptr<LanguageService> {
  auto service = std::make_unique<LanguageService>(
      executor, std::move(language),
      LanguageServiceOptions{.close_policy = close_policy, .worker_threads = 2});
  service->SetDiagnosticPublisher(
      [&published](
          std::string uri, std::optional<int> version,
          std::vector<DiagnosticRecord> records) {
        published.push_back(
            {.uri = std::move(uri),
             .version = version,
             .records = std::move(records)});
      });
  return service;
}

}  // namespace

TEST_CASE("LanguageService publishes diagnostics on open", "[service]") {
  RunAsyncTest([](asio::any_io_executor executor) -> asio::awaitable<void> {
    auto language = CreateLanguage();
    language->errors.push_back(RawError{
        .start = {.line = 1, .column = 1},
        .end = {.line = 1, .column = 2},
        .callout = "bad token",
        .hint = "remove it"});

    std::vector<PublishedDiagnostics> published;
    auto service = CreateService(executor, language, published);

    auto records = co_await service->OnDocumentOpened(
        std::string(kUri), "x;\n", 3);

    REQUIRE(records.size() == 1);
    REQUIRE(records[0].message == "bad token, Note: remove it");
    REQUIRE(service->IsDocumentOpen(std::string(kUri)));

    REQUIRE(published.size() == 1);
    REQUIRE(published[0].uri == kUri);
    REQUIRE(published[0].version == 3);
    REQUIRE(published[0].records.size() == 1);
  });
}

TEST_CASE("LanguageService replaces the text on change", "[service]") {
  RunAsyncTest([](asio::any_io_executor executor) -> asio::awaitable<void> {
    std::vector<PublishedDiagnostics> published;
    auto service = CreateService(executor, CreateLanguage(), published);

    co_await service->OnDocumentOpened(std::string(kUri), "old", 1);
    auto records =
        co_await service->OnDocumentChanged(std::string(kUri), "new", 2);

    REQUIRE(records.empty());
    auto state = service->GetDocumentStore().Get(std::string(kUri));
    REQUIRE(state.has_value());
    REQUIRE((*state)->text == "new");
    REQUIRE(published.size() == 2);
    REQUIRE(published[1].version == 2);
  });
}

TEST_CASE("LanguageService clears diagnostics on close", "[service]") {
  RunAsyncTest([](asio::any_io_executor executor) -> asio::awaitable<void> {
    std::vector<PublishedDiagnostics> published;
    auto service = CreateService(executor, CreateLanguage(), published);

    co_await service->OnDocumentOpened(std::string(kUri), "text", 1);
    auto records = service->OnDocumentClosed(std::string(kUri));

    REQUIRE(records.empty());
    REQUIRE_FALSE(service->IsDocumentOpen(std::string(kUri)));
    REQUIRE(published.size() == 2);
    REQUIRE(published.back().uri == kUri);
    REQUIRE(published.back().records.empty());
  });
}

TEST_CASE("LanguageService can retain closed documents", "[service]") {
  RunAsyncTest([](asio::any_io_executor executor) -> asio::awaitable<void> {
    std::vector<PublishedDiagnostics> published;
    auto service = CreateService(
        executor, CreateLanguage(), published, ClosePolicy::kRetain);

    const std::string text = "y = math_pkg::";
    co_await service->OnDocumentOpened(std::string(kUri), text, 1);
    service->OnDocumentClosed(std::string(kUri));

    auto completions = co_await service->GetCompletions(
        std::string(kUri),
        {.line = 0, .column = static_cast<int>(text.size())});
    REQUIRE(completions.has_value());
    REQUIRE(completions->size() == 1);
  });
}

TEST_CASE("LanguageService answers completion and hover", "[service]") {
  RunAsyncTest([](asio::any_io_executor executor) -> asio::awaitable<void> {
    std::vector<PublishedDiagnostics> published;
    auto service = CreateService(executor, CreateLanguage(), published);

    const std::string text = "y = math_pkg::add";
    co_await service->OnDocumentOpened(std::string(kUri), text, 1);
    trilld::SourcePosition end_of_text{
        .line = 0, .column = static_cast<int>(text.size())};

    auto completions =
        co_await service->GetCompletions(std::string(kUri), end_of_text);
    REQUIRE(completions.has_value());
    REQUIRE(completions->size() == 1);
    REQUIRE(completions->front().label == "add");
    REQUIRE(completions->front().insert_text == "add(${1:a}, ${2:b})");

    auto hover = co_await service->GetHover(std::string(kUri), end_of_text);
    REQUIRE(hover.has_value());
    REQUIRE(hover->has_value());
    REQUIRE_THAT(
        (*hover)->markdown, Catch::Matchers::ContainsSubstring("add(a, b)"));
  });
}

TEST_CASE("LanguageService reports unknown documents", "[service]") {
  RunAsyncTest([](asio::any_io_executor executor) -> asio::awaitable<void> {
    std::vector<PublishedDiagnostics> published;
    auto service = CreateService(executor, CreateLanguage(), published);

    auto completions = co_await service->GetCompletions(
        "file:///never-opened.sv", {.line = 0, .column = 0});
    REQUIRE_FALSE(completions.has_value());
    REQUIRE(completions.error().Code() == LspErrorCode::kDocumentNotFound);

    auto hover = co_await service->GetHover(
        "file:///never-opened.sv", {.line = 0, .column = 0});
    REQUIRE_FALSE(hover.has_value());
    REQUIRE(hover.error().Code() == LspErrorCode::kDocumentNotFound);
  });
}

TEST_CASE("LanguageService keeps the last of rapid changes", "[service]") {
  RunAsyncTest([](asio::any_io_executor executor) -> asio::awaitable<void> {
    std::vector<PublishedDiagnostics> published;
    auto service = CreateService(executor, CreateLanguage(), published);

    co_await service->OnDocumentOpened(std::string(kUri), "v0", 0);
    for (int version = 1; version <= 20; ++version) {
      co_await service->OnDocumentChanged(
          std::string(kUri), "v" + std::to_string(version), version);
    }

    auto state = service->GetDocumentStore().Get(std::string(kUri));
    REQUIRE(state.has_value());
    REQUIRE((*state)->text == "v20");
    REQUIRE(published.size() == 21);
  });
}

TEST_CASE(
    "LanguageService drops diagnostics that finish after close",
    "[service]") {
  RunAsyncTest([](asio::any_io_executor executor) -> asio::awaitable<void> {
    auto language = CreateLanguage();
    language->errors.push_back(RawError{
        .start = {.line = 1, .column = 1},
        .end = {.line = 1, .column = 2},
        .callout = "bad token"});

    std::vector<PublishedDiagnostics> published;
    auto service = CreateService(executor, language, published);

    bool opened = false;
    std::exception_ptr open_error;
    std::vector<DiagnosticRecord> open_records;
    asio::co_spawn(
        executor, service->OnDocumentOpened(std::string(kUri), "x;\n", 1),
        [&](std::exception_ptr error, std::vector<DiagnosticRecord> records) {
          open_error = error;
          open_records = std::move(records);
          opened = true;
        });

    // Let the open store the text and hand the parse to the worker pool
    co_await asio::post(executor, asio::use_awaitable);
    REQUIRE(service->IsDocumentOpen(std::string(kUri)));
    service->OnDocumentClosed(std::string(kUri));

    while (!opened) {
      co_await asio::post(executor, asio::use_awaitable);
    }

    REQUIRE_FALSE(open_error);
    REQUIRE(open_records.size() == 1);
    REQUIRE(published.size() == 1);
    REQUIRE(published.back().uri == kUri);
    REQUIRE(published.back().records.empty());
  });
}

TEST_CASE("LanguageService switches position encoding", "[service]") {
  RunAsyncTest([](asio::any_io_executor executor) -> asio::awaitable<void> {
    std::vector<PublishedDiagnostics> published;
    auto service = CreateService(executor, CreateLanguage(), published);
    REQUIRE(service->GetEncoding() == trilld::PositionEncoding::kUtf16);

    // "é" is one UTF-16 unit and two UTF-8 bytes
    const std::string text = "\xC3\xA9 = math_pkg::add";
    co_await service->OnDocumentOpened(std::string(kUri), text, 1);

    auto hover = co_await service->GetHover(
        std::string(kUri), {.line = 0, .column = 15});
    REQUIRE(hover.has_value());
    REQUIRE(hover->has_value());
    REQUIRE((*hover)->range.start.column == 4);

    service->SetPositionEncoding(trilld::PositionEncoding::kUtf8);
    REQUIRE(service->GetEncoding() == trilld::PositionEncoding::kUtf8);

    hover = co_await service->GetHover(
        std::string(kUri), {.line = 0, .column = 15});
    REQUIRE(hover.has_value());
    REQUIRE(hover->has_value());
    REQUIRE((*hover)->range.start.column == 5);
  });
}
