#pragma once

#include <algorithm>
#include <memory>
#include <string>
#include <thread>
#include <type_traits>
#include <vector>

#include <asio.hpp>
#include <spdlog/spdlog.h>

#include "trilld/core/document_store.hpp"
#include "trilld/core/language_service_base.hpp"
#include "trilld/features/completion_provider.hpp"
#include "trilld/features/diagnostics_provider.hpp"
#include "trilld/features/hover_provider.hpp"

namespace trilld::services {

struct LanguageServiceOptions {
  PositionEncoding encoding = PositionEncoding::kUtf16;
  ClosePolicy close_policy = ClosePolicy::kRemove;
  // 0 picks half of the hardware threads
  std::size_t worker_threads = 0;
};

// Owns the document store and runs the feature pipelines on a worker pool.
// Every coroutine resumes on `executor` before it returns or publishes.
class LanguageService : public LanguageServiceBase {
 public:
  LanguageService(
      asio::any_io_executor executor, std::shared_ptr<const Language> language,
      LanguageServiceOptions options = {},
      std::shared_ptr<spdlog::logger> logger = nullptr);

  auto SetDiagnosticPublisher(DiagnosticPublisher publisher) -> void override {
    diagnostic_publisher_ = std::move(publisher);
  }

  auto OnDocumentOpened(
      std::string uri, std::string text, std::optional<int> version)
      -> asio::awaitable<std::vector<DiagnosticRecord>> override;

  auto OnDocumentChanged(
      std::string uri, std::string text, std::optional<int> version)
      -> asio::awaitable<std::vector<DiagnosticRecord>> override;

  auto OnDocumentClosed(std::string uri)
      -> std::vector<DiagnosticRecord> override;

  auto GetCompletions(std::string uri, SourcePosition position)
      -> asio::awaitable<std::expected<
          std::vector<CompletionCandidate>, LspError>> override;

  auto GetHover(std::string uri, SourcePosition position) -> asio::awaitable<
      std::expected<std::optional<RenderedDoc>, LspError>> override;

  auto SetPositionEncoding(PositionEncoding encoding) -> void override;

  [[nodiscard]] auto GetLanguage() const
      -> std::shared_ptr<const Language> override {
    return language_;
  }

  [[nodiscard]] auto IsDocumentOpen(const std::string& uri) const
      -> bool override {
    return store_.Contains(uri);
  }

  [[nodiscard]] auto GetDocumentStore() const -> const DocumentStore& {
    return store_;
  }

  [[nodiscard]] auto GetEncoding() const -> PositionEncoding {
    return options_.encoding;
  }

 private:
  // Shared tail of open and change, after the text is stored
  auto DiagnoseAndPublish(
      std::string uri, std::string text, std::optional<int> version)
      -> asio::awaitable<std::vector<DiagnosticRecord>>;

  // Runs `work` on the worker pool, then resumes on executor_
  template <typename Work>
  auto RunOnWorkerPool(Work work)
      -> asio::awaitable<std::invoke_result_t<Work&>> {
    using Result = std::invoke_result_t<Work&>;
    auto result = co_await asio::co_spawn(
        worker_pool_->get_executor(),
        [work = std::move(work)]() mutable -> asio::awaitable<Result> {
          co_return work();
        },
        asio::use_awaitable);
    co_await asio::post(executor_, asio::use_awaitable);
    co_return result;
  }

  auto Publish(
      const std::string& uri, std::optional<int> version,
      std::vector<DiagnosticRecord> records) -> void;

  static auto GetThreadPoolSize() -> std::size_t {
    auto hw_threads = std::thread::hardware_concurrency();
    return std::max(std::size_t{1}, static_cast<std::size_t>(hw_threads) / 2);
  }

  asio::any_io_executor executor_;
  std::shared_ptr<const Language> language_;
  LanguageServiceOptions options_;
  std::shared_ptr<spdlog::logger> logger_;

  DocumentStore store_;

  DiagnosticsProvider diagnostics_provider_;
  CompletionProvider completion_provider_;
  HoverProvider hover_provider_;

  DiagnosticPublisher diagnostic_publisher_;

  // Declared last so pending work finishes before the providers go away
  std::unique_ptr<asio::thread_pool> worker_pool_;
};

}  // namespace trilld::services
