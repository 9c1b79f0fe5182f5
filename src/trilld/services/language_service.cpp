#include "trilld/services/language_service.hpp"

#include "trilld/utils/scoped_timer.hpp"

namespace trilld::services {

LanguageService::LanguageService(
    asio::any_io_executor executor, std::shared_ptr<const Language> language,
    LanguageServiceOptions options, std::shared_ptr<spdlog::logger> logger)
    : executor_(std::move(executor)),
      language_(std::move(language)),
      options_(options),
      logger_(logger ? logger : spdlog::default_logger()),
      store_(options_.close_policy, logger_),
      diagnostics_provider_(language_, options_.encoding, logger_),
      completion_provider_(language_, options_.encoding, logger_),
      hover_provider_(language_, options_.encoding, logger_),
      worker_pool_(std::make_unique<asio::thread_pool>(
          options_.worker_threads > 0 ? options_.worker_threads
                                      : GetThreadPoolSize())) {
  logger_->debug(
      "LanguageService created for {} ({} encoding, {} worker threads)",
      language_->Name(), ToString(options_.encoding),
      options_.worker_threads > 0 ? options_.worker_threads
                                  : GetThreadPoolSize());
}

auto LanguageService::OnDocumentOpened(
    std::string uri, std::string text, std::optional<int> version)
    -> asio::awaitable<std::vector<DiagnosticRecord>> {
  utils::ScopedTimer timer("OnDocumentOpened", logger_);
  store_.Open(uri, text);
  co_return co_await DiagnoseAndPublish(
      std::move(uri), std::move(text), version);
}

auto LanguageService::OnDocumentChanged(
    std::string uri, std::string text, std::optional<int> version)
    -> asio::awaitable<std::vector<DiagnosticRecord>> {
  utils::ScopedTimer timer("OnDocumentChanged", logger_);
  store_.Update(uri, text);
  co_return co_await DiagnoseAndPublish(
      std::move(uri), std::move(text), version);
}

auto LanguageService::DiagnoseAndPublish(
    std::string uri, std::string text, std::optional<int> version)
    -> asio::awaitable<std::vector<DiagnosticRecord>> {
  auto records = co_await RunOnWorkerPool(
      [this, text = std::move(text)]() {
        return diagnostics_provider_.Run(text);
      });

  logger_->debug(
      "LanguageService computed {} diagnostics for: {}", records.size(), uri);
  // A close that landed while the worker ran already sent the empty list
  if (options_.close_policy == ClosePolicy::kRemove && !store_.Contains(uri)) {
    logger_->debug("LanguageService dropped diagnostics for closed: {}", uri);
    co_return records;
  }
  Publish(uri, version, records);
  co_return records;
}

auto LanguageService::OnDocumentClosed(std::string uri)
    -> std::vector<DiagnosticRecord> {
  store_.Close(uri);
  Publish(uri, std::nullopt, {});
  return {};
}

auto LanguageService::GetCompletions(std::string uri, SourcePosition position)
    -> asio::awaitable<
        std::expected<std::vector<CompletionCandidate>, LspError>> {
  utils::ScopedTimer timer("GetCompletions", logger_);

  auto state = store_.Get(uri);
  if (!state) {
    co_return std::unexpected(state.error());
  }

  co_return co_await RunOnWorkerPool(
      [this, state = *state, position]() {
        return completion_provider_.Run(state->text, position);
      });
}

auto LanguageService::GetHover(std::string uri, SourcePosition position)
    -> asio::awaitable<std::expected<std::optional<RenderedDoc>, LspError>> {
  utils::ScopedTimer timer("GetHover", logger_);

  auto state = store_.Get(uri);
  if (!state) {
    co_return std::unexpected(state.error());
  }

  co_return co_await RunOnWorkerPool([this, state = *state, position]() {
    return hover_provider_.Run(state->text, position);
  });
}

auto LanguageService::SetPositionEncoding(PositionEncoding encoding) -> void {
  logger_->debug(
      "LanguageService position encoding: {} -> {}",
      ToString(options_.encoding), ToString(encoding));
  options_.encoding = encoding;
  diagnostics_provider_.SetEncoding(encoding);
  completion_provider_.SetEncoding(encoding);
  hover_provider_.SetEncoding(encoding);
}

auto LanguageService::Publish(
    const std::string& uri, std::optional<int> version,
    std::vector<DiagnosticRecord> records) -> void {
  if (diagnostic_publisher_) {
    diagnostic_publisher_(uri, version, std::move(records));
  }
}

}  // namespace trilld::services
