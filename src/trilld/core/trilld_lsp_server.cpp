#include "trilld/core/trilld_lsp_server.hpp"

#include <ranges>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include "lsp/document_features.hpp"
#include "trilld/utils/conversion.hpp"
#include "trilld/utils/file_loader.hpp"

namespace trilld {

using lsp::LspError;
using lsp::LspErrorCode;
using lsp::Ok;

namespace {

constexpr std::string_view kServerName = "trilld";
constexpr std::string_view kServerVersion = "0.1.0";

}  // namespace

TrilldLspServer::TrilldLspServer(
    asio::any_io_executor executor,
    std::unique_ptr<jsonrpc::endpoint::RpcEndpoint> endpoint,
    std::shared_ptr<LanguageServiceBase> language_service,
    TrilldServerOptions options, std::shared_ptr<spdlog::logger> logger)
    : lsp::LspServer(executor, std::move(endpoint), logger),
      logger_(logger ? logger : spdlog::default_logger()),
      executor_(executor),
      language_service_(std::move(language_service)),
      options_(options) {
  language_service_->SetDiagnosticPublisher(
      [this](
          std::string uri, std::optional<int> version,
          std::vector<DiagnosticRecord> records) {
        auto coroutine = [this, uri = std::move(uri), version,
                          diagnostics = utils::ToLspDiagnostics(records)]()
            -> asio::awaitable<void> {
          auto result = co_await PublishDiagnostics(
              {.uri = uri, .version = version, .diagnostics = diagnostics});
          if (!result) {
            Logger()->warn(
                "Dropped diagnostics for {}: {}", uri,
                result.error().Message());
          }
        };
        asio::co_spawn(executor_, std::move(coroutine), asio::detached);
      });
}

auto TrilldLspServer::OnInitialize(lsp::InitializeParams params)
    -> asio::awaitable<std::expected<lsp::InitializeResult, lsp::LspError>> {
  if (params.clientInfo) {
    Logger()->debug("OnInitialize received from {}", params.clientInfo->name);
  }

  auto separator = language_service_->GetLanguage()->PathSeparator();
  std::vector<std::string> trigger_characters;
  if (!separator.empty()) {
    trigger_characters.emplace_back(1, separator.back());
  }

  auto encoding =
      utils::NegotiatePositionEncoding(params.capabilities, options_.encoding);
  if (encoding != options_.encoding) {
    Logger()->info(
        "Client does not offer {} positions, using {}",
        ToString(options_.encoding), ToString(encoding));
  }
  language_service_->SetPositionEncoding(encoding);

  lsp::TextDocumentSyncOptions sync_options{
      .openClose = true,
      .change = lsp::TextDocumentSyncKind::kFull,
  };

  lsp::ServerCapabilities::Workspace workspace{
      .workspaceFolders =
          lsp::WorkspaceFoldersServerCapabilities{
              .supported = true,
          },
  };

  lsp::ServerCapabilities capabilities{
      .positionEncoding = utils::ToPositionEncodingKind(encoding),
      .textDocumentSync = sync_options,
      .completionProvider =
          lsp::CompletionOptions{
              .triggerCharacters = std::move(trigger_characters),
              .resolveProvider = false,
          },
      .hoverProvider = true,
      .workspace = workspace,
  };

  co_return lsp::InitializeResult{
      .capabilities = capabilities,
      .serverInfo = lsp::InitializeResult::ServerInfo{
          .name = std::string(kServerName),
          .version = std::string(kServerVersion)}};
}

auto TrilldLspServer::OnInitialized(lsp::InitializedParams /*unused*/)
    -> asio::awaitable<std::expected<void, lsp::LspError>> {
  auto message = fmt::format(
      "{} initialized ({})", kServerName,
      language_service_->GetLanguage()->Name());
  Logger()->info("{}", message);

  auto result = co_await LogMessage(
      {.type = lsp::MessageType::kInfo, .message = message});
  if (!result) {
    co_return std::unexpected(result.error());
  }
  co_return Ok();
}

auto TrilldLspServer::OnShutdown(lsp::ShutdownParams /*unused*/)
    -> asio::awaitable<std::expected<lsp::ShutdownResult, lsp::LspError>> {
  shutdown_requested_ = true;
  co_return lsp::ShutdownResult{};
}

auto TrilldLspServer::OnExit(lsp::ExitParams /*unused*/)
    -> asio::awaitable<std::expected<void, lsp::LspError>> {
  if (!shutdown_requested_) {
    Logger()->warn("Exit received before shutdown");
  }
  co_return co_await lsp::LspServer::Shutdown();
}

auto TrilldLspServer::ResolveOpenedText(const lsp::TextDocumentItem& item) const
    -> std::string {
  if (!options_.load_from_disk) {
    return item.text;
  }

  auto loaded = utils::LoadDocumentText(item.uri);
  if (!loaded) {
    logger_->debug(
        "Using client text for {}: {}", item.uri, loaded.error().Message());
    return item.text;
  }
  return std::move(*loaded);
}

auto TrilldLspServer::OnDidOpenTextDocument(
    lsp::DidOpenTextDocumentParams params)
    -> asio::awaitable<std::expected<void, lsp::LspError>> {
  const auto& text_doc = params.textDocument;
  Logger()->debug("OnDidOpenTextDocument received: {}", text_doc.uri);

  co_await language_service_->OnDocumentOpened(
      text_doc.uri, ResolveOpenedText(text_doc), text_doc.version);

  co_return Ok();
}

auto TrilldLspServer::OnDidChangeTextDocument(
    lsp::DidChangeTextDocumentParams params)
    -> asio::awaitable<std::expected<void, lsp::LspError>> {
  Logger()->debug(
      "OnDidChangeTextDocument received: {}", params.textDocument.uri);

  // Full sync: the last full-content event holds the current text
  for (auto& change : std::views::reverse(params.contentChanges)) {
    if (auto* full_change =
            std::get_if<lsp::TextDocumentContentFullChangeEvent>(&change)) {
      co_await language_service_->OnDocumentChanged(
          params.textDocument.uri, std::move(full_change->text),
          params.textDocument.version);
      co_return Ok();
    }
  }

  Logger()->warn(
      "OnDidChangeTextDocument without full content for {}",
      params.textDocument.uri);
  co_return Ok();
}

auto TrilldLspServer::OnDidCloseTextDocument(
    lsp::DidCloseTextDocumentParams params)
    -> asio::awaitable<std::expected<void, lsp::LspError>> {
  Logger()->debug(
      "OnDidCloseTextDocument received: {}", params.textDocument.uri);
  language_service_->OnDocumentClosed(params.textDocument.uri);
  co_return Ok();
}

auto TrilldLspServer::OnCompletion(lsp::CompletionParams params)
    -> asio::awaitable<std::expected<lsp::CompletionResult, lsp::LspError>> {
  Logger()->debug("OnCompletion received: {}", params.textDocument.uri);

  auto result = co_await language_service_->GetCompletions(
      params.textDocument.uri, utils::ToSourcePosition(params.position));

  std::vector<lsp::CompletionItem> items;
  if (!result) {
    if (result.error().Code() != LspErrorCode::kDocumentNotFound) {
      co_return std::unexpected(result.error());
    }
    Logger()->warn("OnCompletion: {}", result.error().Message());
    co_return items;
  }

  items.reserve(result->size());
  for (const auto& candidate : *result) {
    items.push_back(utils::ToLspCompletionItem(candidate));
  }
  co_return items;
}

auto TrilldLspServer::OnHover(lsp::HoverParams params)
    -> asio::awaitable<std::expected<lsp::HoverResult, lsp::LspError>> {
  Logger()->debug("OnHover received: {}", params.textDocument.uri);

  auto result = co_await language_service_->GetHover(
      params.textDocument.uri, utils::ToSourcePosition(params.position));

  if (!result) {
    if (result.error().Code() != LspErrorCode::kDocumentNotFound) {
      co_return std::unexpected(result.error());
    }
    Logger()->warn("OnHover: {}", result.error().Message());
    co_return lsp::HoverResult{};
  }

  if (!result->has_value()) {
    co_return lsp::HoverResult{};
  }
  co_return utils::ToLspHover(**result);
}

}  // namespace trilld
