#pragma once

#include <memory>

#include <asio/awaitable.hpp>
#include <asio/io_context.hpp>

#include "lsp/lifecycle.hpp"
#include "lsp/lsp_server.hpp"
#include "trilld/core/language_service_base.hpp"
#include "trilld/core/position_mapper.hpp"

namespace trilld {

struct TrilldServerOptions {
  // Advertised when the client offers it, otherwise utf-16
  PositionEncoding encoding = PositionEncoding::kUtf16;
  // Read didOpen text from disk when the URI is a readable file
  bool load_from_disk = false;
};

class TrilldLspServer : public lsp::LspServer {
 public:
  TrilldLspServer(
      asio::any_io_executor executor,
      std::unique_ptr<jsonrpc::endpoint::RpcEndpoint> endpoint,
      std::shared_ptr<LanguageServiceBase> language_service,
      TrilldServerOptions options = {},
      std::shared_ptr<spdlog::logger> logger = nullptr);

 private:
  bool shutdown_requested_ = false;

  std::shared_ptr<spdlog::logger> logger_;

  asio::any_io_executor executor_;

  std::shared_ptr<LanguageServiceBase> language_service_{nullptr};

  TrilldServerOptions options_;

  // Text to store for a newly opened document
  auto ResolveOpenedText(const lsp::TextDocumentItem& item) const
      -> std::string;

 protected:
  auto OnInitialize(lsp::InitializeParams params) -> asio::awaitable<
      std::expected<lsp::InitializeResult, lsp::LspError>> override;

  auto OnInitialized(lsp::InitializedParams params)
      -> asio::awaitable<std::expected<void, lsp::LspError>> override;

  auto OnShutdown(lsp::ShutdownParams params) -> asio::awaitable<
      std::expected<lsp::ShutdownResult, lsp::LspError>> override;

  auto OnExit(lsp::ExitParams params)
      -> asio::awaitable<std::expected<void, lsp::LspError>> override;

  auto OnDidOpenTextDocument(lsp::DidOpenTextDocumentParams params)
      -> asio::awaitable<std::expected<void, lsp::LspError>> override;

  auto OnDidChangeTextDocument(lsp::DidChangeTextDocumentParams params)
      -> asio::awaitable<std::expected<void, lsp::LspError>> override;

  auto OnDidCloseTextDocument(lsp::DidCloseTextDocumentParams params)
      -> asio::awaitable<std::expected<void, lsp::LspError>> override;

  auto OnCompletion(lsp::CompletionParams params) -> asio::awaitable<
      std::expected<lsp::CompletionResult, lsp::LspError>> override;

  auto OnHover(lsp::HoverParams params) -> asio::awaitable<
      std::expected<lsp::HoverResult, lsp::LspError>> override;
};

}  // namespace trilld
