#pragma once

#include <expected>
#include <memory>
#include <string>

#include <asio.hpp>
#include <jsonrpc/endpoint/endpoint.hpp>
#include <spdlog/spdlog.h>

#include "lsp/diagnostic.hpp"
#include "lsp/document_features.hpp"
#include "lsp/document_sync.hpp"
#include "lsp/error.hpp"
#include "lsp/lifecycle.hpp"
#include "lsp/window.hpp"

namespace lsp {

using lsp::error::LspError;
using lsp::error::LspErrorCode;
using lsp::error::Ok;

// Binds the LSP methods trilld serves to handlers on top of a JSON-RPC
// endpoint. Derived servers implement every handler except $/setTrace.
class LspServer {
 public:
  LspServer(
      asio::any_io_executor executor,
      std::unique_ptr<jsonrpc::endpoint::RpcEndpoint> endpoint,
      std::shared_ptr<spdlog::logger> logger = nullptr);

  LspServer(const LspServer&) = delete;
  LspServer(LspServer&&) = delete;
  auto operator=(const LspServer&) -> LspServer& = delete;
  auto operator=(LspServer&&) -> LspServer& = delete;

  virtual ~LspServer() = default;

  auto Start() -> asio::awaitable<std::expected<void, LspError>>;
  auto Shutdown() -> asio::awaitable<std::expected<void, LspError>>;
  auto Logger() -> std::shared_ptr<spdlog::logger> {
    return logger_;
  }

 protected:
  template <typename Result>
  using Awaitable = asio::awaitable<std::expected<Result, LspError>>;

  virtual auto OnInitialize(InitializeParams params)
      -> Awaitable<InitializeResult> = 0;
  virtual auto OnInitialized(InitializedParams params) -> Awaitable<void> = 0;
  virtual auto OnShutdown(ShutdownParams params)
      -> Awaitable<ShutdownResult> = 0;
  virtual auto OnExit(ExitParams params) -> Awaitable<void> = 0;

  // Trace output is not produced, so the level is accepted and dropped
  virtual auto OnSetTrace(SetTraceParams /*unused*/) -> Awaitable<void> {
    co_return Ok();
  }

  virtual auto OnDidOpenTextDocument(DidOpenTextDocumentParams params)
      -> Awaitable<void> = 0;
  virtual auto OnDidChangeTextDocument(DidChangeTextDocumentParams params)
      -> Awaitable<void> = 0;
  virtual auto OnDidCloseTextDocument(DidCloseTextDocumentParams params)
      -> Awaitable<void> = 0;

  virtual auto OnHover(HoverParams params) -> Awaitable<HoverResult> = 0;
  virtual auto OnCompletion(CompletionParams params)
      -> Awaitable<CompletionResult> = 0;

  auto PublishDiagnostics(PublishDiagnosticsParams params) -> Awaitable<void>;
  auto LogMessage(LogMessageParams params) -> Awaitable<void>;

 private:
  void RegisterHandlers();

  template <typename Params>
  void BindNotification(
      const std::string& method,
      Awaitable<void> (LspServer::*handler)(Params)) {
    endpoint_->RegisterNotification<Params, LspError>(
        method, [this, handler](const Params& params) {
          return (this->*handler)(params);
        });
  }

  template <typename Params, typename Result>
  void BindMethodCall(
      const std::string& method,
      Awaitable<Result> (LspServer::*handler)(Params)) {
    endpoint_->RegisterMethodCall<Params, Result, LspError>(
        method, [this, handler](const Params& params) {
          return (this->*handler)(params);
        });
  }

  // Sends a server-to-client notification, logging a failed send
  template <typename Params>
  auto Notify(const std::string& method, Params params) -> Awaitable<void> {
    auto result = co_await endpoint_->SendNotification<Params>(method, params);
    if (!result) {
      Logger()->error(
          "LspServer failed to send {}: {}", method, result.error().Message());
      co_return LspError::UnexpectedFromRpcError(result.error());
    }
    co_return Ok();
  }

  std::shared_ptr<spdlog::logger> logger_;
  std::unique_ptr<jsonrpc::endpoint::RpcEndpoint> endpoint_;
  asio::any_io_executor executor_;
  asio::executor_work_guard<asio::any_io_executor> work_guard_;
};

}  // namespace lsp
