#include "lsp/lsp_server.hpp"

#include <asio.hpp>
#include <jsonrpc/endpoint/endpoint.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace lsp {

LspServer::LspServer(
    asio::any_io_executor executor,
    std::unique_ptr<jsonrpc::endpoint::RpcEndpoint> endpoint,
    std::shared_ptr<spdlog::logger> logger)
    : logger_(logger ? logger : spdlog::default_logger()),
      endpoint_(std::move(endpoint)),
      executor_(executor),
      work_guard_(asio::make_work_guard(executor)) {
}

auto LspServer::Start() -> asio::awaitable<std::expected<void, LspError>> {
  RegisterHandlers();

  auto result = co_await endpoint_->Start();
  if (!result.has_value()) {
    Logger()->error("LspServer endpoint error: {}", result.error().Message());
    co_return LspError::UnexpectedFromRpcError(result.error());
  }
  Logger()->debug("LspServer endpoint started");

  auto shutdown_result = co_await endpoint_->WaitForShutdown();
  if (!shutdown_result.has_value()) {
    Logger()->error(
        "LspServer endpoint wait for shutdown error: {}",
        shutdown_result.error().Message());
    co_return LspError::UnexpectedFromRpcError(shutdown_result.error());
  }
  Logger()->debug("LspServer endpoint wait for shutdown completed");

  co_return Ok();
}

auto LspServer::Shutdown() -> asio::awaitable<std::expected<void, LspError>> {
  Logger()->debug("LspServer shutting down");

  if (endpoint_) {
    auto result = co_await endpoint_->Shutdown();
    if (!result.has_value()) {
      Logger()->error(
          "LspServer endpoint shutdown error: {}", result.error().Message());
      co_return LspError::UnexpectedFromRpcError(result.error());
    }
    Logger()->debug("LspServer endpoint shutdown");
  }

  // Lets io_context.run() return once pending work drains
  work_guard_.reset();

  co_return Ok();
}

auto LspServer::PublishDiagnostics(PublishDiagnosticsParams params)
    -> Awaitable<void> {
  co_return co_await Notify(
      "textDocument/publishDiagnostics", std::move(params));
}

auto LspServer::LogMessage(LogMessageParams params) -> Awaitable<void> {
  co_return co_await Notify("window/logMessage", std::move(params));
}

void LspServer::RegisterHandlers() {
  BindMethodCall<InitializeParams, InitializeResult>(
      "initialize", &LspServer::OnInitialize);
  BindNotification<InitializedParams>(
      "initialized", &LspServer::OnInitialized);
  BindNotification<SetTraceParams>("$/setTrace", &LspServer::OnSetTrace);
  BindMethodCall<ShutdownParams, ShutdownResult>(
      "shutdown", &LspServer::OnShutdown);
  BindNotification<ExitParams>("exit", &LspServer::OnExit);

  // Full sync only; there is no save or will-save handling
  BindNotification<DidOpenTextDocumentParams>(
      "textDocument/didOpen", &LspServer::OnDidOpenTextDocument);
  BindNotification<DidChangeTextDocumentParams>(
      "textDocument/didChange", &LspServer::OnDidChangeTextDocument);
  BindNotification<DidCloseTextDocumentParams>(
      "textDocument/didClose", &LspServer::OnDidCloseTextDocument);

  BindMethodCall<HoverParams, HoverResult>(
      "textDocument/hover", &LspServer::OnHover);
  BindMethodCall<CompletionParams, CompletionResult>(
      "textDocument/completion", &LspServer::OnCompletion);
}

}  // namespace lsp
