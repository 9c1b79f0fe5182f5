#include <memory>
#include <string>
#include <vector>

#include <asio.hpp>
#include <jsonrpc/endpoint/endpoint.hpp>
#include <jsonrpc/transport/framed_pipe_transport.hpp>
#include <spdlog/spdlog.h>

#include "app/app_setup.hpp"
#include "app/crash_handler.hpp"
#include "trilld/core/trilld_config_file.hpp"
#include "trilld/core/trilld_lsp_server.hpp"
#include "trilld/language/language_factory.hpp"
#include "trilld/services/language_service.hpp"

using jsonrpc::endpoint::RpcEndpoint;
using jsonrpc::transport::FramedPipeTransport;
using trilld::TrilldConfigFile;
using trilld::TrilldLspServer;
using trilld::services::LanguageService;

auto main(int argc, char* argv[]) -> int {
  app::WaitForDebuggerIfRequested();
  app::InitializeCrashHandlers();

  const std::vector<std::string> args(argv, argv + argc);
  auto pipe_name_opt = app::ParsePipeName(args);
  if (!pipe_name_opt) {
    spdlog::error("Usage: <executable> --pipe=<pipe name> [--config=<path>]");
    return 1;
  }
  const std::string pipe_name = pipe_name_opt.value();

  auto loggers = app::SetupLoggers();
  auto logger = loggers["trilld"];

  // A missing or broken config falls back to the defaults
  auto config = TrilldConfigFile::CreateDefault(logger);
  if (auto config_path = app::ResolveConfigPath(args)) {
    if (auto loaded = TrilldConfigFile::LoadFromFile(*config_path, logger)) {
      config = std::move(*loaded);
    } else {
      logger->warn(
          "Using default configuration, could not load {}",
          config_path->string());
    }
  }

  auto language = trilld::CreateLanguage(config, logger);
  if (!language) {
    logger->error("Failed to create language: {}", language.error().Message());
    return 1;
  }

  asio::io_context io_context;
  auto executor = io_context.get_executor();

  auto transport = std::make_unique<FramedPipeTransport>(
      executor, pipe_name, false, loggers["transport"]);

  auto endpoint = std::make_unique<RpcEndpoint>(
      executor, std::move(transport), loggers["jsonrpc"]);

  auto language_service = std::make_shared<LanguageService>(
      executor, *language,
      trilld::services::LanguageServiceOptions{
          .encoding = config.GetPositionEncoding(),
          .close_policy = config.GetClosePolicy()},
      logger);
  auto server = std::make_unique<TrilldLspServer>(
      executor, std::move(endpoint), language_service,
      trilld::TrilldServerOptions{
          .encoding = config.GetPositionEncoding(),
          .load_from_disk = config.GetLoadFromDisk()},
      logger);

  asio::co_spawn(
      io_context,
      [&server]() -> asio::awaitable<void> {
        auto result = co_await server->Start();
        if (!result.has_value()) {
          spdlog::error("Server error: {}", result.error().Message());
        }
        co_return;
      },
      asio::detached);

  io_context.run();
  return 0;
}
