#include "trilld/language/language_factory.hpp"

#include "trilld/language/function_catalog.hpp"
#include "trilld/language/systemverilog_language.hpp"
#include "trilld/utils/compilation_options.hpp"

namespace trilld {

using lsp::error::LspError;
using lsp::error::LspErrorCode;

namespace {

auto CreateSystemVerilogLanguage(
    const TrilldConfigFile& config, std::shared_ptr<spdlog::logger> logger)
    -> std::shared_ptr<const Language> {
  auto options = utils::CreateCompilationOptions(
      config.GetIncludeDirs(), config.GetDefines());
  auto catalog =
      FunctionCatalog::BuildFromFiles(config.GetLibraries(), options, logger);
  return std::make_shared<const SystemVerilogLanguage>(
      std::move(catalog), std::move(options), config.GetLibraries(), logger);
}

}  // namespace

auto CreateLanguage(
    const TrilldConfigFile& config, std::shared_ptr<spdlog::logger> logger)
    -> std::expected<std::shared_ptr<const Language>, LspError> {
  if (!logger) {
    logger = spdlog::default_logger();
  }

  switch (config.GetLanguage()) {
    case LanguageKind::kSystemVerilog:
      logger->debug("Creating language: {}", config.GetLanguage());
      return CreateSystemVerilogLanguage(config, logger);
  }

  return LspError::UnexpectedFromCode(
      LspErrorCode::kInvalidConfiguration,
      fmt::format(
          "Unsupported language: {}",
          static_cast<int>(config.GetLanguage())));
}

}  // namespace trilld
