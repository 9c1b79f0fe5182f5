#pragma once

#include <expected>
#include <memory>

#include <lsp/error.hpp>
#include <spdlog/spdlog.h>

#include "trilld/core/trilld_config_file.hpp"
#include "trilld/language/language.hpp"

namespace trilld {

// Builds the Language selected by `config`, including any catalog of library
// functions it needs. Runs once at startup.
auto CreateLanguage(
    const TrilldConfigFile& config,
    std::shared_ptr<spdlog::logger> logger = nullptr)
    -> std::expected<std::shared_ptr<const Language>, lsp::error::LspError>;

}  // namespace trilld
