#pragma once

#include <expected>
#include <string>
#include <string_view>

#include <lsp/error.hpp>

namespace trilld::utils {

// Reads the whole file behind a file:// URI. Fails with kDocumentNotFound
// for other schemes and for files that can't be opened.
auto LoadDocumentText(std::string_view uri)
    -> std::expected<std::string, lsp::error::LspError>;

}  // namespace trilld::utils
