#include "trilld/utils/file_loader.hpp"

#include <fstream>
#include <sstream>

#include <fmt/format.h>

#include "trilld/utils/uri.hpp"

namespace trilld::utils {

using lsp::error::LspError;
using lsp::error::LspErrorCode;

auto LoadDocumentText(std::string_view uri)
    -> std::expected<std::string, LspError> {
  if (!IsFileUri(uri)) {
    return LspError::UnexpectedFromCode(
        LspErrorCode::kDocumentNotFound,
        fmt::format("Not a file URI: {}", uri));
  }

  auto path = UriToPath(uri);
  std::ifstream file(path, std::ios::binary);
  if (!file) {
    return LspError::UnexpectedFromCode(
        LspErrorCode::kDocumentNotFound,
        fmt::format("Cannot open file: {}", path));
  }

  std::ostringstream buffer;
  buffer << file.rdbuf();
  return buffer.str();
}

}  // namespace trilld::utils
