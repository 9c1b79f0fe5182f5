#include "trilld/core/token_extractor.hpp"

#include <algorithm>

namespace trilld {

namespace {

auto IsIdentifierChar(char c) -> bool {
  return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
         (c >= '0' && c <= '9') || c == '_';
}

auto EndsWithSeparator(
    std::string_view text, std::size_t end, std::string_view separator)
    -> bool {
  if (separator.empty() || end < separator.size()) {
    return false;
  }
  return text.substr(end - separator.size(), separator.size()) == separator;
}

}  // namespace

auto ExtractTokenAt(
    std::string_view text, std::size_t offset, std::string_view separator)
    -> std::optional<Token> {
  offset = std::min(offset, text.size());

  auto start = offset;
  while (start > 0) {
    if (IsIdentifierChar(text[start - 1])) {
      --start;
    } else if (EndsWithSeparator(text, start, separator)) {
      start -= separator.size();
    } else {
      break;
    }
  }

  if (start == offset) {
    return std::nullopt;
  }

  Token token{
      .text = text.substr(start, offset - start), .start = start, .end = offset};

  auto split = separator.empty() ? std::string_view::npos
                                 : token.text.rfind(separator);
  if (split == std::string_view::npos) {
    token.member = token.text;
  } else {
    token.ns = token.text.substr(0, split);
    token.member = token.text.substr(split + separator.size());
  }
  return token;
}

auto ExtractToken(
    std::string_view text, SourcePosition position, std::string_view separator,
    PositionEncoding encoding) -> std::optional<Token> {
  auto offset = ToOffset(text, position, encoding);
  if (!offset) {
    return std::nullopt;
  }
  return ExtractTokenAt(text, *offset, separator);
}

}  // namespace trilld
