#pragma once

#include <cstddef>
#include <optional>
#include <string_view>

#include "trilld/core/position_mapper.hpp"

namespace trilld {

// Identifier or qualified path ending at the cursor. All views alias the
// text passed to ExtractToken and share its lifetime.
struct Token {
  // Raw token, separators included
  std::string_view text;
  // Everything before the last separator; empty for "::name", absent when
  // the token has no separator at all
  std::optional<std::string_view> ns;
  // Everything after the last separator, or the whole token
  std::string_view member;
  // Byte offsets of the token in the source text, end is the cursor
  std::size_t start{};
  std::size_t end{};

  [[nodiscard]] auto IsQualified() const -> bool {
    return ns.has_value();
  }
};

// Scans backward from `offset` over alphanumerics, '_' and whole occurrences
// of `separator`. Nothing after the cursor is examined. Returns nullopt when
// the character before the cursor is not part of a token.
auto ExtractTokenAt(
    std::string_view text, std::size_t offset, std::string_view separator)
    -> std::optional<Token>;

auto ExtractToken(
    std::string_view text, SourcePosition position, std::string_view separator,
    PositionEncoding encoding) -> std::optional<Token>;

}  // namespace trilld
