#include "trilld/core/position_mapper.hpp"

#include <algorithm>

namespace trilld {

namespace {

// Length of the UTF-8 sequence introduced by `lead`. Stray continuation
// bytes and invalid leads count as a single byte.
auto SequenceLength(unsigned char lead) -> std::size_t {
  if (lead < 0x80) {
    return 1;
  }
  if ((lead & 0xE0) == 0xC0) {
    return 2;
  }
  if ((lead & 0xF0) == 0xE0) {
    return 3;
  }
  if ((lead & 0xF8) == 0xF0) {
    return 4;
  }
  return 1;
}

auto UnitsFor(std::size_t sequence_length, PositionEncoding encoding) -> int {
  if (encoding == PositionEncoding::kUtf8) {
    return static_cast<int>(sequence_length);
  }
  // Only code points above the BMP need a surrogate pair
  return sequence_length == 4 ? 2 : 1;
}

// Steps over the character at `offset` without crossing `limit`
auto NextBoundary(std::string_view text, std::size_t offset, std::size_t limit)
    -> std::size_t {
  auto length = SequenceLength(static_cast<unsigned char>(text[offset]));
  return std::min(offset + length, limit);
}

auto LineContentEnd(std::string_view text, std::size_t line_start)
    -> std::size_t {
  auto newline = text.find('\n', line_start);
  if (newline == std::string_view::npos) {
    return text.size();
  }
  if (newline > line_start && text[newline - 1] == '\r') {
    return newline - 1;
  }
  return newline;
}

}  // namespace

auto ParsePositionEncoding(std::string_view name)
    -> std::optional<PositionEncoding> {
  if (name == "utf-8" || name == "utf8") {
    return PositionEncoding::kUtf8;
  }
  if (name == "utf-16" || name == "utf16") {
    return PositionEncoding::kUtf16;
  }
  return std::nullopt;
}

auto ToString(PositionEncoding encoding) -> std::string_view {
  switch (encoding) {
    case PositionEncoding::kUtf8:
      return "utf-8";
    case PositionEncoding::kUtf16:
      return "utf-16";
  }
  return "utf-16";
}

auto ToOffset(
    std::string_view text, SourcePosition position, PositionEncoding encoding)
    -> std::optional<std::size_t> {
  if (position.line < 0 || position.column < 0) {
    return std::nullopt;
  }

  std::size_t line_start = 0;
  for (int line = 0; line < position.line; ++line) {
    auto newline = text.find('\n', line_start);
    if (newline == std::string_view::npos) {
      return std::nullopt;
    }
    line_start = newline + 1;
  }

  const auto line_end = LineContentEnd(text, line_start);
  auto offset = line_start;
  int units = 0;
  while (offset < line_end) {
    auto next = NextBoundary(text, offset, line_end);
    auto width = UnitsFor(next - offset, encoding);
    if (units + width > position.column) {
      break;
    }
    units += width;
    offset = next;
  }
  return offset;
}

auto ToPosition(
    std::string_view text, std::size_t offset, PositionEncoding encoding)
    -> SourcePosition {
  offset = std::min(offset, text.size());

  SourcePosition position;
  std::size_t line_start = 0;
  for (std::size_t i = 0; i < offset; ++i) {
    if (text[i] == '\n') {
      ++position.line;
      line_start = i + 1;
    }
  }

  if (encoding == PositionEncoding::kUtf8) {
    position.column = static_cast<int>(offset - line_start);
    return position;
  }

  auto cursor = line_start;
  while (cursor < offset) {
    auto next = NextBoundary(text, cursor, offset);
    position.column += UnitsFor(next - cursor, encoding);
    cursor = next;
  }
  return position;
}

}  // namespace trilld
