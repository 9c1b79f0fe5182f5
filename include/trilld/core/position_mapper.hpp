#pragma once

#include <cstddef>
#include <optional>
#include <string_view>

namespace trilld {

// Unit in which callers count columns. Offsets are always UTF-8 bytes.
enum class PositionEncoding {
  kUtf8,
  kUtf16,
};

auto ParsePositionEncoding(std::string_view name)
    -> std::optional<PositionEncoding>;

auto ToString(PositionEncoding encoding) -> std::string_view;

// Zero-based line and column
struct SourcePosition {
  int line{};
  int column{};

  auto operator==(const SourcePosition&) const -> bool = default;
};

struct SourceRange {
  SourcePosition start;
  SourcePosition end;

  auto operator==(const SourceRange&) const -> bool = default;
};

// Returns the byte offset for `position`, or nullopt when the line lies past
// the end of the text. A column past the end of its line clamps to the line
// end (before any "\r\n"). A column that falls inside a multi-unit character
// resolves to the start of that character.
auto ToOffset(
    std::string_view text, SourcePosition position, PositionEncoding encoding)
    -> std::optional<std::size_t>;

// Inverse of ToOffset. Offsets past the end of the text clamp to its end.
auto ToPosition(
    std::string_view text, std::size_t offset, PositionEncoding encoding)
    -> SourcePosition;

}  // namespace trilld
