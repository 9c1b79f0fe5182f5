#include "trilld/language/language_kind.hpp"

#include <algorithm>
#include <cctype>
#include <string>

namespace trilld {

auto ParseLanguageKind(std::string_view name) -> std::optional<LanguageKind> {
  std::string lowered(name);
  std::ranges::transform(lowered, lowered.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });

  if (lowered == "systemverilog" || lowered == "sv") {
    return LanguageKind::kSystemVerilog;
  }
  return std::nullopt;
}

auto ToString(LanguageKind kind) -> std::string_view {
  switch (kind) {
    case LanguageKind::kSystemVerilog:
      return "systemverilog";
  }
  return "unknown";
}

}  // namespace trilld
