#pragma once

#include <optional>
#include <string_view>

#include <fmt/format.h>

namespace trilld {

// Languages this build knows how to serve
enum class LanguageKind {
  kSystemVerilog,
};

auto ParseLanguageKind(std::string_view name) -> std::optional<LanguageKind>;

auto ToString(LanguageKind kind) -> std::string_view;

}  // namespace trilld

template <>
struct fmt::formatter<trilld::LanguageKind> : fmt::formatter<std::string_view> {
  auto format(trilld::LanguageKind kind, fmt::format_context& ctx) const {
    return fmt::formatter<std::string_view>::format(trilld::ToString(kind), ctx);
  }
};
