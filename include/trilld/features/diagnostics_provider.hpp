#pragma once

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "trilld/core/feature_types.hpp"
#include "trilld/features/language_feature_provider.hpp"

namespace trilld {

class DiagnosticsProvider : public LanguageFeatureProvider {
 public:
  using LanguageFeatureProvider::LanguageFeatureProvider;

  // Parse errors for `text`, in the order the language reports them
  [[nodiscard]] auto Run(std::string_view text) const
      -> std::vector<DiagnosticRecord>;

  // "<callout>, Note: <hint>", or just the callout
  static auto FormatMessage(
      std::string_view callout, const std::optional<std::string>& hint)
      -> std::string;

  // 1-based line and byte column -> 0-based position in `encoding`. Locations
  // past the end of the text clamp to its end.
  static auto ToSourcePosition(
      std::string_view text, NativeLocation location,
      PositionEncoding encoding) -> SourcePosition;
};

}  // namespace trilld
