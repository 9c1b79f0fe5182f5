#pragma once

#include <optional>
#include <string_view>

#include "trilld/core/feature_types.hpp"
#include "trilld/features/language_feature_provider.hpp"

namespace trilld {

// Documentation for the qualified name under the cursor
class HoverProvider : public LanguageFeatureProvider {
 public:
  using LanguageFeatureProvider::LanguageFeatureProvider;

  [[nodiscard]] auto Run(std::string_view text, SourcePosition position) const
      -> std::optional<RenderedDoc>;
};

}  // namespace trilld
