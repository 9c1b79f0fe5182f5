#pragma once

#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "trilld/core/feature_types.hpp"
#include "trilld/features/language_feature_provider.hpp"

namespace trilld {

// Member completion after a namespace path, e.g. "math_pkg::" or
// "math_pkg::ad". Candidates come back unranked and unfiltered; the client
// matches them against what has been typed.
class CompletionProvider : public LanguageFeatureProvider {
 public:
  using LanguageFeatureProvider::LanguageFeatureProvider;

  [[nodiscard]] auto Run(std::string_view text, SourcePosition position) const
      -> std::vector<CompletionCandidate>;

  // "name(${1:a}, ${2:b})"
  static auto BuildSnippet(const FunctionSignature& signature) -> std::string;

  // Escapes the characters that are special inside a placeholder
  static auto EscapeSnippetText(std::string_view text) -> std::string;
};

}  // namespace trilld
