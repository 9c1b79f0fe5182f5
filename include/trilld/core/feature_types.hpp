#pragma once

#include <optional>
#include <string>

#include "trilld/core/position_mapper.hpp"

namespace trilld {

enum class Severity {
  kError,
  kWarning,
  kInformation,
  kHint,
};

struct DiagnosticRecord {
  SourceRange range;
  std::string message;
  Severity severity{Severity::kError};
  std::optional<std::string> hint;
  std::optional<std::string> code;
};

struct CompletionCandidate {
  std::string label;
  std::optional<std::string> detail;
  // Markdown
  std::optional<std::string> documentation;
  // Snippet syntax, e.g. "add(${1:a}, ${2:b})"
  std::optional<std::string> insert_text;
};

struct RenderedDoc {
  std::string markdown;
  SourceRange range;
};

}  // namespace trilld
