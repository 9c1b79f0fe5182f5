#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "trilld/core/feature_types.hpp"

namespace trilld {

// A location as the language reports it: 1-based line, 1-based byte column
struct NativeLocation {
  int line{1};
  int column{1};

  auto operator==(const NativeLocation&) const -> bool = default;
};

struct RawError {
  NativeLocation start;
  NativeLocation end;
  std::string callout;
  Severity level{Severity::kError};
  std::optional<std::string> hint;
  std::optional<std::string> code;
};

struct FunctionSignature {
  std::string name;
  std::vector<std::string> args;

  // "name(a, b)"
  [[nodiscard]] auto ToString() const -> std::string;

  auto operator==(const FunctionSignature&) const -> bool = default;
};

struct FunctionDoc {
  FunctionSignature signature;
  // Markdown, possibly empty
  std::string description;

  // Fenced code block with the signature, followed by the description
  [[nodiscard]] auto ToMarkdown(std::string_view fence_language = "") const
      -> std::string;
};

// Everything the feature pipelines need to know about a source language.
// Implementations must be safe for concurrent calls on a const instance.
class Language {
 public:
  Language() = default;
  Language(const Language&) = delete;
  Language(Language&&) = delete;
  auto operator=(const Language&) -> Language& = delete;
  auto operator=(Language&&) -> Language& = delete;
  virtual ~Language() = default;

  // Identifier such as "systemverilog", also used as the fence language
  [[nodiscard]] virtual auto Name() const -> std::string_view = 0;

  // Separator between a namespace and its members
  [[nodiscard]] virtual auto PathSeparator() const -> std::string_view {
    return "::";
  }

  // Returns nullopt when there is nothing to parse (empty or whitespace-only
  // text). Malformed input yields errors, never an exception.
  [[nodiscard]] virtual auto ParseErrors(std::string_view text) const
      -> std::optional<std::vector<RawError>> = 0;

  // Member names of `ns` in declaration order; empty when `ns` is unknown
  [[nodiscard]] virtual auto Functions(std::string_view ns) const
      -> std::vector<std::string> = 0;

  // Exact lookup of a fully qualified name such as "math_pkg::add"
  [[nodiscard]] virtual auto GetFunctionDoc(std::string_view qualified) const
      -> std::optional<FunctionDoc> = 0;
};

}  // namespace trilld
