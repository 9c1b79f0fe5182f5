#include "trilld/features/completion_provider.hpp"

#include <fmt/format.h>

#include "trilld/core/token_extractor.hpp"

namespace trilld {

auto CompletionProvider::Run(std::string_view text, SourcePosition position)
    const -> std::vector<CompletionCandidate> {
  std::vector<CompletionCandidate> candidates;

  auto separator = language_->PathSeparator();
  auto token = ExtractToken(text, position, separator, encoding_);
  if (!token || !token->ns || token->ns->empty()) {
    return candidates;
  }

  std::string ns(*token->ns);
  for (auto& name : language_->Functions(ns)) {
    auto doc = language_->GetFunctionDoc(
        fmt::format("{}{}{}", ns, separator, name));

    CompletionCandidate candidate{.label = std::move(name)};
    if (doc) {
      candidate.detail = doc->signature.ToString();
      if (!doc->description.empty()) {
        candidate.documentation = doc->description;
      }
      candidate.insert_text = BuildSnippet(doc->signature);
    }
    candidates.push_back(std::move(candidate));
  }

  logger_->debug(
      "CompletionProvider: {} candidates for namespace '{}'",
      candidates.size(), ns);
  return candidates;
}

auto CompletionProvider::BuildSnippet(const FunctionSignature& signature)
    -> std::string {
  std::string snippet = EscapeSnippetText(signature.name);
  snippet += '(';
  for (std::size_t i = 0; i < signature.args.size(); ++i) {
    if (i > 0) {
      snippet += ", ";
    }
    snippet += fmt::format(
        "${{{}:{}}}", i + 1, EscapeSnippetText(signature.args[i]));
  }
  snippet += ')';
  return snippet;
}

auto CompletionProvider::EscapeSnippetText(std::string_view text)
    -> std::string {
  std::string escaped;
  escaped.reserve(text.size());
  for (char c : text) {
    if (c == '$' || c == '}' || c == '\\') {
      escaped += '\\';
    }
    escaped += c;
  }
  return escaped;
}

}  // namespace trilld
