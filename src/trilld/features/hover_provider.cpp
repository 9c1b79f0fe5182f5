#include "trilld/features/hover_provider.hpp"

#include "trilld/core/token_extractor.hpp"

namespace trilld {

auto HoverProvider::Run(std::string_view text, SourcePosition position) const
    -> std::optional<RenderedDoc> {
  auto separator = language_->PathSeparator();
  auto token = ExtractToken(text, position, separator, encoding_);
  if (!token || token->text.find(separator) == std::string_view::npos) {
    return std::nullopt;
  }

  auto doc = language_->GetFunctionDoc(token->text);
  if (!doc) {
    logger_->debug("HoverProvider: no documentation for '{}'", token->text);
    return std::nullopt;
  }

  return RenderedDoc{
      .markdown = doc->ToMarkdown(language_->Name()),
      .range = SourceRange{
          .start = ToPosition(text, token->start, encoding_),
          .end = ToPosition(text, token->end, encoding_)}};
}

}  // namespace trilld
