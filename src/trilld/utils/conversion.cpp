#include "trilld/utils/conversion.hpp"

namespace trilld::utils {

auto ToLspPosition(const SourcePosition& position) -> lsp::Position {
  return lsp::Position{.line = position.line, .character = position.column};
}

auto ToSourcePosition(const lsp::Position& position) -> SourcePosition {
  return SourcePosition{.line = position.line, .column = position.character};
}

auto ToLspRange(const SourceRange& range) -> lsp::Range {
  return lsp::Range{
      .start = ToLspPosition(range.start), .end = ToLspPosition(range.end)};
}

auto ToLspSeverity(Severity severity) -> lsp::DiagnosticSeverity {
  switch (severity) {
    case Severity::kError:
      return lsp::DiagnosticSeverity::kError;
    case Severity::kWarning:
      return lsp::DiagnosticSeverity::kWarning;
    case Severity::kInformation:
      return lsp::DiagnosticSeverity::kInformation;
    case Severity::kHint:
      return lsp::DiagnosticSeverity::kHint;
  }
  return lsp::DiagnosticSeverity::kError;
}

auto ToLspDiagnostic(const DiagnosticRecord& record) -> lsp::Diagnostic {
  return lsp::Diagnostic{
      .range = ToLspRange(record.range),
      .severity = ToLspSeverity(record.severity),
      .code = record.code,
      .source = kDiagnosticSource,
      .message = record.message};
}

auto ToLspDiagnostics(const std::vector<DiagnosticRecord>& records)
    -> std::vector<lsp::Diagnostic> {
  std::vector<lsp::Diagnostic> diagnostics;
  diagnostics.reserve(records.size());
  for (const auto& record : records) {
    diagnostics.push_back(ToLspDiagnostic(record));
  }
  return diagnostics;
}

auto ToLspCompletionItem(const CompletionCandidate& candidate)
    -> lsp::CompletionItem {
  lsp::CompletionItem item{
      .label = candidate.label,
      .kind = lsp::CompletionItemKind::kFunction,
      .detail = candidate.detail};

  if (candidate.documentation) {
    item.documentation = lsp::MarkupContent{
        .kind = lsp::MarkupKind::kMarkdown, .value = *candidate.documentation};
  }
  if (candidate.insert_text) {
    item.insertText = candidate.insert_text;
    item.insertTextFormat = lsp::InsertTextFormat::kSnippet;
  }
  return item;
}

auto ToLspHover(const RenderedDoc& doc) -> lsp::Hover {
  return lsp::Hover{
      .contents =
          lsp::MarkupContent{
              .kind = lsp::MarkupKind::kMarkdown, .value = doc.markdown},
      .range = ToLspRange(doc.range)};
}

auto ToPositionEncodingKind(PositionEncoding encoding)
    -> lsp::PositionEncodingKind {
  switch (encoding) {
    case PositionEncoding::kUtf8:
      return lsp::PositionEncodingKind::kUtf8;
    case PositionEncoding::kUtf16:
      return lsp::PositionEncodingKind::kUtf16;
  }
  return lsp::PositionEncodingKind::kUtf16;
}

auto NegotiatePositionEncoding(
    const std::optional<nlohmann::json>& client_capabilities,
    PositionEncoding preferred) -> PositionEncoding {
  if (preferred == PositionEncoding::kUtf16 || !client_capabilities) {
    return PositionEncoding::kUtf16;
  }

  const auto general = client_capabilities->find("general");
  if (general == client_capabilities->end() || !general->is_object()) {
    return PositionEncoding::kUtf16;
  }
  const auto offered = general->find("positionEncodings");
  if (offered == general->end() || !offered->is_array()) {
    return PositionEncoding::kUtf16;
  }

  for (const auto& name : *offered) {
    if (name.is_string() && name.get<std::string>() == ToString(preferred)) {
      return preferred;
    }
  }
  return PositionEncoding::kUtf16;
}

}  // namespace trilld::utils
