#include "lsp/document_sync.hpp"

#include "lsp/json_utils.hpp"

namespace lsp {

// DidOpenTextDocument Notification
void to_json(nlohmann::json& j, const DidOpenTextDocumentParams& p) {
  j = nlohmann::json{{"textDocument", p.textDocument}};
}

void from_json(const nlohmann::json& j, DidOpenTextDocumentParams& p) {
  from_json_required(j, "textDocument", p.textDocument);
}

// DidChangeTextDocument Notification
void to_json(
    nlohmann::json& j, const TextDocumentContentPartialChangeEvent& e) {
  j = nlohmann::json{{"range", e.range}, {"text", e.text}};
  to_json_optional(j, "rangeLength", e.rangeLength);
}

void from_json(
    const nlohmann::json& j, TextDocumentContentPartialChangeEvent& e) {
  from_json_required(j, "range", e.range);
  from_json_optional(j, "rangeLength", e.rangeLength);
  from_json_required(j, "text", e.text);
}

void to_json(nlohmann::json& j, const TextDocumentContentFullChangeEvent& e) {
  j = nlohmann::json{{"text", e.text}};
}

void from_json(const nlohmann::json& j, TextDocumentContentFullChangeEvent& e) {
  from_json_required(j, "text", e.text);
}

void to_json(nlohmann::json& j, const TextDocumentContentChangeEvent& e) {
  std::visit([&j](const auto& event) { to_json(j, event); }, e);
}

void from_json(const nlohmann::json& j, TextDocumentContentChangeEvent& e) {
  // A full-content event is the one without a range
  if (j.contains("range")) {
    e = j.get<TextDocumentContentPartialChangeEvent>();
  } else {
    e = j.get<TextDocumentContentFullChangeEvent>();
  }
}

void to_json(nlohmann::json& j, const DidChangeTextDocumentParams& p) {
  j = nlohmann::json{
      {"textDocument", p.textDocument}, {"contentChanges", p.contentChanges}};
}

void from_json(const nlohmann::json& j, DidChangeTextDocumentParams& p) {
  from_json_required(j, "textDocument", p.textDocument);
  from_json_required(j, "contentChanges", p.contentChanges);
}

// DidCloseTextDocument Notification
void to_json(nlohmann::json& j, const DidCloseTextDocumentParams& p) {
  j = nlohmann::json{{"textDocument", p.textDocument}};
}

void from_json(const nlohmann::json& j, DidCloseTextDocumentParams& p) {
  from_json_required(j, "textDocument", p.textDocument);
}

}  // namespace lsp
