#include "lsp/document_features.hpp"

#include "lsp/json_utils.hpp"

namespace lsp {

// Hover Request
void to_json(nlohmann::json& j, const HoverParams& p) {
  j = nlohmann::json{
      {"textDocument", p.textDocument}, {"position", p.position}};
  to_json_optional(j, "workDoneToken", p.workDoneToken);
}

void from_json(const nlohmann::json& j, HoverParams& p) {
  from_json(j, static_cast<TextDocumentPositionParams&>(p));
  from_json(j, static_cast<WorkDoneProgressParams&>(p));
}

void to_json(nlohmann::json& j, const Hover& h) {
  j = nlohmann::json{{"contents", h.contents}};
  to_json_optional(j, "range", h.range);
}

void from_json(const nlohmann::json& j, Hover& h) {
  from_json_required(j, "contents", h.contents);
  from_json_optional(j, "range", h.range);
}

void to_json(nlohmann::json& j, const HoverResult& r) {
  if (r.has_value()) {
    to_json(j, *r);
  } else {
    j = nullptr;
  }
}

void from_json(const nlohmann::json& j, HoverResult& r) {
  if (j.is_null()) {
    r = std::nullopt;
  } else {
    r = j.get<Hover>();
  }
}

// Completion Request
void to_json(nlohmann::json& j, const CompletionTriggerKind& k) {
  j = static_cast<int>(k);
}

void from_json(const nlohmann::json& j, CompletionTriggerKind& k) {
  k = static_cast<CompletionTriggerKind>(j.get<int>());
}

void to_json(nlohmann::json& j, const CompletionContext& c) {
  j = nlohmann::json{{"triggerKind", c.triggerKind}};
  to_json_optional(j, "triggerCharacter", c.triggerCharacter);
}

void from_json(const nlohmann::json& j, CompletionContext& c) {
  from_json_required(j, "triggerKind", c.triggerKind);
  from_json_optional(j, "triggerCharacter", c.triggerCharacter);
}

void to_json(nlohmann::json& j, const CompletionParams& p) {
  j = nlohmann::json{
      {"textDocument", p.textDocument}, {"position", p.position}};
  to_json_optional(j, "workDoneToken", p.workDoneToken);
  to_json_optional(j, "partialResultToken", p.partialResultToken);
  to_json_optional(j, "context", p.context);
}

void from_json(const nlohmann::json& j, CompletionParams& p) {
  from_json(j, static_cast<TextDocumentPositionParams&>(p));
  from_json(j, static_cast<WorkDoneProgressParams&>(p));
  from_json(j, static_cast<PartialResultParams&>(p));
  from_json_optional(j, "context", p.context);
}

void to_json(nlohmann::json& j, const InsertTextFormat& f) {
  j = static_cast<int>(f);
}

void from_json(const nlohmann::json& j, InsertTextFormat& f) {
  f = static_cast<InsertTextFormat>(j.get<int>());
}

void to_json(nlohmann::json& j, const CompletionItemKind& k) {
  j = static_cast<int>(k);
}

void from_json(const nlohmann::json& j, CompletionItemKind& k) {
  k = static_cast<CompletionItemKind>(j.get<int>());
}

void to_json(nlohmann::json& j, const CompletionItem& c) {
  j = nlohmann::json{{"label", c.label}};
  to_json_optional(j, "kind", c.kind);
  to_json_optional(j, "detail", c.detail);
  to_json_optional(j, "documentation", c.documentation);
  to_json_optional(j, "sortText", c.sortText);
  to_json_optional(j, "filterText", c.filterText);
  to_json_optional(j, "insertText", c.insertText);
  to_json_optional(j, "insertTextFormat", c.insertTextFormat);
}

void from_json(const nlohmann::json& j, CompletionItem& c) {
  from_json_required(j, "label", c.label);
  from_json_optional(j, "kind", c.kind);
  from_json_optional(j, "detail", c.detail);
  // Plain string documentation is promoted to plaintext markup
  if (j.contains("documentation") && j.at("documentation").is_string()) {
    c.documentation = MarkupContent{
        .kind = MarkupKind::kPlainText,
        .value = j.at("documentation").get<std::string>()};
  } else {
    from_json_optional(j, "documentation", c.documentation);
  }
  from_json_optional(j, "sortText", c.sortText);
  from_json_optional(j, "filterText", c.filterText);
  from_json_optional(j, "insertText", c.insertText);
  from_json_optional(j, "insertTextFormat", c.insertTextFormat);
}

void to_json(nlohmann::json& j, const CompletionList& c) {
  j = nlohmann::json{{"isIncomplete", c.isIncomplete}, {"items", c.items}};
}

void from_json(const nlohmann::json& j, CompletionList& c) {
  from_json_required(j, "isIncomplete", c.isIncomplete);
  from_json_required(j, "items", c.items);
}

void to_json(nlohmann::json& j, const CompletionResult& r) {
  std::visit([&j](const auto& result) { j = result; }, r);
}

void from_json(const nlohmann::json& j, CompletionResult& r) {
  if (j.is_array()) {
    r = j.get<std::vector<CompletionItem>>();
  } else {
    r = j.get<CompletionList>();
  }
}

}  // namespace lsp
