#include "lsp/basic.hpp"

#include <stdexcept>

#include "lsp/json_utils.hpp"

namespace lsp {

void to_json(nlohmann::json& j, const WorkDoneProgressParams& p) {
  j = nlohmann::json::object();
  to_json_optional(j, "workDoneToken", p.workDoneToken);
}

void from_json(const nlohmann::json& j, WorkDoneProgressParams& p) {
  // Tokens may be integers on the wire
  if (j.contains("workDoneToken") && !j.at("workDoneToken").is_null()) {
    const auto& token = j.at("workDoneToken");
    p.workDoneToken =
        token.is_string() ? token.get<std::string>() : token.dump();
  }
}

void to_json(nlohmann::json& j, const PartialResultParams& p) {
  j = nlohmann::json::object();
  to_json_optional(j, "partialResultToken", p.partialResultToken);
}

void from_json(const nlohmann::json& j, PartialResultParams& p) {
  if (j.contains("partialResultToken") &&
      !j.at("partialResultToken").is_null()) {
    const auto& token = j.at("partialResultToken");
    p.partialResultToken =
        token.is_string() ? token.get<std::string>() : token.dump();
  }
}

// Position
void to_json(nlohmann::json& j, const Position& p) {
  j = nlohmann::json{{"line", p.line}, {"character", p.character}};
}

void from_json(const nlohmann::json& j, Position& p) {
  from_json_required(j, "line", p.line);
  from_json_required(j, "character", p.character);
}

void to_json(nlohmann::json& j, const PositionEncodingKind& p) {
  switch (p) {
    case PositionEncodingKind::kUtf8:
      j = "utf-8";
      break;
    case PositionEncodingKind::kUtf16:
      j = "utf-16";
      break;
    case PositionEncodingKind::kUtf32:
      j = "utf-32";
      break;
  }
}

void from_json(const nlohmann::json& j, PositionEncodingKind& p) {
  auto s = j.get<std::string>();
  if (s == "utf-8") {
    p = PositionEncodingKind::kUtf8;
  } else if (s == "utf-16") {
    p = PositionEncodingKind::kUtf16;
  } else if (s == "utf-32") {
    p = PositionEncodingKind::kUtf32;
  } else {
    throw std::runtime_error("Invalid position encoding kind: " + s);
  }
}

// Range
void to_json(nlohmann::json& j, const Range& r) {
  j = nlohmann::json{{"start", r.start}, {"end", r.end}};
}

void from_json(const nlohmann::json& j, Range& r) {
  from_json_required(j, "start", r.start);
  from_json_required(j, "end", r.end);
}

// Text Document Item
void to_json(nlohmann::json& j, const TextDocumentItem& t) {
  j = nlohmann::json{
      {"uri", t.uri},
      {"languageId", t.languageId},
      {"version", t.version},
      {"text", t.text}};
}

void from_json(const nlohmann::json& j, TextDocumentItem& t) {
  from_json_required(j, "uri", t.uri);
  from_json_required(j, "languageId", t.languageId);
  from_json_required(j, "version", t.version);
  from_json_required(j, "text", t.text);
}

// Text Document Identifier
void to_json(nlohmann::json& j, const TextDocumentIdentifier& t) {
  j = nlohmann::json{{"uri", t.uri}};
}

void from_json(const nlohmann::json& j, TextDocumentIdentifier& t) {
  from_json_required(j, "uri", t.uri);
}

void to_json(nlohmann::json& j, const VersionedTextDocumentIdentifier& v) {
  j = nlohmann::json{{"uri", v.uri}, {"version", v.version}};
}

void from_json(const nlohmann::json& j, VersionedTextDocumentIdentifier& v) {
  from_json_required(j, "uri", v.uri);
  from_json_required(j, "version", v.version);
}

// Text Document Position Params
void to_json(nlohmann::json& j, const TextDocumentPositionParams& t) {
  j = nlohmann::json{
      {"textDocument", t.textDocument}, {"position", t.position}};
}

void from_json(const nlohmann::json& j, TextDocumentPositionParams& t) {
  from_json_required(j, "textDocument", t.textDocument);
  from_json_required(j, "position", t.position);
}

// Diagnostic
void to_json(nlohmann::json& j, const DiagnosticSeverity& d) {
  j = static_cast<int>(d);
}

void from_json(const nlohmann::json& j, DiagnosticSeverity& d) {
  d = static_cast<DiagnosticSeverity>(j.get<int>());
}

void to_json(nlohmann::json& j, const Diagnostic& d) {
  j = nlohmann::json{};
  j["range"] = d.range;
  to_json_optional(j, "severity", d.severity);
  to_json_optional(j, "code", d.code);
  to_json_optional(j, "source", d.source);
  j["message"] = d.message;
}

void from_json(const nlohmann::json& j, Diagnostic& d) {
  from_json_required(j, "range", d.range);
  from_json_optional(j, "severity", d.severity);
  from_json_optional(j, "code", d.code);
  from_json_optional(j, "source", d.source);
  from_json_required(j, "message", d.message);
}

// Markup Content
void to_json(nlohmann::json& j, const MarkupKind& m) {
  switch (m) {
    case MarkupKind::kPlainText:
      j = "plaintext";
      break;
    case MarkupKind::kMarkdown:
      j = "markdown";
      break;
  }
}

void from_json(const nlohmann::json& j, MarkupKind& m) {
  auto s = j.get<std::string>();
  if (s == "plaintext") {
    m = MarkupKind::kPlainText;
  } else if (s == "markdown") {
    m = MarkupKind::kMarkdown;
  } else {
    throw std::runtime_error("Invalid markup kind: " + s);
  }
}

void to_json(nlohmann::json& j, const MarkupContent& m) {
  j = nlohmann::json{{"kind", m.kind}, {"value", m.value}};
}

void from_json(const nlohmann::json& j, MarkupContent& m) {
  from_json_required(j, "kind", m.kind);
  from_json_required(j, "value", m.value);
}

// Trace Value
void to_json(nlohmann::json& j, const TraceValue& t) {
  switch (t) {
    case TraceValue::kOff:
      j = "off";
      break;
    case TraceValue::kMessages:
      j = "messages";
      break;
    case TraceValue::kVerbose:
      j = "verbose";
      break;
  }
}

void from_json(const nlohmann::json& j, TraceValue& t) {
  auto s = j.get<std::string>();
  if (s == "off") {
    t = TraceValue::kOff;
  } else if (s == "messages") {
    t = TraceValue::kMessages;
  } else if (s == "verbose") {
    t = TraceValue::kVerbose;
  } else {
    throw std::runtime_error("Invalid trace value: " + s);
  }
}

// Workspace Folder
void to_json(nlohmann::json& j, const WorkspaceFolder& w) {
  j = nlohmann::json{{"uri", w.uri}, {"name", w.name}};
}

void from_json(const nlohmann::json& j, WorkspaceFolder& w) {
  from_json_required(j, "uri", w.uri);
  from_json_required(j, "name", w.name);
}

}  // namespace lsp
