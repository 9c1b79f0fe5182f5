#include "lsp/server_capabilities.hpp"

#include "lsp/json_utils.hpp"

namespace lsp {

void to_json(nlohmann::json& j, const TextDocumentSyncKind& o) {
  j = static_cast<int>(o);
}

void from_json(const nlohmann::json& j, TextDocumentSyncKind& o) {
  o = static_cast<TextDocumentSyncKind>(j.get<int>());
}

void to_json(nlohmann::json& j, const TextDocumentSyncOptions& o) {
  j = nlohmann::json::object();
  to_json_optional(j, "openClose", o.openClose);
  to_json_optional(j, "change", o.change);
}

void from_json(const nlohmann::json& j, TextDocumentSyncOptions& o) {
  from_json_optional(j, "openClose", o.openClose);
  from_json_optional(j, "change", o.change);
}

void to_json(nlohmann::json& j, const CompletionOptions& o) {
  j = nlohmann::json::object();
  to_json_optional(j, "triggerCharacters", o.triggerCharacters);
  to_json_optional(j, "resolveProvider", o.resolveProvider);
}

void from_json(const nlohmann::json& j, CompletionOptions& o) {
  from_json_optional(j, "triggerCharacters", o.triggerCharacters);
  from_json_optional(j, "resolveProvider", o.resolveProvider);
}

void to_json(nlohmann::json& j, const HoverOptions& o) {
  j = nlohmann::json::object();
  to_json_optional(j, "workDoneProgress", o.workDoneProgress);
}

void from_json(const nlohmann::json& j, HoverOptions& o) {
  from_json_optional(j, "workDoneProgress", o.workDoneProgress);
}

void to_json(nlohmann::json& j, const WorkspaceFoldersServerCapabilities& o) {
  j = nlohmann::json::object();
  to_json_optional(j, "supported", o.supported);
  to_json_optional(j, "changeNotifications", o.changeNotifications);
}

void from_json(const nlohmann::json& j, WorkspaceFoldersServerCapabilities& o) {
  from_json_optional(j, "supported", o.supported);
  // changeNotifications may also be a registration id string
  if (j.contains("changeNotifications") &&
      j.at("changeNotifications").is_boolean()) {
    o.changeNotifications = j.at("changeNotifications").get<bool>();
  }
}

void to_json(nlohmann::json& j, const ServerCapabilities::TextDocumentSync& o) {
  std::visit([&j](const auto& arg) { j = arg; }, o);
}

void from_json(
    const nlohmann::json& j, ServerCapabilities::TextDocumentSync& o) {
  if (j.is_object()) {
    o = j.get<TextDocumentSyncOptions>();
  } else {
    o = j.get<TextDocumentSyncKind>();
  }
}

void to_json(nlohmann::json& j, const ServerCapabilities::HoverProvider& o) {
  std::visit([&j](const auto& arg) { j = arg; }, o);
}

void from_json(const nlohmann::json& j, ServerCapabilities::HoverProvider& o) {
  if (j.is_boolean()) {
    o = j.get<bool>();
  } else {
    o = j.get<HoverOptions>();
  }
}

void to_json(nlohmann::json& j, const ServerCapabilities::Workspace& o) {
  j = nlohmann::json::object();
  to_json_optional(j, "workspaceFolders", o.workspaceFolders);
}

void from_json(const nlohmann::json& j, ServerCapabilities::Workspace& o) {
  from_json_optional(j, "workspaceFolders", o.workspaceFolders);
}

void to_json(nlohmann::json& j, const ServerCapabilities& o) {
  j = nlohmann::json::object();
  to_json_optional(j, "positionEncoding", o.positionEncoding);
  to_json_optional(j, "textDocumentSync", o.textDocumentSync);
  to_json_optional(j, "completionProvider", o.completionProvider);
  to_json_optional(j, "hoverProvider", o.hoverProvider);
  to_json_optional(j, "workspace", o.workspace);
}

void from_json(const nlohmann::json& j, ServerCapabilities& o) {
  from_json_optional(j, "positionEncoding", o.positionEncoding);
  from_json_optional(j, "textDocumentSync", o.textDocumentSync);
  from_json_optional(j, "completionProvider", o.completionProvider);
  from_json_optional(j, "hoverProvider", o.hoverProvider);
  from_json_optional(j, "workspace", o.workspace);
}

}  // namespace lsp
