#include "lsp/lifecycle.hpp"

#include <nlohmann/json.hpp>

#include "lsp/json_utils.hpp"

namespace lsp {

// Initialize Request
void to_json(nlohmann::json& j, const InitializeParams::ClientInfo& p) {
  j = nlohmann::json{{"name", p.name}};
  to_json_optional(j, "version", p.version);
}

void from_json(const nlohmann::json& j, InitializeParams::ClientInfo& p) {
  from_json_required(j, "name", p.name);
  from_json_optional(j, "version", p.version);
}

void to_json(nlohmann::json& j, const InitializeParams& p) {
  j = nlohmann::json::object();
  to_json_optional(j, "workDoneToken", p.workDoneToken);
  to_json_optional(j, "processId", p.processId);
  to_json_optional(j, "clientInfo", p.clientInfo);
  to_json_optional(j, "locale", p.locale);
  to_json_optional(j, "rootPath", p.rootPath);
  to_json_optional(j, "rootUri", p.rootUri);
  to_json_optional(j, "initializationOptions", p.initializationOptions);
  to_json_optional(j, "capabilities", p.capabilities);
  to_json_optional(j, "trace", p.trace);
  to_json_optional(j, "workspaceFolders", p.workspaceFolders);
}

void from_json(const nlohmann::json& j, InitializeParams& p) {
  from_json(j, static_cast<WorkDoneProgressParams&>(p));
  from_json_optional(j, "processId", p.processId);
  from_json_optional(j, "clientInfo", p.clientInfo);
  from_json_optional(j, "locale", p.locale);
  from_json_optional(j, "rootPath", p.rootPath);
  from_json_optional(j, "rootUri", p.rootUri);
  from_json_optional(j, "initializationOptions", p.initializationOptions);
  from_json_optional(j, "capabilities", p.capabilities);
  from_json_optional(j, "trace", p.trace);
  from_json_optional(j, "workspaceFolders", p.workspaceFolders);
}

void to_json(nlohmann::json& j, const InitializeResult::ServerInfo& p) {
  j = nlohmann::json{{"name", p.name}};
  to_json_optional(j, "version", p.version);
}

void from_json(const nlohmann::json& j, InitializeResult::ServerInfo& p) {
  from_json_required(j, "name", p.name);
  from_json_optional(j, "version", p.version);
}

void to_json(nlohmann::json& j, const InitializeResult& p) {
  j = nlohmann::json{{"capabilities", p.capabilities}};
  to_json_optional(j, "serverInfo", p.serverInfo);
}

void from_json(const nlohmann::json& j, InitializeResult& p) {
  from_json_required(j, "capabilities", p.capabilities);
  from_json_optional(j, "serverInfo", p.serverInfo);
}

// Initialized Notification
void to_json(nlohmann::json& j, const InitializedParams& /*p*/) {
  j = nlohmann::json::object();
}

void from_json(const nlohmann::json& /*j*/, InitializedParams& /*p*/) {
}

// SetTrace Notification
void to_json(nlohmann::json& j, const SetTraceParams& p) {
  j = nlohmann::json{{"value", p.value}};
}

void from_json(const nlohmann::json& j, SetTraceParams& p) {
  from_json_required(j, "value", p.value);
}

// Shutdown Request
void to_json(nlohmann::json& j, const ShutdownParams& /*p*/) {
  j = nullptr;
}

void from_json(const nlohmann::json& /*j*/, ShutdownParams& /*p*/) {
}

void to_json(nlohmann::json& j, const ShutdownResult& /*p*/) {
  j = nullptr;
}

void from_json(const nlohmann::json& /*j*/, ShutdownResult& /*p*/) {
}

// Exit Notification
void to_json(nlohmann::json& j, const ExitParams& /*p*/) {
  j = nullptr;
}

void from_json(const nlohmann::json& /*j*/, ExitParams& /*p*/) {
}

}  // namespace lsp
