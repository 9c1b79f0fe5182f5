#include "lsp/diagnostic.hpp"

#include "lsp/json_utils.hpp"

namespace lsp {

// PublishDiagnostics Notification
void to_json(nlohmann::json& j, const PublishDiagnosticsParams& p) {
  j = nlohmann::json::object();
  to_json_required(j, "uri", p.uri);
  to_json_optional(j, "version", p.version);
  to_json_required(j, "diagnostics", p.diagnostics);
}

void from_json(const nlohmann::json& j, PublishDiagnosticsParams& p) {
  from_json_required(j, "uri", p.uri);
  from_json_optional(j, "version", p.version);
  from_json_required(j, "diagnostics", p.diagnostics);
}

}  // namespace lsp
