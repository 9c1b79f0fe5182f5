#include "lsp/window.hpp"

#include "lsp/json_utils.hpp"

namespace lsp {

void to_json(nlohmann::json& j, const MessageType& t) {
  j = static_cast<int>(t);
}

void from_json(const nlohmann::json& j, MessageType& t) {
  t = static_cast<MessageType>(j.get<int>());
}

// LogMessage Notification
void to_json(nlohmann::json& j, const LogMessageParams& p) {
  j = nlohmann::json{{"type", p.type}, {"message", p.message}};
}

void from_json(const nlohmann::json& j, LogMessageParams& p) {
  from_json_required(j, "type", p.type);
  from_json_required(j, "message", p.message);
}

}  // namespace lsp
