#pragma once

#include <string>

#include <nlohmann/json.hpp>

namespace lsp {

enum class MessageType {
  kError = 1,
  kWarning = 2,
  kInfo = 3,
  kLog = 4,
  kDebug = 5,
};

void to_json(nlohmann::json& j, const MessageType& t);
void from_json(const nlohmann::json& j, MessageType& t);

// LogMessage Notification
struct LogMessageParams {
  MessageType type{MessageType::kLog};
  std::string message;
};

void to_json(nlohmann::json& j, const LogMessageParams& p);
void from_json(const nlohmann::json& j, LogMessageParams& p);

// ShowMessage Notification
using ShowMessageParams = LogMessageParams;

}  // namespace lsp
