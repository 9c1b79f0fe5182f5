#pragma once

#include <array>
#include <expected>
#include <string>
#include <string_view>
#include <utility>

#include <jsonrpc/error/error.hpp>
#include <nlohmann/json.hpp>

namespace lsp::error {

using RpcError = jsonrpc::error::RpcError;
using RpcErrorCode = jsonrpc::error::RpcErrorCode;

enum class LspErrorCode {
  kParseError,
  kInvalidRequest,
  kMethodNotFound,
  kInvalidParams,
  kInternalError,
  kServerError,
  kTransportError,
  kTimeoutError,
  kClientError,
  kMethodNotImplemented,
  kDocumentNotFound,
  kInvalidConfiguration,
  kUnknownError,
};

// JSON-RPC reserves -32768..-32000; LSP adds -32803 (RequestFailed) and
// -32001 (UnknownErrorCode)
struct ErrorCodeInfo {
  LspErrorCode code;
  int wire_code;
  std::string_view message;
};

inline constexpr std::array kErrorCodes = {
    ErrorCodeInfo{LspErrorCode::kParseError, -32700, "Parse error"},
    ErrorCodeInfo{LspErrorCode::kInvalidRequest, -32600, "Invalid request"},
    ErrorCodeInfo{LspErrorCode::kMethodNotFound, -32601, "Method not found"},
    ErrorCodeInfo{LspErrorCode::kInvalidParams, -32602, "Invalid params"},
    ErrorCodeInfo{LspErrorCode::kInternalError, -32603, "Internal error"},
    ErrorCodeInfo{LspErrorCode::kServerError, -32000, "Server error"},
    ErrorCodeInfo{LspErrorCode::kTransportError, -32000, "Transport error"},
    ErrorCodeInfo{LspErrorCode::kTimeoutError, -32000, "Timeout error"},
    ErrorCodeInfo{LspErrorCode::kClientError, -32000, "Client error"},
    ErrorCodeInfo{
        LspErrorCode::kMethodNotImplemented, -32601, "Method not implemented"},
    ErrorCodeInfo{
        LspErrorCode::kDocumentNotFound, -32803, "Document not found"},
    ErrorCodeInfo{
        LspErrorCode::kInvalidConfiguration, -32803, "Invalid configuration"},
    ErrorCodeInfo{LspErrorCode::kUnknownError, -32001, "Unknown error"},
};

constexpr auto InfoFor(LspErrorCode code) -> const ErrorCodeInfo& {
  for (const auto& info : kErrorCodes) {
    if (info.code == code) {
      return info;
    }
  }
  return kErrorCodes.back();
}

constexpr auto FromRpcCode(RpcErrorCode code) -> LspErrorCode {
  switch (code) {
    case RpcErrorCode::kParseError:
      return LspErrorCode::kParseError;
    case RpcErrorCode::kInvalidRequest:
      return LspErrorCode::kInvalidRequest;
    case RpcErrorCode::kMethodNotFound:
      return LspErrorCode::kMethodNotFound;
    case RpcErrorCode::kInvalidParams:
      return LspErrorCode::kInvalidParams;
    case RpcErrorCode::kInternalError:
      return LspErrorCode::kInternalError;
    case RpcErrorCode::kServerError:
      return LspErrorCode::kServerError;
    case RpcErrorCode::kTransportError:
      return LspErrorCode::kTransportError;
    case RpcErrorCode::kTimeoutError:
      return LspErrorCode::kTimeoutError;
    case RpcErrorCode::kClientError:
      return LspErrorCode::kClientError;
    default:
      return LspErrorCode::kUnknownError;
  }
}

class LspError {
 public:
  explicit LspError(LspErrorCode code, std::string message)
      : code_(code), message_(std::move(message)) {
  }

  [[nodiscard]] auto Code() const -> LspErrorCode {
    return code_;
  }

  [[nodiscard]] auto Message() const -> const std::string& {
    return message_;
  }

  // Numeric code sent in a JSON-RPC error response
  [[nodiscard]] auto WireCode() const -> int {
    return InfoFor(code_).wire_code;
  }

  [[nodiscard]] auto ToJson() const -> nlohmann::json {
    return {{"code", WireCode()}, {"message", message_}};
  }

  static auto FromCode(LspErrorCode code, const std::string& message = "")
      -> LspError {
    return LspError(
        code, message.empty() ? std::string(InfoFor(code).message) : message);
  }

  static auto UnexpectedFromCode(
      LspErrorCode code, const std::string& details = "")
      -> std::unexpected<LspError> {
    return std::unexpected<LspError>(FromCode(code, details));
  }

  static auto FromRpcError(const RpcError& error) -> LspError {
    return LspError(FromRpcCode(error.Code()), error.Message());
  }

  static auto UnexpectedFromRpcError(const RpcError& error)
      -> std::unexpected<LspError> {
    return std::unexpected<LspError>(FromRpcError(error));
  }

 private:
  LspErrorCode code_;
  std::string message_;
};

inline auto Ok() -> std::expected<void, LspError> {
  return {};
}

inline void to_json(nlohmann::json& j, const LspError& e) {
  j = e.ToJson();
}

}  // namespace lsp::error
