#pragma once

#include <optional>
#include <string>
#include <variant>
#include <vector>

#include <nlohmann/json.hpp>

#include "lsp/basic.hpp"

namespace lsp {

enum class TextDocumentSyncKind {
  kNone = 0,
  kFull = 1,
  kIncremental = 2,
};

void to_json(nlohmann::json& j, const TextDocumentSyncKind& o);
void from_json(const nlohmann::json& j, TextDocumentSyncKind& o);

struct TextDocumentSyncOptions {
  std::optional<bool> openClose = true;
  std::optional<TextDocumentSyncKind> change = TextDocumentSyncKind::kFull;
};

void to_json(nlohmann::json& j, const TextDocumentSyncOptions& o);
void from_json(const nlohmann::json& j, TextDocumentSyncOptions& o);

struct CompletionOptions {
  std::optional<std::vector<std::string>> triggerCharacters;
  std::optional<bool> resolveProvider;
};

void to_json(nlohmann::json& j, const CompletionOptions& o);
void from_json(const nlohmann::json& j, CompletionOptions& o);

struct HoverOptions {
  std::optional<bool> workDoneProgress;
};

void to_json(nlohmann::json& j, const HoverOptions& o);
void from_json(const nlohmann::json& j, HoverOptions& o);

struct WorkspaceFoldersServerCapabilities {
  std::optional<bool> supported;
  std::optional<bool> changeNotifications;
};

void to_json(nlohmann::json& j, const WorkspaceFoldersServerCapabilities& o);
void from_json(const nlohmann::json& j, WorkspaceFoldersServerCapabilities& o);

struct ServerCapabilities {
  std::optional<PositionEncodingKind> positionEncoding =
      PositionEncodingKind::kUtf16;

  using TextDocumentSync =
      std::variant<TextDocumentSyncOptions, TextDocumentSyncKind>;
  std::optional<TextDocumentSync> textDocumentSync = std::nullopt;

  std::optional<CompletionOptions> completionProvider = std::nullopt;

  using HoverProvider = std::variant<bool, HoverOptions>;
  std::optional<HoverProvider> hoverProvider = std::nullopt;

  struct Workspace {
    std::optional<WorkspaceFoldersServerCapabilities> workspaceFolders;
  };

  std::optional<Workspace> workspace = std::nullopt;
};

void to_json(nlohmann::json& j, const ServerCapabilities::TextDocumentSync& o);
void from_json(
    const nlohmann::json& j, ServerCapabilities::TextDocumentSync& o);

void to_json(nlohmann::json& j, const ServerCapabilities::HoverProvider& o);
void from_json(const nlohmann::json& j, ServerCapabilities::HoverProvider& o);

void to_json(nlohmann::json& j, const ServerCapabilities::Workspace& o);
void from_json(const nlohmann::json& j, ServerCapabilities::Workspace& o);

void to_json(nlohmann::json& j, const ServerCapabilities& o);
void from_json(const nlohmann::json& j, ServerCapabilities& o);

}  // namespace lsp
