#pragma once

#include <optional>
#include <string>
#include <variant>
#include <vector>

#include <nlohmann/json.hpp>

#include "lsp/basic.hpp"

namespace lsp {

// Hover Request
struct HoverParams : TextDocumentPositionParams, WorkDoneProgressParams {};

void to_json(nlohmann::json& j, const HoverParams& p);
void from_json(const nlohmann::json& j, HoverParams& p);

struct Hover {
  MarkupContent contents;
  std::optional<Range> range;
};

void to_json(nlohmann::json& j, const Hover& h);
void from_json(const nlohmann::json& j, Hover& h);

// Serialized as null when empty
using HoverResult = std::optional<Hover>;

void to_json(nlohmann::json& j, const HoverResult& r);
void from_json(const nlohmann::json& j, HoverResult& r);

// Completion Request
enum class CompletionTriggerKind {
  kInvoked = 1,
  kTriggerCharacter = 2,
  kTriggerForIncompleteCompletions = 3,
};

void to_json(nlohmann::json& j, const CompletionTriggerKind& k);
void from_json(const nlohmann::json& j, CompletionTriggerKind& k);

struct CompletionContext {
  CompletionTriggerKind triggerKind{CompletionTriggerKind::kInvoked};
  std::optional<std::string> triggerCharacter;
};

void to_json(nlohmann::json& j, const CompletionContext& c);
void from_json(const nlohmann::json& j, CompletionContext& c);

struct CompletionParams : TextDocumentPositionParams,
                          WorkDoneProgressParams,
                          PartialResultParams {
  std::optional<CompletionContext> context;
};

void to_json(nlohmann::json& j, const CompletionParams& p);
void from_json(const nlohmann::json& j, CompletionParams& p);

enum class InsertTextFormat {
  kPlainText = 1,
  kSnippet = 2,
};

void to_json(nlohmann::json& j, const InsertTextFormat& f);
void from_json(const nlohmann::json& j, InsertTextFormat& f);

enum class CompletionItemKind {
  kText = 1,
  kMethod = 2,
  kFunction = 3,
  kConstructor = 4,
  kField = 5,
  kVariable = 6,
  kClass = 7,
  kInterface = 8,
  kModule = 9,
  kProperty = 10,
  kUnit = 11,
  kValue = 12,
  kEnum = 13,
  kKeyword = 14,
  kSnippet = 15,
  kColor = 16,
  kFile = 17,
  kReference = 18,
  kFolder = 19,
  kEnumMember = 20,
  kConstant = 21,
  kStruct = 22,
  kEvent = 23,
  kOperator = 24,
  kTypeParameter = 25,
};

void to_json(nlohmann::json& j, const CompletionItemKind& k);
void from_json(const nlohmann::json& j, CompletionItemKind& k);

struct CompletionItem {
  std::string label;
  std::optional<CompletionItemKind> kind;
  std::optional<std::string> detail;
  std::optional<MarkupContent> documentation;
  std::optional<std::string> sortText;
  std::optional<std::string> filterText;
  std::optional<std::string> insertText;
  std::optional<InsertTextFormat> insertTextFormat;
};

void to_json(nlohmann::json& j, const CompletionItem& c);
void from_json(const nlohmann::json& j, CompletionItem& c);

struct CompletionList {
  bool isIncomplete{false};
  std::vector<CompletionItem> items;
};

void to_json(nlohmann::json& j, const CompletionList& c);
void from_json(const nlohmann::json& j, CompletionList& c);

using CompletionResult =
    std::variant<std::vector<CompletionItem>, CompletionList>;

void to_json(nlohmann::json& j, const CompletionResult& r);
void from_json(const nlohmann::json& j, CompletionResult& r);

}  // namespace lsp
