#include "trilld/language/function_catalog.hpp"

#include <algorithm>

#include <slang/ast/symbols/CompilationUnitSymbols.h>
#include <slang/ast/symbols/SubroutineSymbols.h>
#include <slang/ast/symbols/VariableSymbols.h>
#include <slang/parsing/Token.h>
#include <slang/syntax/SyntaxNode.h>
#include <slang/syntax/SyntaxTree.h>
#include <slang/text/SourceManager.h>

#include "trilld/utils/scoped_timer.hpp"

namespace trilld {

namespace {

auto TrimRight(std::string_view text) -> std::string_view {
  auto end = text.find_last_not_of(" \t\r\n");
  return end == std::string_view::npos ? std::string_view{}
                                       : text.substr(0, end + 1);
}

auto TrimLeft(std::string_view text) -> std::string_view {
  auto begin = text.find_first_not_of(" \t");
  return begin == std::string_view::npos ? std::string_view{}
                                         : text.substr(begin);
}

// "// text" and "/// text" -> "text"
auto StripLineComment(std::string_view raw) -> std::string {
  while (raw.starts_with('/')) {
    raw.remove_prefix(1);
  }
  if (raw.starts_with(' ')) {
    raw.remove_prefix(1);
  }
  return std::string(TrimRight(raw));
}

// "/** a\n * b\n */" -> "a\nb"
auto StripBlockComment(std::string_view raw) -> std::string {
  if (raw.starts_with("/*")) {
    raw.remove_prefix(2);
  }
  if (raw.ends_with("*/")) {
    raw.remove_suffix(2);
  }
  while (raw.starts_with('*')) {
    raw.remove_prefix(1);
  }

  std::vector<std::string_view> lines;
  while (true) {
    auto newline = raw.find('\n');
    auto line = TrimLeft(raw.substr(0, newline));
    if (line.starts_with('*')) {
      line.remove_prefix(1);
      if (line.starts_with(' ')) {
        line.remove_prefix(1);
      }
    }
    lines.push_back(TrimRight(line));
    if (newline == std::string_view::npos) {
      break;
    }
    raw.remove_prefix(newline + 1);
  }

  // Drop blank lines left over from the opening and closing markers
  while (!lines.empty() && lines.front().empty()) {
    lines.erase(lines.begin());
  }
  while (!lines.empty() && lines.back().empty()) {
    lines.pop_back();
  }

  std::string result;
  for (const auto& line : lines) {
    if (!result.empty()) {
      result += '\n';
    }
    result += line;
  }
  return result;
}

}  // namespace

auto FunctionCatalog::Add(std::string_view ns, FunctionDoc doc) -> void {
  auto it = namespaces_.find(ns);
  if (it == namespaces_.end()) {
    it = namespaces_.emplace(std::string(ns), std::vector<FunctionDoc>{}).first;
  }

  auto& members = it->second;
  auto existing = std::ranges::find_if(members, [&](const FunctionDoc& entry) {
    return entry.signature.name == doc.signature.name;
  });
  if (existing != members.end()) {
    *existing = std::move(doc);
  } else {
    members.push_back(std::move(doc));
  }
}

auto FunctionCatalog::Functions(std::string_view ns) const
    -> std::vector<std::string> {
  std::vector<std::string> names;
  auto it = namespaces_.find(ns);
  if (it == namespaces_.end()) {
    return names;
  }

  names.reserve(it->second.size());
  for (const auto& doc : it->second) {
    names.push_back(doc.signature.name);
  }
  return names;
}

auto FunctionCatalog::Find(std::string_view ns, std::string_view name) const
    -> std::optional<FunctionDoc> {
  auto it = namespaces_.find(ns);
  if (it == namespaces_.end()) {
    return std::nullopt;
  }

  auto doc = std::ranges::find_if(it->second, [&](const FunctionDoc& entry) {
    return entry.signature.name == name;
  });
  if (doc == it->second.end()) {
    return std::nullopt;
  }
  return *doc;
}

auto FunctionCatalog::FunctionCount() const -> std::size_t {
  std::size_t count = 0;
  for (const auto& [ns, members] : namespaces_) {
    count += members.size();
  }
  return count;
}

auto FunctionCatalog::ExtractDocComment(const slang::syntax::SyntaxNode& syntax)
    -> std::string {
  using slang::parsing::TriviaKind;

  std::vector<std::string> blocks;
  int consecutive_newlines = 0;

  for (const auto& trivia : syntax.getFirstToken().trivia()) {
    switch (trivia.kind) {
      case TriviaKind::LineComment:
        blocks.push_back(StripLineComment(trivia.getRawText()));
        consecutive_newlines = 0;
        break;
      case TriviaKind::BlockComment:
        blocks.push_back(StripBlockComment(trivia.getRawText()));
        consecutive_newlines = 0;
        break;
      case TriviaKind::EndOfLine:
        if (++consecutive_newlines >= 2) {
          blocks.clear();
        }
        break;
      case TriviaKind::Whitespace:
        break;
      default:
        // Directives and skipped tokens break the comment block
        blocks.clear();
        consecutive_newlines = 0;
        break;
    }
  }

  std::string result;
  for (const auto& block : blocks) {
    if (!result.empty()) {
      result += '\n';
    }
    result += block;
  }
  return result;
}

auto FunctionCatalog::FromCompilation(
    slang::ast::Compilation& compilation,
    std::shared_ptr<spdlog::logger> logger) -> FunctionCatalog {
  if (!logger) {
    logger = spdlog::default_logger();
  }

  FunctionCatalog catalog;
  for (const auto* package : compilation.getPackages()) {
    // Built-in packages such as std have no source location
    if (package == nullptr || !package->location.valid()) {
      continue;
    }

    std::string ns(package->name);
    for (const auto& subroutine :
         package->membersOfType<slang::ast::SubroutineSymbol>()) {
      if (subroutine.name.empty()) {
        continue;
      }

      FunctionDoc doc;
      doc.signature.name = std::string(subroutine.name);
      for (const auto* arg : subroutine.getArguments()) {
        doc.signature.args.emplace_back(arg->name);
      }
      if (const auto* syntax = subroutine.getSyntax()) {
        doc.description = ExtractDocComment(*syntax);
      }

      logger->trace(
          "FunctionCatalog: {}::{}", ns, doc.signature.ToString());
      catalog.Add(ns, std::move(doc));
    }
  }

  return catalog;
}

auto FunctionCatalog::BuildFromFiles(
    const std::vector<std::filesystem::path>& files, const slang::Bag& options,
    std::shared_ptr<spdlog::logger> logger) -> FunctionCatalog {
  if (!logger) {
    logger = spdlog::default_logger();
  }
  utils::ScopedTimer timer("FunctionCatalog build", logger);

  if (files.empty()) {
    logger->debug("FunctionCatalog: no library files configured");
    return FunctionCatalog{};
  }

  auto source_manager = std::make_shared<slang::SourceManager>();
  slang::ast::Compilation compilation(options);

  for (const auto& file_path : files) {
    auto tree_result = slang::syntax::SyntaxTree::fromFile(
        file_path.string(), *source_manager, options);

    if (tree_result) {
      compilation.addSyntaxTree(tree_result.value());
    } else {
      logger->warn(
          "FunctionCatalog: Failed to load library file: {}",
          file_path.string());
    }
  }

  auto catalog = FromCompilation(compilation, logger);
  logger->debug(
      "FunctionCatalog: {} functions in {} namespaces from {} files",
      catalog.FunctionCount(), catalog.NamespaceCount(), files.size());
  return catalog;
}

}  // namespace trilld
