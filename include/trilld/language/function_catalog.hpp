#pragma once

#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <slang/ast/Compilation.h>
#include <slang/util/Bag.h>
#include <spdlog/spdlog.h>

#include "trilld/language/language.hpp"

namespace slang::syntax {
class SyntaxNode;
}

namespace trilld {

// Functions grouped by namespace, in declaration order. Built once and then
// only read, so a const catalog can be shared between threads.
class FunctionCatalog {
 public:
  FunctionCatalog() = default;

  // Appends `doc` to `ns`. A second entry with the same name replaces the
  // first in place.
  auto Add(std::string_view ns, FunctionDoc doc) -> void;

  [[nodiscard]] auto Functions(std::string_view ns) const
      -> std::vector<std::string>;

  [[nodiscard]] auto Find(std::string_view ns, std::string_view name) const
      -> std::optional<FunctionDoc>;

  [[nodiscard]] auto NamespaceCount() const -> std::size_t {
    return namespaces_.size();
  }

  [[nodiscard]] auto FunctionCount() const -> std::size_t;

  // Every package becomes a namespace, every function or task in it a member
  static auto FromCompilation(
      slang::ast::Compilation& compilation,
      std::shared_ptr<spdlog::logger> logger = nullptr) -> FunctionCatalog;

  // Parses and elaborates `files` together. Files that fail to load are
  // logged and skipped.
  static auto BuildFromFiles(
      const std::vector<std::filesystem::path>& files,
      const slang::Bag& options,
      std::shared_ptr<spdlog::logger> logger = nullptr) -> FunctionCatalog;

  // Comment block directly above `syntax`, markers stripped. A blank line
  // between the comment and the declaration detaches it.
  static auto ExtractDocComment(const slang::syntax::SyntaxNode& syntax)
      -> std::string;

 private:
  std::map<std::string, std::vector<FunctionDoc>, std::less<>> namespaces_;
};

}  // namespace trilld
