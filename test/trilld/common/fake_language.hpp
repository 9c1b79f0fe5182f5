#pragma once

#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "trilld/language/language.hpp"

namespace trilld::test {

// Scripted Language: returns canned errors and serves functions from a
// small in-memory table
class FakeLanguage : public Language {
 public:
  [[nodiscard]] auto Name() const -> std::string_view override {
    return "fake";
  }

  [[nodiscard]] auto ParseErrors(std::string_view text) const
      -> std::optional<std::vector<RawError>> override {
    if (text.find_first_not_of(" \t\r\n") == std::string_view::npos) {
      return std::nullopt;
    }
    return errors;
  }

  [[nodiscard]] auto Functions(std::string_view ns) const
      -> std::vector<std::string> override {
    std::vector<std::string> names;
    auto it = namespaces.find(std::string(ns));
    if (it == namespaces.end()) {
      return names;
    }
    for (const auto& name : it->second) {
      names.push_back(name);
    }
    return names;
  }

  [[nodiscard]] auto GetFunctionDoc(std::string_view qualified) const
      -> std::optional<FunctionDoc> override {
    auto it = docs.find(std::string(qualified));
    if (it == docs.end()) {
      return std::nullopt;
    }
    return it->second;
  }

  // Registers ns::name with a doc
  auto AddFunction(
      const std::string& ns, const std::string& name,
      std::vector<std::string> args, std::string description = "") -> void {
    namespaces[ns].push_back(name);
    docs[ns + "::" + name] = FunctionDoc{
        .signature = {.name = name, .args = std::move(args)},
        .description = std::move(description)};
  }

  // Registers ns::name without any documentation
  auto AddUndocumented(const std::string& ns, const std::string& name)
      -> void {
    namespaces[ns].push_back(name);
  }

  std::vector<RawError> errors;
  std::map<std::string, std::vector<std::string>> namespaces;
  std::map<std::string, FunctionDoc> docs;
};

}  // namespace trilld::test
