#pragma once

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <slang/util/Bag.h>
#include <spdlog/spdlog.h>

#include "trilld/language/function_catalog.hpp"
#include "trilld/language/language.hpp"

namespace trilld {

// SystemVerilog through the slang front end. Each ParseErrors call parses the
// document next to the library files and elaborates them, so both syntax and
// semantic errors are reported. Functions come from a catalog of library
// packages built ahead of time.
class SystemVerilogLanguage : public Language {
 public:
  SystemVerilogLanguage(
      FunctionCatalog catalog, slang::Bag options,
      std::vector<std::filesystem::path> library_files = {},
      std::shared_ptr<spdlog::logger> logger = nullptr);

  [[nodiscard]] auto Name() const -> std::string_view override {
    return "systemverilog";
  }

  [[nodiscard]] auto ParseErrors(std::string_view text) const
      -> std::optional<std::vector<RawError>> override;

  [[nodiscard]] auto Functions(std::string_view ns) const
      -> std::vector<std::string> override;

  [[nodiscard]] auto GetFunctionDoc(std::string_view qualified) const
      -> std::optional<FunctionDoc> override;

  [[nodiscard]] auto GetCatalog() const -> const FunctionCatalog& {
    return catalog_;
  }

 private:
  FunctionCatalog catalog_;
  slang::Bag options_;
  // Elaborated with the document so its package references resolve
  std::vector<std::filesystem::path> library_files_;
  std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace trilld
