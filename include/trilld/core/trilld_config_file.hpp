#pragma once

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <spdlog/spdlog.h>

#include "trilld/core/document_store.hpp"
#include "trilld/core/position_mapper.hpp"
#include "trilld/language/language_kind.hpp"

namespace trilld {

// Contents of a .trilld configuration file
class TrilldConfigFile {
 public:
  explicit TrilldConfigFile(std::shared_ptr<spdlog::logger> logger = nullptr);

  static auto CreateDefault(std::shared_ptr<spdlog::logger> logger = nullptr)
      -> TrilldConfigFile;

  // Returns std::nullopt if the file doesn't exist or can't be parsed.
  // Relative paths in the file resolve against the file's directory.
  static auto LoadFromFile(
      const std::filesystem::path& config_path,
      std::shared_ptr<spdlog::logger> logger = nullptr)
      -> std::optional<TrilldConfigFile>;

  [[nodiscard]] auto GetLanguage() const -> LanguageKind {
    return language_;
  }

  [[nodiscard]] auto GetLibraries() const
      -> const std::vector<std::filesystem::path>& {
    return libraries_;
  }

  [[nodiscard]] auto GetIncludeDirs() const
      -> const std::vector<std::filesystem::path>& {
    return include_dirs_;
  }

  // NAME or NAME=value
  [[nodiscard]] auto GetDefines() const -> const std::vector<std::string>& {
    return defines_;
  }

  [[nodiscard]] auto GetPositionEncoding() const -> PositionEncoding {
    return position_encoding_;
  }

  [[nodiscard]] auto GetClosePolicy() const -> ClosePolicy {
    return close_policy_;
  }

  [[nodiscard]] auto GetLoadFromDisk() const -> bool {
    return load_from_disk_;
  }

 private:
  std::shared_ptr<spdlog::logger> logger_;

  LanguageKind language_ = LanguageKind::kSystemVerilog;

  // Source files whose namespaces feed completion and hover
  std::vector<std::filesystem::path> libraries_;

  std::vector<std::filesystem::path> include_dirs_;

  std::vector<std::string> defines_;

  PositionEncoding position_encoding_ = PositionEncoding::kUtf16;

  ClosePolicy close_policy_ = ClosePolicy::kRemove;

  // Prefer the on-disk text over the text sent with didOpen
  bool load_from_disk_ = false;
};

}  // namespace trilld
