#pragma once

#include <expected>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include <lsp/error.hpp>
#include <spdlog/spdlog.h>

#include "trilld/core/document_state.hpp"

namespace trilld {

// What Close() does with the stored text
enum class ClosePolicy {
  kRemove,
  kRetain,
};

auto ParseClosePolicy(std::string_view name) -> std::optional<ClosePolicy>;

// Thread-safe map from document URI to its latest text. Writers publish a
// freshly allocated DocumentState under an exclusive lock; readers take a
// shared lock and keep the snapshot alive through the returned shared_ptr, so
// a reader sees either the old text or the new one, never a mix.
class DocumentStore {
 public:
  explicit DocumentStore(
      ClosePolicy close_policy = ClosePolicy::kRemove,
      std::shared_ptr<spdlog::logger> logger = nullptr);

  // Inserts or overwrites
  auto Open(std::string uri, std::string text) -> void;

  // Same as Open; a change always replaces the whole text
  auto Update(std::string uri, std::string text) -> void;

  [[nodiscard]] auto Get(const std::string& uri) const -> std::expected<
      std::shared_ptr<const DocumentState>, lsp::error::LspError>;

  auto Close(const std::string& uri) -> void;

  [[nodiscard]] auto Contains(const std::string& uri) const -> bool;

  [[nodiscard]] auto Size() const -> std::size_t;

  [[nodiscard]] auto GetAllUris() const -> std::vector<std::string>;

  [[nodiscard]] auto GetClosePolicy() const -> ClosePolicy {
    return close_policy_;
  }

 private:
  auto Store(std::string uri, std::string text) -> void;

  mutable std::shared_mutex mutex_;
  std::unordered_map<std::string, std::shared_ptr<const DocumentState>>
      documents_;
  ClosePolicy close_policy_;
  std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace trilld
