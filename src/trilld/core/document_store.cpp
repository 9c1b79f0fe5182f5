#include "trilld/core/document_store.hpp"

#include <mutex>

namespace trilld {

using lsp::error::LspError;
using lsp::error::LspErrorCode;

auto ParseClosePolicy(std::string_view name) -> std::optional<ClosePolicy> {
  if (name == "remove") {
    return ClosePolicy::kRemove;
  }
  if (name == "retain") {
    return ClosePolicy::kRetain;
  }
  return std::nullopt;
}

DocumentStore::DocumentStore(
    ClosePolicy close_policy, std::shared_ptr<spdlog::logger> logger)
    : close_policy_(close_policy),
      logger_(logger ? logger : spdlog::default_logger()) {
}

auto DocumentStore::Open(std::string uri, std::string text) -> void {
  Store(std::move(uri), std::move(text));
}

auto DocumentStore::Update(std::string uri, std::string text) -> void {
  Store(std::move(uri), std::move(text));
}

auto DocumentStore::Store(std::string uri, std::string text) -> void {
  // Allocate outside the lock; only the pointer swap is exclusive
  auto state = std::make_shared<const DocumentState>(
      DocumentState{.text = std::move(text)});
  const auto size = state->text.size();

  {
    std::unique_lock lock(mutex_);
    documents_.insert_or_assign(uri, std::move(state));
  }
  logger_->trace("DocumentStore stored {} ({} bytes)", uri, size);
}

auto DocumentStore::Get(const std::string& uri) const
    -> std::expected<std::shared_ptr<const DocumentState>, LspError> {
  std::shared_lock lock(mutex_);
  auto it = documents_.find(uri);
  if (it == documents_.end()) {
    return LspError::UnexpectedFromCode(
        LspErrorCode::kDocumentNotFound, "Document not found: " + uri);
  }
  return it->second;
}

auto DocumentStore::Close(const std::string& uri) -> void {
  if (close_policy_ == ClosePolicy::kRetain) {
    logger_->trace("DocumentStore retaining closed document {}", uri);
    return;
  }

  std::unique_lock lock(mutex_);
  documents_.erase(uri);
}

auto DocumentStore::Contains(const std::string& uri) const -> bool {
  std::shared_lock lock(mutex_);
  return documents_.contains(uri);
}

auto DocumentStore::Size() const -> std::size_t {
  std::shared_lock lock(mutex_);
  return documents_.size();
}

auto DocumentStore::GetAllUris() const -> std::vector<std::string> {
  std::shared_lock lock(mutex_);
  std::vector<std::string> uris;
  uris.reserve(documents_.size());
  for (const auto& [uri, state] : documents_) {
    uris.push_back(uri);
  }
  return uris;
}

}  // namespace trilld
