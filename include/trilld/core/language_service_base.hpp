#pragma once

#include <expected>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <asio.hpp>
#include <lsp/error.hpp>

#include "trilld/core/feature_types.hpp"
#include "trilld/core/position_mapper.hpp"
#include "trilld/language/language.hpp"

namespace trilld {

using lsp::error::LspError;

// Document lifecycle and queries as the protocol layer sees them. Positions
// and ranges are in the service's configured encoding.
class LanguageServiceBase {
 public:
  LanguageServiceBase() = default;
  LanguageServiceBase(const LanguageServiceBase&) = delete;
  LanguageServiceBase(LanguageServiceBase&&) = delete;
  auto operator=(const LanguageServiceBase&) -> LanguageServiceBase& = delete;
  auto operator=(LanguageServiceBase&&) -> LanguageServiceBase& = delete;
  virtual ~LanguageServiceBase() = default;

  // Called on the service executor with the diagnostics of every lifecycle
  // event, including the empty list sent on close
  using DiagnosticPublisher = std::function<void(
      std::string uri, std::optional<int> version,
      std::vector<DiagnosticRecord>)>;

  virtual auto SetDiagnosticPublisher(DiagnosticPublisher publisher)
      -> void = 0;

  // Stores the text, then computes its diagnostics
  virtual auto OnDocumentOpened(
      std::string uri, std::string text, std::optional<int> version)
      -> asio::awaitable<std::vector<DiagnosticRecord>> = 0;

  // A change carries the whole new text
  virtual auto OnDocumentChanged(
      std::string uri, std::string text, std::optional<int> version)
      -> asio::awaitable<std::vector<DiagnosticRecord>> = 0;

  // Always returns an empty list
  virtual auto OnDocumentClosed(std::string uri)
      -> std::vector<DiagnosticRecord> = 0;

  virtual auto GetCompletions(std::string uri, SourcePosition position)
      -> asio::awaitable<
          std::expected<std::vector<CompletionCandidate>, LspError>> = 0;

  virtual auto GetHover(std::string uri, SourcePosition position)
      -> asio::awaitable<
          std::expected<std::optional<RenderedDoc>, LspError>> = 0;

  // Set from the initialize handshake, before any document is opened
  virtual auto SetPositionEncoding(PositionEncoding encoding) -> void = 0;

  [[nodiscard]] virtual auto GetLanguage() const
      -> std::shared_ptr<const Language> = 0;

  [[nodiscard]] virtual auto IsDocumentOpen(const std::string& uri) const
      -> bool = 0;
};

}  // namespace trilld
