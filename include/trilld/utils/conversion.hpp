#pragma once

#include <optional>
#include <vector>

#include <lsp/basic.hpp>
#include <lsp/document_features.hpp>
#include <nlohmann/json.hpp>

#include "trilld/core/feature_types.hpp"
#include "trilld/core/position_mapper.hpp"

namespace trilld::utils {

// Name reported as the source of every published diagnostic
inline constexpr auto kDiagnosticSource = "trilld";

auto ToLspPosition(const SourcePosition& position) -> lsp::Position;

auto ToSourcePosition(const lsp::Position& position) -> SourcePosition;

auto ToLspRange(const SourceRange& range) -> lsp::Range;

auto ToLspSeverity(Severity severity) -> lsp::DiagnosticSeverity;

auto ToLspDiagnostic(const DiagnosticRecord& record) -> lsp::Diagnostic;

auto ToLspDiagnostics(const std::vector<DiagnosticRecord>& records)
    -> std::vector<lsp::Diagnostic>;

// Function items; insert text is sent in snippet format
auto ToLspCompletionItem(const CompletionCandidate& candidate)
    -> lsp::CompletionItem;

auto ToLspHover(const RenderedDoc& doc) -> lsp::Hover;

auto ToPositionEncodingKind(PositionEncoding encoding)
    -> lsp::PositionEncodingKind;

// Picks `preferred` when the client lists it under
// general.positionEncodings, otherwise utf-16, which every client supports
auto NegotiatePositionEncoding(
    const std::optional<nlohmann::json>& client_capabilities,
    PositionEncoding preferred) -> PositionEncoding;

}  // namespace trilld::utils
