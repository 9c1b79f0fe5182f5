#include "trilld/features/diagnostics_provider.hpp"

#include <algorithm>

#include <fmt/format.h>

namespace trilld {

auto DiagnosticsProvider::Run(std::string_view text) const
    -> std::vector<DiagnosticRecord> {
  std::vector<DiagnosticRecord> records;

  auto errors = language_->ParseErrors(text);
  if (!errors) {
    return records;
  }

  records.reserve(errors->size());
  for (auto& error : *errors) {
    records.push_back(
        DiagnosticRecord{
            .range =
                SourceRange{
                    .start = ToSourcePosition(text, error.start, encoding_),
                    .end = ToSourcePosition(text, error.end, encoding_)},
            .message = FormatMessage(error.callout, error.hint),
            .severity = error.level,
            .hint = std::move(error.hint),
            .code = std::move(error.code)});
  }

  logger_->debug("DiagnosticsProvider produced {} records", records.size());
  return records;
}

auto DiagnosticsProvider::FormatMessage(
    std::string_view callout, const std::optional<std::string>& hint)
    -> std::string {
  if (!hint) {
    return std::string(callout);
  }
  return fmt::format("{}, Note: {}", callout, *hint);
}

auto DiagnosticsProvider::ToSourcePosition(
    std::string_view text, NativeLocation location, PositionEncoding encoding)
    -> SourcePosition {
  SourcePosition native{
      .line = std::max(location.line - 1, 0),
      .column = std::max(location.column - 1, 0)};

  auto offset = ToOffset(text, native, PositionEncoding::kUtf8);
  return ToPosition(text, offset.value_or(text.size()), encoding);
}

}  // namespace trilld
