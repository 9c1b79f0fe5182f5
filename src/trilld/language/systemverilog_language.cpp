#include "trilld/language/systemverilog_language.hpp"

#include <string_view>
#include <unordered_set>

#include <slang/ast/Compilation.h>
#include <slang/diagnostics/DiagnosticEngine.h>
#include <slang/diagnostics/Diagnostics.h>
#include <slang/syntax/AllSyntax.h>
#include <slang/syntax/SyntaxTree.h>
#include <slang/text/SourceManager.h>

namespace trilld {

namespace {

// Name given to the in-memory buffer; never read from disk
constexpr std::string_view kDocumentBufferName = "document.sv";

auto IsBlank(std::string_view text) -> bool {
  return text.find_first_not_of(" \t\r\n\f\v") == std::string_view::npos;
}

auto ToSeverity(slang::DiagnosticSeverity severity) -> Severity {
  switch (severity) {
    case slang::DiagnosticSeverity::Ignored:
      return Severity::kHint;
    case slang::DiagnosticSeverity::Note:
      return Severity::kInformation;
    case slang::DiagnosticSeverity::Warning:
      return Severity::kWarning;
    case slang::DiagnosticSeverity::Error:
    case slang::DiagnosticSeverity::Fatal:
      return Severity::kError;
  }
  return Severity::kError;
}

auto ToNativeLocation(
    const slang::SourceManager& source_manager, slang::SourceLocation location)
    -> NativeLocation {
  return NativeLocation{
      .line = static_cast<int>(source_manager.getLineNumber(location)),
      .column = static_cast<int>(source_manager.getColumnNumber(location))};
}

// Names of the modules, interfaces, programs and packages a file declares
auto DeclaredDefinitions(const slang::syntax::SyntaxTree& tree)
    -> std::unordered_set<std::string_view> {
  std::unordered_set<std::string_view> names;
  const auto& root = tree.root();
  if (root.kind != slang::syntax::SyntaxKind::CompilationUnit) {
    return names;
  }
  for (const auto* member :
       root.as<slang::syntax::CompilationUnitSyntax>().members) {
    if (slang::syntax::ModuleDeclarationSyntax::isKind(member->kind)) {
      names.insert(member->as<slang::syntax::ModuleDeclarationSyntax>()
                       .header->name.valueText());
    }
  }
  return names;
}

auto DeclaresAnyOf(
    const slang::syntax::SyntaxTree& tree,
    const std::unordered_set<std::string_view>& names) -> bool {
  for (const auto& name : DeclaredDefinitions(tree)) {
    if (names.contains(name)) {
      return true;
    }
  }
  return false;
}

}  // namespace

SystemVerilogLanguage::SystemVerilogLanguage(
    FunctionCatalog catalog, slang::Bag options,
    std::vector<std::filesystem::path> library_files,
    std::shared_ptr<spdlog::logger> logger)
    : catalog_(std::move(catalog)),
      options_(std::move(options)),
      library_files_(std::move(library_files)),
      logger_(logger ? logger : spdlog::default_logger()) {
}

auto SystemVerilogLanguage::ParseErrors(std::string_view text) const
    -> std::optional<std::vector<RawError>> {
  if (IsBlank(text)) {
    return std::nullopt;
  }

  // Each call owns its source manager, so concurrent calls share nothing
  slang::SourceManager source_manager;
  auto buffer = source_manager.assignText(kDocumentBufferName, text);
  auto tree =
      slang::syntax::SyntaxTree::fromBuffer(buffer, source_manager, options_);

  slang::ast::Compilation compilation(options_);
  compilation.addSyntaxTree(tree);

  // A library that redefines something from the document is the document
  // itself, opened from disk; elaborating both would report duplicates
  auto document_names = DeclaredDefinitions(*tree);
  for (const auto& file_path : library_files_) {
    auto library_tree = slang::syntax::SyntaxTree::fromFile(
        file_path.string(), source_manager, options_);
    if (!library_tree) {
      logger_->debug(
          "SystemVerilogLanguage: skipping unreadable library {}",
          file_path.string());
      continue;
    }
    if (DeclaresAnyOf(*library_tree.value(), document_names)) {
      continue;
    }
    compilation.addSyntaxTree(library_tree.value());
  }

  slang::DiagnosticEngine diagnostic_engine(source_manager);
  std::vector<std::string> warning_options = {"none", "default"};
  diagnostic_engine.setWarningOptions(warning_options);

  // Includes the parse diagnostics of every tree
  std::vector<RawError> errors;
  for (const auto& diag : compilation.getAllDiagnostics()) {
    if (!diag.location) {
      continue;
    }

    // Diagnostics raised inside macro expansions point back into the document
    auto location = source_manager.getFullyOriginalLoc(diag.location);
    if (location.buffer() != buffer.id) {
      continue;
    }

    auto severity = diagnostic_engine.getSeverity(diag.code, diag.location);
    if (severity == slang::DiagnosticSeverity::Ignored) {
      continue;
    }

    RawError error{
        .start = ToNativeLocation(source_manager, location),
        .end = ToNativeLocation(source_manager, location),
        .callout = diagnostic_engine.formatMessage(diag),
        .level = ToSeverity(severity),
        .hint = std::nullopt,
        .code = std::string(toString(diag.code))};

    if (!diag.ranges.empty()) {
      auto range_start =
          source_manager.getFullyOriginalLoc(diag.ranges[0].start());
      auto range_end =
          source_manager.getFullyOriginalLoc(diag.ranges[0].end());
      if (range_start.buffer() == buffer.id &&
          range_end.buffer() == buffer.id) {
        error.start = ToNativeLocation(source_manager, range_start);
        error.end = ToNativeLocation(source_manager, range_end);
      }
    }

    if (!diag.notes.empty()) {
      error.hint = diagnostic_engine.formatMessage(diag.notes[0]);
    }

    errors.push_back(std::move(error));
  }

  logger_->trace(
      "SystemVerilogLanguage: {} errors in {} bytes", errors.size(),
      text.size());
  return errors;
}

auto SystemVerilogLanguage::Functions(std::string_view ns) const
    -> std::vector<std::string> {
  return catalog_.Functions(ns);
}

auto SystemVerilogLanguage::GetFunctionDoc(std::string_view qualified) const
    -> std::optional<FunctionDoc> {
  auto separator = PathSeparator();
  auto split = qualified.rfind(separator);
  if (split == std::string_view::npos) {
    return std::nullopt;
  }
  return catalog_.Find(
      qualified.substr(0, split), qualified.substr(split + separator.size()));
}

}  // namespace trilld
