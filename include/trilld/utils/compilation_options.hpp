#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include <slang/ast/Compilation.h>
#include <slang/parsing/Preprocessor.h>
#include <slang/util/Bag.h>

namespace trilld::utils {

// Options shared by document parsing and the library compilation.
//
// - PreprocessorOptions: initialDefaultNetType = Unknown, plus the configured
//   include directories and defines
// - LexerOptions: enableLegacyProtect = true
// - CompilationFlags: LanguageServerMode, errorLimit = 0
inline auto CreateCompilationOptions(
    const std::vector<std::filesystem::path>& include_dirs = {},
    const std::vector<std::string>& defines = {}) -> slang::Bag {
  slang::Bag options;

  // Disable implicit net declarations for stricter diagnostics
  slang::parsing::PreprocessorOptions pp_options;
  pp_options.initialDefaultNetType = slang::parsing::TokenKind::Unknown;
  for (const auto& dir : include_dirs) {
    pp_options.additionalIncludePaths.emplace_back(dir);
  }
  for (const auto& define : defines) {
    pp_options.predefines.push_back(define);
  }
  options.set(pp_options);

  slang::parsing::LexerOptions lexer_options;
  lexer_options.enableLegacyProtect = true;
  options.set(lexer_options);

  slang::ast::CompilationOptions comp_options;
  comp_options.flags |= slang::ast::CompilationFlags::LanguageServerMode;
  // Report every diagnostic
  comp_options.errorLimit = 0;
  options.set(comp_options);

  return options;
}

}  // namespace trilld::utils
