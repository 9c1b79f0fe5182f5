#include "trilld/language/language.hpp"

#include <fmt/format.h>
#include <fmt/ranges.h>

namespace trilld {

auto FunctionSignature::ToString() const -> std::string {
  return fmt::format("{}({})", name, fmt::join(args, ", "));
}

auto FunctionDoc::ToMarkdown(std::string_view fence_language) const
    -> std::string {
  auto markdown =
      fmt::format("```{}\n{}\n```", fence_language, signature.ToString());
  if (!description.empty()) {
    markdown += "\n\n";
    markdown += description;
  }
  return markdown;
}

}  // namespace trilld
