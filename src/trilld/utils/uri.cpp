#include "trilld/utils/uri.hpp"

#include <charconv>

namespace trilld::utils {

auto UriToPath(std::string_view uri) -> std::string {
  if (!IsFileUri(uri)) {
    return std::string(uri);
  }

  auto path = uri.substr(7);

  // "/c:/path" -> "c:/path"
  if (path.size() >= 3 && path[0] == '/' && path[2] == ':') {
    path.remove_prefix(1);
  }

  std::string result;
  result.reserve(path.size());
  for (std::size_t i = 0; i < path.size(); ++i) {
    if (path[i] == '%' && i + 2 < path.size()) {
      unsigned int value = 0;
      const auto* first = path.data() + i + 1;
      auto [ptr, ec] = std::from_chars(first, first + 2, value, 16);
      if (ec == std::errc{} && ptr == first + 2) {
        result += static_cast<char>(value);
        i += 2;
        continue;
      }
    }
    result += path[i];
  }
  return result;
}

}  // namespace trilld::utils
