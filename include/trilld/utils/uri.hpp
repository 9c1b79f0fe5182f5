#pragma once

#include <string>
#include <string_view>

namespace trilld::utils {

// "file:///home/user/math.sv" -> "/home/user/math.sv"
// "file:///c:/work/math.sv"   -> "c:/work/math.sv"
// Percent escapes are decoded. Non-file URIs are returned unchanged.
auto UriToPath(std::string_view uri) -> std::string;

inline auto IsFileUri(std::string_view uri) -> bool {
  return uri.starts_with("file://");
}

}  // namespace trilld::utils
