#pragma once

#include <string>

namespace trilld {

// Full text of an open document. Replaced as a whole on every change.
struct DocumentState {
  std::string text;
};

}  // namespace trilld
