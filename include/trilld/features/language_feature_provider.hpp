#pragma once

#include <memory>

#include <spdlog/spdlog.h>

#include "trilld/core/position_mapper.hpp"
#include "trilld/language/language.hpp"

namespace trilld {

class LanguageFeatureProvider {
 public:
  LanguageFeatureProvider(
      std::shared_ptr<const Language> language, PositionEncoding encoding,
      std::shared_ptr<spdlog::logger> logger = nullptr)
      : language_(std::move(language)),
        encoding_(encoding),
        logger_(logger ? logger : spdlog::default_logger()) {
  }

  [[nodiscard]] auto GetEncoding() const -> PositionEncoding {
    return encoding_;
  }

  auto SetEncoding(PositionEncoding encoding) -> void {
    encoding_ = encoding;
  }

 protected:
  std::shared_ptr<const Language> language_;
  PositionEncoding encoding_;
  std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace trilld
