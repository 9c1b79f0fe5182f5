#include "trilld/utils/scoped_timer.hpp"

#include <fmt/format.h>

namespace trilld::utils {

ScopedTimer::ScopedTimer(
    std::string operation_name, std::shared_ptr<spdlog::logger> logger)
    : start_(std::chrono::steady_clock::now()),
      operation_name_(std::move(operation_name)),
      logger_(logger ? logger : spdlog::default_logger()) {
}

ScopedTimer::~ScopedTimer() {
  logger_->debug(
      "{} completed ({})", operation_name_, FormatDuration(GetElapsed()));
}

auto ScopedTimer::GetElapsed() const -> std::chrono::milliseconds {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::now() - start_);
}

auto ScopedTimer::FormatDuration(std::chrono::milliseconds duration)
    -> std::string {
  auto count = duration.count();
  if (count >= 1000) {
    return fmt::format("{:.1f}s", static_cast<double>(count) / 1000.0);
  }
  return fmt::format("{}ms", count);
}

}  // namespace trilld::utils
