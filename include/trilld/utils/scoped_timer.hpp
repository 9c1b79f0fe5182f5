#pragma once

#include <chrono>
#include <memory>
#include <string>

#include <spdlog/spdlog.h>

namespace trilld::utils {

// Logs "<operation> completed (<duration>)" at debug when it goes out of scope
class ScopedTimer {
 public:
  ScopedTimer(const ScopedTimer&) = delete;
  ScopedTimer(ScopedTimer&&) = delete;
  auto operator=(const ScopedTimer&) -> ScopedTimer& = delete;
  auto operator=(ScopedTimer&&) -> ScopedTimer& = delete;
  ScopedTimer(
      std::string operation_name, std::shared_ptr<spdlog::logger> logger);
  ~ScopedTimer();

  [[nodiscard]] auto GetElapsed() const -> std::chrono::milliseconds;

  // "123ms" below one second, "1.2s" above
  static auto FormatDuration(std::chrono::milliseconds duration) -> std::string;

 private:
  std::chrono::steady_clock::time_point start_;
  std::string operation_name_;
  std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace trilld::utils
