#include "app/app_setup.hpp"

#include <array>
#include <cstdlib>
#include <string_view>
#include <unordered_map>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace app {

namespace {

constexpr std::string_view kDefaultLogLevel = "debug";
constexpr std::string_view kLogPattern = "[%n][%L] %v";
constexpr std::string_view kServerLoggerName = "trilld";
constexpr std::string_view kDefaultConfigName = ".trilld";

struct LoggerConfig {
  std::string_view name;
  spdlog::level::level_enum level;
};

auto FindFlagValue(const std::vector<std::string>& args, std::string_view flag)
    -> std::optional<std::string> {
  // args[0] is the program name
  for (std::size_t i = 1; i < args.size(); ++i) {
    if (args[i].starts_with(flag)) {
      return args[i].substr(flag.length());
    }
  }
  return std::nullopt;
}

auto GetLogLevelFromEnv() -> spdlog::level::level_enum {
  const char* env_level = std::getenv("SPDLOG_LEVEL");
  auto level = spdlog::level::from_str(
      env_level != nullptr ? env_level : std::string(kDefaultLogLevel));
  // from_str maps unknown names to off
  if (level == spdlog::level::off &&
      (env_level == nullptr || std::string_view(env_level) != "off")) {
    return spdlog::level::debug;
  }
  return level;
}

void ConfigureLogger(
    const std::shared_ptr<spdlog::logger>& logger,
    spdlog::level::level_enum level) {
  logger->set_pattern(std::string(kLogPattern));
  logger->set_level(level);
  logger->flush_on(spdlog::level::debug);
}

}  // namespace

auto ParsePipeName(const std::vector<std::string>& args)
    -> std::optional<std::string> {
  return FindFlagValue(args, "--pipe=");
}

auto ParseConfigPath(const std::vector<std::string>& args)
    -> std::optional<std::filesystem::path> {
  auto value = FindFlagValue(args, "--config=");
  if (!value || value->empty()) {
    return std::nullopt;
  }
  return std::filesystem::path(*value);
}

auto ResolveConfigPath(const std::vector<std::string>& args)
    -> std::optional<std::filesystem::path> {
  if (auto explicit_path = ParseConfigPath(args)) {
    return explicit_path;
  }

  std::error_code ec;
  auto fallback = std::filesystem::current_path(ec) / kDefaultConfigName;
  if (!ec && std::filesystem::exists(fallback, ec)) {
    return fallback;
  }
  return std::nullopt;
}

auto SetupLoggers()
    -> std::unordered_map<std::string, std::shared_ptr<spdlog::logger>> {
  const auto user_log_level = GetLogLevelFromEnv();
  spdlog::set_level(user_log_level);

  constexpr std::array kLoggerConfigs = {
      LoggerConfig{.name = "transport", .level = spdlog::level::info},
      LoggerConfig{.name = "jsonrpc", .level = spdlog::level::info},
      LoggerConfig{.name = kServerLoggerName, .level = spdlog::level::trace},
  };

  std::unordered_map<std::string, std::shared_ptr<spdlog::logger>> loggers;
  for (const auto& config : kLoggerConfigs) {
    auto logger = spdlog::stdout_color_mt(std::string(config.name));
    ConfigureLogger(
        logger,
        config.name == kServerLoggerName ? user_log_level : config.level);
    loggers[std::string(config.name)] = std::move(logger);
  }

  return loggers;
}

}  // namespace app
