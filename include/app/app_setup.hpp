#pragma once

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include <spdlog/logger.h>

namespace app {

/// Value of the first --pipe=<name> argument, if any
auto ParsePipeName(const std::vector<std::string>& args)
    -> std::optional<std::string>;

/// Value of the first --config=<path> argument, if any
auto ParseConfigPath(const std::vector<std::string>& args)
    -> std::optional<std::filesystem::path>;

/// Explicit --config path, else ./.trilld when it exists, else nullopt
auto ResolveConfigPath(const std::vector<std::string>& args)
    -> std::optional<std::filesystem::path>;

/// Named loggers for the transport, jsonrpc and trilld components.
/// SPDLOG_LEVEL sets the trilld level; the others stay at info.
auto SetupLoggers()
    -> std::unordered_map<std::string, std::shared_ptr<spdlog::logger>>;

}  // namespace app
