#include "trilld/core/trilld_config_file.hpp"

#include <yaml-cpp/yaml.h>

namespace trilld {

namespace {

auto ResolvePath(const std::filesystem::path& base, const std::string& raw)
    -> std::filesystem::path {
  std::filesystem::path path(raw);
  if (path.is_relative()) {
    path = base / path;
  }
  return path.lexically_normal();
}

}  // namespace

TrilldConfigFile::TrilldConfigFile(std::shared_ptr<spdlog::logger> logger)
    : logger_(logger ? logger : spdlog::default_logger()) {
}

auto TrilldConfigFile::CreateDefault(std::shared_ptr<spdlog::logger> logger)
    -> TrilldConfigFile {
  return TrilldConfigFile(logger);
}

auto TrilldConfigFile::LoadFromFile(
    const std::filesystem::path& config_path,
    std::shared_ptr<spdlog::logger> logger) -> std::optional<TrilldConfigFile> {
  TrilldConfigFile config(logger);

  if (!std::filesystem::exists(config_path)) {
    config.logger_->debug(
        "No .trilld configuration file found at {}", config_path.string());
    return std::nullopt;
  }

  auto base_dir = config_path.parent_path();

  try {
    YAML::Node yaml = YAML::LoadFile(config_path.string());

    if (yaml["Language"]) {
      auto raw = yaml["Language"].as<std::string>();
      if (auto kind = ParseLanguageKind(raw)) {
        config.language_ = *kind;
      } else {
        config.logger_->warn(
            "Unsupported Language '{}', keeping {}", raw,
            ToString(config.language_));
      }
    }

    if (yaml["Libraries"]) {
      for (const auto& library : yaml["Libraries"]) {
        config.libraries_.push_back(
            ResolvePath(base_dir, library.as<std::string>()));
      }
    }

    if (yaml["IncludeDirs"]) {
      for (const auto& dir : yaml["IncludeDirs"]) {
        config.include_dirs_.push_back(
            ResolvePath(base_dir, dir.as<std::string>()));
      }
    }

    if (yaml["Defines"]) {
      for (const auto& define : yaml["Defines"]) {
        if (define.IsMap()) {
          // WIDTH: 8 -> "WIDTH=8"
          for (const auto& kv : define) {
            config.defines_.push_back(
                kv.first.as<std::string>() + "=" +
                kv.second.as<std::string>());
          }
        } else {
          config.defines_.push_back(define.as<std::string>());
        }
      }
    }

    if (yaml["PositionEncoding"]) {
      auto raw = yaml["PositionEncoding"].as<std::string>();
      if (auto encoding = ParsePositionEncoding(raw)) {
        config.position_encoding_ = *encoding;
      } else {
        config.logger_->warn(
            "Unknown PositionEncoding '{}', keeping {}", raw,
            ToString(config.position_encoding_));
      }
    }

    if (yaml["CloseBehavior"]) {
      auto raw = yaml["CloseBehavior"].as<std::string>();
      if (auto policy = ParseClosePolicy(raw)) {
        config.close_policy_ = *policy;
      } else {
        config.logger_->warn("Unknown CloseBehavior '{}', keeping remove", raw);
      }
    }

    if (yaml["LoadFromDisk"]) {
      config.load_from_disk_ = yaml["LoadFromDisk"].as<bool>();
    }

    config.logger_->debug(
        "Loaded .trilld configuration from {} ({} libraries, {} include dirs, "
        "{} defines)",
        config_path.string(), config.libraries_.size(),
        config.include_dirs_.size(), config.defines_.size());
    return config;

  } catch (const YAML::Exception& e) {
    config.logger_->error(
        "Error parsing .trilld configuration file: {}", e.what());
    return std::nullopt;
  }
}

}  // namespace trilld
