#include "trilld/core/trilld_config_file.hpp"

#include <filesystem>
#include <fstream>

#include <catch2/catch_all.hpp>
#include <spdlog/spdlog.h>

constexpr auto kLogLevel = spdlog::level::debug;

auto main(int argc, char* argv[]) -> int {
  spdlog::set_level(kLogLevel);
  spdlog::set_pattern("[%l] %v");
  return Catch::Session().run(argc, argv);
}

using trilld::ClosePolicy;
using trilld::LanguageKind;
using trilld::PositionEncoding;
using trilld::TrilldConfigFile;

// Writes a .trilld file into its own temporary directory
class TempConfigFile {
 public:
  explicit TempConfigFile(std::string_view content) {
    dir_ = std::filesystem::temp_directory_path() / "trilld_config_test";
    std::filesystem::create_directories(dir_);
    path_ = dir_ / ".trilld";
    std::ofstream file(path_);
    file << content;
  }

  ~TempConfigFile() {
    std::error_code ec;
    std::filesystem::remove_all(dir_, ec);
  }

  TempConfigFile(const TempConfigFile&) = delete;
  auto operator=(const TempConfigFile&) -> TempConfigFile& = delete;
  TempConfigFile(TempConfigFile&&) = delete;
  auto operator=(TempConfigFile&&) -> TempConfigFile& = delete;

  [[nodiscard]] auto Path() const -> const std::filesystem::path& {
    return path_;
  }

  [[nodiscard]] auto Dir() const -> const std::filesystem::path& {
    return dir_;
  }

 private:
  std::filesystem::path dir_;
  std::filesystem::path path_;
};

TEST_CASE("TrilldConfigFile defaults", "[config]") {
  auto config = TrilldConfigFile::CreateDefault();

  REQUIRE(config.GetLanguage() == LanguageKind::kSystemVerilog);
  REQUIRE(config.GetLibraries().empty());
  REQUIRE(config.GetPositionEncoding() == PositionEncoding::kUtf16);
  REQUIRE(config.GetClosePolicy() == ClosePolicy::kRemove);
  REQUIRE_FALSE(config.GetLoadFromDisk());
}

TEST_CASE("TrilldConfigFile reads every key", "[config]") {
  const auto* content = R"(
Language: systemverilog
Libraries:
  - pkg/math_pkg.sv
  - /abs/util_pkg.sv
IncludeDirs: [include]
Defines:
  - DEBUG
  - WIDTH: 8
PositionEncoding: utf-8
CloseBehavior: retain
LoadFromDisk: true
)";

  TempConfigFile temp(content);
  auto config = TrilldConfigFile::LoadFromFile(temp.Path());

  REQUIRE(config.has_value());
  REQUIRE(config->GetLanguage() == LanguageKind::kSystemVerilog);

  REQUIRE(config->GetLibraries().size() == 2);
  REQUIRE(
      config->GetLibraries()[0] ==
      (temp.Dir() / "pkg/math_pkg.sv").lexically_normal());
  REQUIRE(config->GetLibraries()[1] == std::filesystem::path("/abs/util_pkg.sv"));

  REQUIRE(config->GetIncludeDirs().size() == 1);
  REQUIRE(
      config->GetIncludeDirs()[0] == (temp.Dir() / "include").lexically_normal());

  REQUIRE(
      config->GetDefines() == std::vector<std::string>{"DEBUG", "WIDTH=8"});
  REQUIRE(config->GetPositionEncoding() == PositionEncoding::kUtf8);
  REQUIRE(config->GetClosePolicy() == ClosePolicy::kRetain);
  REQUIRE(config->GetLoadFromDisk());
}

TEST_CASE("TrilldConfigFile keeps defaults for unknown values", "[config]") {
  const auto* content = R"(
PositionEncoding: utf-32
CloseBehavior: archive
)";

  TempConfigFile temp(content);
  auto config = TrilldConfigFile::LoadFromFile(temp.Path());

  REQUIRE(config.has_value());
  REQUIRE(config->GetPositionEncoding() == PositionEncoding::kUtf16);
  REQUIRE(config->GetClosePolicy() == ClosePolicy::kRemove);
}

TEST_CASE(
    "TrilldConfigFile keeps the default for an unsupported language",
    "[config]") {
  const auto* content = R"(
Language: cobol
Libraries: [pkg/math_pkg.sv]
Defines: [DEBUG]
)";

  TempConfigFile temp(content);
  auto config = TrilldConfigFile::LoadFromFile(temp.Path());

  REQUIRE(config.has_value());
  REQUIRE(config->GetLanguage() == LanguageKind::kSystemVerilog);
  REQUIRE(config->GetLibraries().size() == 1);
  REQUIRE(config->GetDefines() == std::vector<std::string>{"DEBUG"});
}

TEST_CASE("TrilldConfigFile returns nullopt for malformed YAML", "[config]") {
  TempConfigFile temp("Libraries: [unterminated\n");
  REQUIRE_FALSE(TrilldConfigFile::LoadFromFile(temp.Path()).has_value());
}

TEST_CASE("TrilldConfigFile returns nullopt for a missing file", "[config]") {
  auto missing =
      std::filesystem::temp_directory_path() / "trilld_no_such_dir" / ".trilld";
  REQUIRE_FALSE(TrilldConfigFile::LoadFromFile(missing).has_value());
}
