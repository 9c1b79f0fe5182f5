#include "app/app_setup.hpp"

#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

#include <catch2/catch_all.hpp>
#include <spdlog/spdlog.h>

constexpr auto kLogLevel = spdlog::level::debug;

auto main(int argc, char* argv[]) -> int {
  spdlog::set_level(kLogLevel);
  spdlog::set_pattern("[%l] %v");
  return Catch::Session().run(argc, argv);
}

TEST_CASE("ParsePipeName finds the pipe flag", "[app]") {
  std::vector<std::string> args{"trilld", "--log=x", "--pipe=/tmp/lsp.sock"};
  auto pipe = app::ParsePipeName(args);
  REQUIRE(pipe.has_value());
  REQUIRE(*pipe == "/tmp/lsp.sock");
}

TEST_CASE("ParsePipeName ignores the program name", "[app]") {
  std::vector<std::string> args{"--pipe=not-an-argument"};
  REQUIRE_FALSE(app::ParsePipeName(args).has_value());
  REQUIRE_FALSE(app::ParsePipeName({}).has_value());
}

TEST_CASE("ParseConfigPath rejects an empty value", "[app]") {
  std::vector<std::string> empty{"trilld", "--config="};
  REQUIRE_FALSE(app::ParseConfigPath(empty).has_value());

  std::vector<std::string> given{"trilld", "--config=/etc/trilld.yaml"};
  auto path = app::ParseConfigPath(given);
  REQUIRE(path.has_value());
  REQUIRE(*path == std::filesystem::path("/etc/trilld.yaml"));
}

TEST_CASE("ResolveConfigPath prefers the explicit flag", "[app]") {
  std::vector<std::string> args{"trilld", "--config=/nowhere/.trilld"};
  auto path = app::ResolveConfigPath(args);
  REQUIRE(path.has_value());
  REQUIRE(*path == std::filesystem::path("/nowhere/.trilld"));
}

TEST_CASE("ResolveConfigPath falls back to the working directory", "[app]") {
  auto original = std::filesystem::current_path();
  auto dir = std::filesystem::temp_directory_path() / "trilld_app_setup_test";
  std::filesystem::remove_all(dir);
  std::filesystem::create_directories(dir);
  std::filesystem::current_path(dir);

  std::vector<std::string> args{"trilld"};
  REQUIRE_FALSE(app::ResolveConfigPath(args).has_value());

  {
    std::ofstream out(dir / ".trilld");
    out << "Language: systemverilog\n";
  }
  auto path = app::ResolveConfigPath(args);
  REQUIRE(path.has_value());
  REQUIRE(path->filename() == ".trilld");

  std::filesystem::current_path(original);
  std::filesystem::remove_all(dir);
}
