// tests/project/test_project_config.cpp - Unit tests for pilc.yaml loading
//
#include <gtest/gtest.h>
#include <spdlog/spdlog.h>

#include <filesystem>
#include <fstream>
#include <string>

#include "pilc/project/project_config.hpp"

using namespace pilc;

namespace
{

struct TempDir
{
  std::filesystem::path path;
  explicit TempDir(std::filesystem::path p) : path(std::move(p))
  {
    std::filesystem::create_directories(path);
  }
  ~TempDir()
  {
    std::error_code ec;
    std::filesystem::remove_all(path, ec);
  }
  TempDir(const TempDir &) = delete;
  TempDir & operator=(const TempDir &) = delete;
};

void write_file(const std::filesystem::path & path, const std::string & content)
{
  std::ofstream out(path);
  out << content;
}

}  // namespace

// ============================================================================
// Parsing
// ============================================================================

TEST(ProjectConfig, ParsesAllSections)
{
  const auto result = parse_project_config(
    "package:\n"
    "  name: fibonacci\n"
    "  version: 0.1.0\n"
    "witgen:\n"
    "  max_passes: 32\n"
    "  default_unknown_to_zero: true\n"
    "log:\n"
    "  level: debug\n"
    "  pattern: '%v'\n"
    "diagnostics:\n"
    "  color: false\n");
  ASSERT_TRUE(result.success) << result.error;

  const ProjectConfig & config = result.config;
  EXPECT_EQ(config.package.name, "fibonacci");
  EXPECT_EQ(config.package.version, "0.1.0");
  EXPECT_EQ(config.witgen.max_passes, 32U);
  EXPECT_TRUE(config.witgen.default_unknown_to_zero);
  EXPECT_EQ(config.log.level, "debug");
  EXPECT_EQ(config.log.pattern, "%v");
  EXPECT_FALSE(config.diagnostics.color);
  EXPECT_TRUE(config.project_root.empty());
}

TEST(ProjectConfig, MissingSectionsKeepDefaults)
{
  const auto result = parse_project_config("package:\n  name: tiny\n");
  ASSERT_TRUE(result.success) << result.error;

  const WitgenOptions defaults;
  EXPECT_EQ(result.config.witgen.max_passes, defaults.max_passes);
  EXPECT_FALSE(result.config.witgen.default_unknown_to_zero);
  EXPECT_EQ(result.config.log.level, "warn");
  EXPECT_TRUE(result.config.diagnostics.color);
}

TEST(ProjectConfig, EmptyDocumentIsValid)
{
  const auto result = parse_project_config("");
  EXPECT_TRUE(result.success) << result.error;
}

// ============================================================================
// Validation
// ============================================================================

TEST(ProjectConfig, RejectsNonMapRoot)
{
  const auto result = parse_project_config("- a\n- b\n");
  EXPECT_FALSE(result.success);
  EXPECT_EQ(result.error, "configuration root must be a map");
}

TEST(ProjectConfig, RejectsNonPositivePasses)
{
  const auto result = parse_project_config("witgen:\n  max_passes: 0\n");
  EXPECT_FALSE(result.success);
  EXPECT_EQ(result.error, "witgen.max_passes must be positive, got 0");
}

TEST(ProjectConfig, RejectsUnknownLogLevel)
{
  const auto result = parse_project_config("log:\n  level: loud\n");
  EXPECT_FALSE(result.success);
  EXPECT_NE(result.error.find("invalid log.level: 'loud'"), std::string::npos);
}

TEST(ProjectConfig, RejectsMistypedValue)
{
  const auto result = parse_project_config("witgen:\n  default_unknown_to_zero: maybe\n");
  EXPECT_FALSE(result.success);
  EXPECT_EQ(result.error.rfind("invalid configuration value: ", 0), 0U);
}

TEST(ProjectConfig, RejectsMalformedYaml)
{
  const auto result = parse_project_config("package: [unclosed\n");
  EXPECT_FALSE(result.success);
  EXPECT_EQ(result.error.rfind("failed to parse YAML: ", 0), 0U);
}

// ============================================================================
// Files
// ============================================================================

TEST(ProjectConfig, LoadsFromFile)
{
  const TempDir dir(std::filesystem::temp_directory_path() / "pilc_config_load");
  const auto path = dir.path / k_project_config_file_name;
  write_file(path, "package:\n  name: from_file\n");

  const auto result = load_project_config(path);
  ASSERT_TRUE(result.success) << result.error;
  EXPECT_EQ(result.config.package.name, "from_file");
  EXPECT_EQ(result.config.project_root, std::filesystem::absolute(dir.path));
}

TEST(ProjectConfig, MissingFile)
{
  const TempDir dir(std::filesystem::temp_directory_path() / "pilc_config_missing");
  const auto result = load_project_config(dir.path / k_project_config_file_name);
  EXPECT_FALSE(result.success);
  EXPECT_EQ(result.error.rfind("configuration file not found: ", 0), 0U);
}

TEST(ProjectConfig, FindSearchesUpward)
{
  const TempDir dir(std::filesystem::temp_directory_path() / "pilc_config_find");
  const auto nested = dir.path / "src" / "deep";
  std::filesystem::create_directories(nested);
  write_file(dir.path / k_project_config_file_name, "package:\n  name: root\n");
  write_file(nested / "main.pil", "namespace Main(4);\n");

  const auto from_dir = find_project_config(nested);
  ASSERT_TRUE(from_dir.has_value());
  EXPECT_EQ(
    std::filesystem::canonical(*from_dir),
    std::filesystem::canonical(dir.path / k_project_config_file_name));

  const auto from_file = find_project_config(nested / "main.pil");
  ASSERT_TRUE(from_file.has_value());
  EXPECT_EQ(std::filesystem::canonical(*from_file), std::filesystem::canonical(*from_dir));
}

// ============================================================================
// Logging
// ============================================================================

TEST(ProjectConfig, AppliesLogLevel)
{
  const auto result = parse_project_config("log:\n  level: debug\n");
  ASSERT_TRUE(result.success) << result.error;

  configure_logging(result.config.log);
  EXPECT_EQ(spdlog::get_level(), spdlog::level::debug);

  configure_logging(LogConfig{});
  EXPECT_EQ(spdlog::get_level(), spdlog::level::warn);
}
