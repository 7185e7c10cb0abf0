// pilc/project/project_config.cpp - Project configuration implementation
//
#include "pilc/project/project_config.hpp"

#include <yaml-cpp/yaml.h>

#include <array>
#include <string_view>

namespace pilc
{

namespace
{

constexpr std::array<std::string_view, 7> k_log_levels = {
  "trace", "debug", "info", "warn", "error", "critical", "off"};

bool is_log_level(const std::string & level)
{
  for (const std::string_view known : k_log_levels) {
    if (level == known) {
      return true;
    }
  }
  return false;
}

/// Fills `config` from a parsed document; returns an error message on failure
std::optional<std::string> parse_root(const YAML::Node & root, ProjectConfig & config)
{
  if (root.IsNull()) {
    return std::nullopt;
  }
  if (!root.IsMap()) {
    return "configuration root must be a map";
  }

  // Parse 'package' section
  if (root["package"]) {
    const auto & pkg = root["package"];
    if (pkg["name"]) {
      config.package.name = pkg["name"].as<std::string>();
    }
    if (pkg["version"]) {
      config.package.version = pkg["version"].as<std::string>();
    }
  }

  // Parse 'witgen' section
  if (root["witgen"]) {
    const auto & witgen = root["witgen"];
    if (witgen["max_passes"]) {
      const auto passes = witgen["max_passes"].as<int64_t>();
      if (passes <= 0) {
        return "witgen.max_passes must be positive, got " + std::to_string(passes);
      }
      config.witgen.max_passes = static_cast<uint32_t>(passes);
    }
    if (witgen["default_unknown_to_zero"]) {
      config.witgen.default_unknown_to_zero = witgen["default_unknown_to_zero"].as<bool>();
    }
  }

  // Parse 'log' section
  if (root["log"]) {
    const auto & log = root["log"];
    if (log["level"]) {
      config.log.level = log["level"].as<std::string>();
      if (!is_log_level(config.log.level)) {
        return "invalid log.level: '" + config.log.level +
               "' (must be one of trace, debug, info, warn, error, critical, off)";
      }
    }
    if (log["pattern"]) {
      config.log.pattern = log["pattern"].as<std::string>();
    }
  }

  // Parse 'diagnostics' section
  if (root["diagnostics"]) {
    const auto & diag = root["diagnostics"];
    if (diag["color"]) {
      config.diagnostics.color = diag["color"].as<bool>();
    }
  }

  return std::nullopt;
}

ConfigLoadResult load(const YAML::Node & root, ProjectConfig config)
{
  try {
    if (auto error = parse_root(root, config)) {
      return ConfigLoadResult::fail(std::move(*error));
    }
  } catch (const YAML::Exception & e) {
    return ConfigLoadResult::fail("invalid configuration value: " + std::string(e.what()));
  }
  return ConfigLoadResult::ok(std::move(config));
}

}  // namespace

ConfigLoadResult load_project_config(const std::filesystem::path & config_path)
{
  namespace fs = std::filesystem;

  if (!fs::exists(config_path)) {
    return ConfigLoadResult::fail("configuration file not found: " + config_path.string());
  }

  YAML::Node root;
  try {
    root = YAML::LoadFile(config_path.string());
  } catch (const YAML::Exception & e) {
    return ConfigLoadResult::fail("failed to parse YAML: " + std::string(e.what()));
  }

  ProjectConfig config;
  config.project_root = fs::absolute(config_path).parent_path();
  return load(root, std::move(config));
}

ConfigLoadResult parse_project_config(const std::string & yaml_text)
{
  YAML::Node root;
  try {
    root = YAML::Load(yaml_text);
  } catch (const YAML::Exception & e) {
    return ConfigLoadResult::fail("failed to parse YAML: " + std::string(e.what()));
  }
  return load(root, ProjectConfig{});
}

std::optional<std::filesystem::path> find_project_config(const std::filesystem::path & start_dir)
{
  namespace fs = std::filesystem;

  fs::path current = fs::absolute(start_dir);

  // If start_dir is a file, start from its parent
  if (fs::is_regular_file(current)) {
    current = current.parent_path();
  }

  while (true) {
    fs::path candidate = current / k_project_config_file_name;
    if (fs::exists(candidate)) {
      return candidate;
    }

    const fs::path parent = current.parent_path();
    if (parent == current) {
      break;
    }
    current = parent;
  }

  return std::nullopt;
}

}  // namespace pilc
