// pilc/project/project_config.hpp - Project configuration (pilc.yaml)
//
// Parses and validates pilc.yaml project configuration files.
//
#pragma once

#include <filesystem>
#include <optional>
#include <string>

#include "pilc/basic/logging.hpp"
#include "pilc/witgen/generator.hpp"

namespace pilc
{

// ============================================================================
// Configuration Structures
// ============================================================================

/**
 * Package metadata section.
 */
struct PackageConfig
{
  std::string name;
  std::string version;
};

/**
 * Diagnostic output section.
 */
struct DiagnosticsConfig
{
  /// Colored terminal output
  bool color = true;
};

/**
 * Complete project configuration (pilc.yaml).
 *
 * @code
 *   package:
 *     name: fibonacci
 *     version: 0.1.0
 *   witgen:
 *     max_passes: 32
 *     default_unknown_to_zero: false
 *   log:
 *     level: info
 *   diagnostics:
 *     color: false
 * @endcode
 */
struct ProjectConfig
{
  PackageConfig package;
  WitgenOptions witgen;
  LogConfig log;
  DiagnosticsConfig diagnostics;

  /// Directory containing pilc.yaml (empty when loaded from a string)
  std::filesystem::path project_root;
};

// ============================================================================
// Configuration Loading Result
// ============================================================================

/**
 * Result of loading a project configuration file.
 */
struct ConfigLoadResult
{
  /// Loaded configuration (only valid if success == true)
  ProjectConfig config;

  bool success = false;

  /// Error message if loading failed
  std::string error;

  static ConfigLoadResult ok(ProjectConfig cfg)
  {
    ConfigLoadResult r;
    r.config = std::move(cfg);
    r.success = true;
    return r;
  }

  static ConfigLoadResult fail(std::string msg)
  {
    ConfigLoadResult r;
    r.error = std::move(msg);
    r.success = false;
    return r;
  }
};

// ============================================================================
// Configuration Loading API
// ============================================================================

/**
 * Load a project configuration from a pilc.yaml file.
 *
 * @param config_path Path to pilc.yaml
 * @return ConfigLoadResult with the loaded config or error message
 */
[[nodiscard]] ConfigLoadResult load_project_config(const std::filesystem::path & config_path);

/// Same as load_project_config, from YAML text
[[nodiscard]] ConfigLoadResult parse_project_config(const std::string & yaml_text);

/**
 * Find a project configuration file by searching upward from a directory.
 *
 * @param start_dir Directory (or file) to start searching from
 * @return Path to pilc.yaml if found, std::nullopt otherwise
 */
[[nodiscard]] std::optional<std::filesystem::path> find_project_config(
  const std::filesystem::path & start_dir);

inline constexpr const char * k_project_config_file_name = "pilc.yaml";

}  // namespace pilc
