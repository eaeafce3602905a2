// toolxml/project/project_config.hpp - Project configuration (toolxml.yaml)
//
// Parses and validates toolxml.yaml project configuration files.
//
#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "toolxml/codegen/tool_document.hpp"

namespace toolxml
{

// ============================================================================
// Configuration Structures
// ============================================================================

/**
 * Output section.
 */
struct OutputConfig
{
  /// Directory for generated XML files (relative to toolxml.yaml)
  std::filesystem::path directory = "tools";
};

/**
 * Complete project configuration (toolxml.yaml).
 */
struct ProjectConfig
{
  /// Decoration applied to every generated document
  DocumentMetadata metadata;

  OutputConfig output;

  /// JSON tree files to generate from
  std::vector<std::filesystem::path> tools;

  /// Directory containing toolxml.yaml (for resolving relative paths)
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
 * Load a project configuration from a toolxml.yaml file.
 *
 * @param config_path Path to toolxml.yaml
 * @return ConfigLoadResult with the loaded config or error message
 */
[[nodiscard]] ConfigLoadResult load_project_config(const std::filesystem::path & config_path);

/**
 * Parse configuration text. Relative paths resolve against `project_root`.
 */
[[nodiscard]] ConfigLoadResult parse_project_config(
  const std::string & yaml_text, const std::filesystem::path & project_root);

/**
 * Find toolxml.yaml by searching upward from start_dir to the filesystem root.
 */
[[nodiscard]] std::optional<std::filesystem::path> find_project_config(
  const std::filesystem::path & start_dir);

/**
 * Default name of the project configuration file.
 */
inline constexpr const char * k_project_config_file_name = "toolxml.yaml";

}  // namespace toolxml
