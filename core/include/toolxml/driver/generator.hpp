// toolxml/driver/generator.hpp - Generation driver
//
// Single entry point for the tree -> canonical tree -> XML file pipeline.
// Used by the CLI and usable from other tools.
//
#pragma once

#include <filesystem>
#include <optional>
#include <vector>

#include "toolxml/basic/diagnostic.hpp"
#include "toolxml/codegen/tool_document.hpp"
#include "toolxml/project/project_config.hpp"

namespace toolxml
{

// ============================================================================
// Generate Options
// ============================================================================

struct GenerateOptions
{
  /// Output directory for generated files (overrides project config)
  std::optional<std::filesystem::path> output_dir;

  /// Print progress to stderr
  bool verbose = false;
};

// ============================================================================
// Generate Result
// ============================================================================

struct GenerateResult
{
  /// Whether every document was written
  bool success = false;

  DiagnosticBag diagnostics;

  std::vector<std::filesystem::path> generated_files;
};

// ============================================================================
// Generator
// ============================================================================

/**
 * Each tool is generated independently: a failure is reported as a
 * diagnostic for that tool and does not stop the remaining ones.
 */
class Generator
{
public:
  /**
   * Generate one tool document from a JSON tree file.
   *
   * @param tree_file JSON tree description
   * @param output_file Destination XML path
   * @param meta Document decoration
   */
  [[nodiscard]] static GenerateResult generate_file(
    const std::filesystem::path & tree_file, const std::filesystem::path & output_file,
    const DocumentMetadata & meta, const GenerateOptions & options);

  /**
   * Generate every tool listed in a project configuration.
   */
  [[nodiscard]] static GenerateResult generate_project(
    const ProjectConfig & config, const GenerateOptions & options);

  /// Output file name for a tree file: its stem with an .xml extension.
  [[nodiscard]] static std::filesystem::path output_name_for(
    const std::filesystem::path & tree_file);

private:
  static bool generate_one(
    const std::filesystem::path & tree_file, const std::filesystem::path & output_file,
    const DocumentMetadata & meta, const GenerateOptions & options, GenerateResult & result);
};

}  // namespace toolxml
