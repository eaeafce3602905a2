// toolxml/codegen/tool_document.hpp - Assemble and write Galaxy tool XML
#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

#include "toolxml/model/tool_node.hpp"

namespace toolxml
{

/**
 * Fixed decoration applied to every generated tool document.
 */
struct DocumentMetadata
{
  /// System that produced the document (provenance comment)
  std::string generator_name = "q2galaxy";
  std::string generator_version = "0.0.0";

  /// System the tool wraps (provenance comment)
  std::string target_name = "qiime2";
  std::string target_version = "0.0.0";

  /// Root attributes
  std::string profile = "20.09";
  std::string license = "BSD-3-Clause";

  std::string copyright_holder = "QIIME 2 development team";

  /// Copyright year; the current year when unset.
  std::optional<int> year;
};

/// Body of the copyright comment.
[[nodiscard]] std::string copyright_notice(const DocumentMetadata & meta);

/// Body of the "automatically generated by" comment.
[[nodiscard]] std::string provenance_notice(const DocumentMetadata & meta);

/// Current calendar year in local time.
[[nodiscard]] int current_year();

/**
 * Serialize a canonical tool tree to XML using tinyxml2.
 *
 * The tree is decorated with the profile/license root attributes and the
 * two leading comments; it is not reordered here.
 */
class ToolDocumentSerializer
{
public:
  ToolDocumentSerializer() = default;

  /**
   * Serialize to a UTF-8 XML string with 4-space indentation.
   */
  [[nodiscard]] static std::string serialize(
    const Node & canonical_root, const DocumentMetadata & meta);
};

/**
 * Write bytes to a file. The stream is closed on every exit path.
 *
 * @throws OutputError if the file cannot be opened or written
 */
void write_document(const std::filesystem::path & path, std::string_view bytes);

/**
 * Canonicalize, assemble and write a raw tool tree.
 *
 * @throws SchemaOrderError for an unknown tool section
 * @throws OutputError on I/O failure
 */
void write_tool(
  const Node & raw_root, const DocumentMetadata & meta, const std::filesystem::path & path);

}  // namespace toolxml
