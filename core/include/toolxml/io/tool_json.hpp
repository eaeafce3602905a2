// toolxml/io/tool_json.hpp - JSON description of a tool tree
//
// Shape of a node:
//   {"tag": "param", "attributes": {"name": "x"}, "children": [...], "text": "..."}
// "attributes" may also be a list of [name, value] pairs. Only "tag" is
// required.
//
#pragma once

#include <filesystem>
#include <nlohmann/json.hpp>

#include "toolxml/codec/scalar_value.hpp"
#include "toolxml/model/tool_node.hpp"

namespace toolxml
{

/**
 * Convert a JSON scalar to a codec value.
 *
 * Strings become text, null becomes absent, booleans become true/false.
 *
 * @throws UnsupportedValueError for numbers, arrays and objects
 */
[[nodiscard]] ScalarValue scalar_from_json(const nlohmann::json & value);

/**
 * Build a tree from its JSON description.
 *
 * String attribute values are kept verbatim; null/true/false are replaced
 * by their sentinel tokens.
 *
 * @throws TreeFormatError if the JSON does not describe a node
 * @throws UnsupportedValueError for a value the codec cannot carry
 */
[[nodiscard]] Node tree_from_json(const nlohmann::json & j);

/// Render a tree as JSON, preserving attribute and child order.
[[nodiscard]] nlohmann::json tree_to_json(const Node & node);

/**
 * Read and parse a JSON tree file.
 *
 * @throws TreeFormatError if the file cannot be read or parsed
 */
[[nodiscard]] Node load_tree_file(const std::filesystem::path & path);

}  // namespace toolxml
