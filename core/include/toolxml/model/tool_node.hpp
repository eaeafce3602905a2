// toolxml/model/tool_node.hpp - In-memory tool document tree
#pragma once

#include <initializer_list>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace toolxml
{

// NOTE:
// A minimal, serialization-friendly element tree. It intentionally avoids
// tinyxml2 types so ordering can be tested without touching XML.

struct Attribute
{
  std::string key;
  std::string value;
};

struct Node
{
  std::string tag;                    // XML element name (e.g. "tool", "param")
  std::vector<Attribute> attributes;  // unique keys
  std::vector<Node> children;         // child elements
  std::optional<std::string> text;    // optional text content

  /// Value of an attribute, or nullptr if not present.
  [[nodiscard]] const std::string * find_attribute(std::string_view key) const;

  /// Replace an existing attribute in place, or append a new one.
  void set_attribute(std::string_view key, std::string value);

  /// Append a child and return a reference to it.
  Node & append_child(Node child);
};

bool operator==(const Attribute & a, const Attribute & b);
bool operator!=(const Attribute & a, const Attribute & b);
bool operator==(const Node & a, const Node & b);
bool operator!=(const Node & a, const Node & b);

/**
 * Build a node with optional text and attributes in the given order.
 */
[[nodiscard]] Node make_node(
  std::string tag, std::optional<std::string> text = std::nullopt,
  std::initializer_list<Attribute> attributes = {});

}  // namespace toolxml
