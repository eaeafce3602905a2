// toolxml/model/tool_node.cpp
//
#include "toolxml/model/tool_node.hpp"

#include <utility>

namespace toolxml
{

const std::string * Node::find_attribute(std::string_view key) const
{
  for (const auto & attr : attributes) {
    if (attr.key == key) {
      return &attr.value;
    }
  }
  return nullptr;
}

void Node::set_attribute(std::string_view key, std::string value)
{
  for (auto & attr : attributes) {
    if (attr.key == key) {
      attr.value = std::move(value);
      return;
    }
  }
  attributes.push_back(Attribute{std::string(key), std::move(value)});
}

Node & Node::append_child(Node child)
{
  children.push_back(std::move(child));
  return children.back();
}

bool operator==(const Attribute & a, const Attribute & b)
{
  return a.key == b.key && a.value == b.value;
}

bool operator!=(const Attribute & a, const Attribute & b) { return !(a == b); }

bool operator==(const Node & a, const Node & b)
{
  return a.tag == b.tag && a.text == b.text && a.attributes == b.attributes &&
         a.children == b.children;
}

bool operator!=(const Node & a, const Node & b) { return !(a == b); }

Node make_node(
  std::string tag, std::optional<std::string> text, std::initializer_list<Attribute> attributes)
{
  Node n;
  n.tag = std::move(tag);
  n.text = std::move(text);
  for (const auto & attr : attributes) {
    n.set_attribute(attr.key, attr.value);
  }
  return n;
}

}  // namespace toolxml
