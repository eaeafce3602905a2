// toolxml/io/tool_json.cpp - JSON tree loading and dumping
//
#include "toolxml/io/tool_json.hpp"

#include <fstream>
#include <nlohmann/json.hpp>
#include <string>
#include <utility>

#include "toolxml/basic/error.hpp"
#include "toolxml/codec/escape_codec.hpp"

namespace toolxml
{

namespace
{

using nlohmann::json;

// Strings pass through untouched; sentinels are encoded.
std::string attribute_value_from_json(const json & value)
{
  if (value.is_string()) {
    return value.get<std::string>();
  }
  return encode(scalar_from_json(value));
}

Node node_from_json(const json & j, const std::string & where)
{
  if (!j.is_object()) {
    throw TreeFormatError(where + ": node must be an object");
  }

  const auto tag = j.find("tag");
  if (tag == j.end() || !tag->is_string() || tag->get<std::string>().empty()) {
    throw TreeFormatError(where + ": node requires a non-empty string 'tag'");
  }

  Node node;
  node.tag = tag->get<std::string>();
  const std::string path = where + "/" + node.tag;

  if (const auto attrs = j.find("attributes"); attrs != j.end()) {
    if (attrs->is_object()) {
      for (const auto & item : attrs->items()) {
        node.set_attribute(item.key(), attribute_value_from_json(item.value()));
      }
    } else if (attrs->is_array()) {
      // [[key, value], ...] as written by tree_to_json()
      for (const auto & pair : *attrs) {
        if (!pair.is_array() || pair.size() != 2 || !pair[0].is_string()) {
          throw TreeFormatError(path + ": attribute entries must be [name, value] pairs");
        }
        node.set_attribute(pair[0].get<std::string>(), attribute_value_from_json(pair[1]));
      }
    } else {
      throw TreeFormatError(path + ": 'attributes' must be an object or a list of pairs");
    }
  }

  if (const auto text = j.find("text"); text != j.end()) {
    node.text = attribute_value_from_json(*text);
  }

  if (const auto children = j.find("children"); children != j.end()) {
    if (!children->is_array()) {
      throw TreeFormatError(path + ": 'children' must be an array");
    }
    node.children.reserve(children->size());
    for (const auto & child : *children) {
      node.children.push_back(node_from_json(child, path));
    }
  }

  return node;
}

}  // namespace

ScalarValue scalar_from_json(const json & value)
{
  if (value.is_string()) {
    return ScalarValue::make_text(value.get<std::string>());
  }
  if (value.is_null()) {
    return ScalarValue::make_absent();
  }
  if (value.is_boolean()) {
    return ScalarValue::make_bool(value.get<bool>());
  }
  throw UnsupportedValueError(value.type_name());
}

Node tree_from_json(const json & j) { return node_from_json(j, ""); }

json tree_to_json(const Node & node)
{
  // Attributes are written as [name, value] pairs so their order survives.
  json j;
  j["tag"] = node.tag;

  if (!node.attributes.empty()) {
    json attrs = json::array();
    for (const auto & attr : node.attributes) {
      attrs.push_back(json::array({attr.key, attr.value}));
    }
    j["attributes"] = std::move(attrs);
  }

  if (node.text) {
    j["text"] = *node.text;
  }

  if (!node.children.empty()) {
    json children = json::array();
    for (const auto & child : node.children) {
      children.push_back(tree_to_json(child));
    }
    j["children"] = std::move(children);
  }

  return j;
}

Node load_tree_file(const std::filesystem::path & path)
{
  std::ifstream in(path, std::ios::binary);
  if (!in.is_open()) {
    throw TreeFormatError("failed to open file: " + path.string());
  }

  json j;
  try {
    j = json::parse(in);
  } catch (const json::exception & e) {
    // parse_error for syntax, out_of_range for numbers that overflow a double
    throw TreeFormatError("failed to parse JSON in " + path.string() + ": " + e.what());
  }
  return tree_from_json(j);
}

}  // namespace toolxml
