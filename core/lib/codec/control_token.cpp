// toolxml/codec/control_token.cpp - Control placeholder generation
//
#include "toolxml/codec/control_token.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace toolxml
{

std::string control_value_token(std::string_view value)
{
  return "__q2galaxy__::control::" + std::string(value);
}

std::string control_path_token(
  const std::optional<std::string> & tag, const std::optional<std::string> & name)
{
  std::vector<std::string> elements = {"", "q2galaxy", "GUI"};
  if (tag) {
    elements.push_back(*tag);
  }
  if (name) {
    elements.push_back(*name);
  }
  elements.emplace_back();

  std::string out;
  for (std::size_t i = 0; i < elements.size(); ++i) {
    if (i > 0) {
      out += "__";
    }
    out += elements[i];
  }
  return out;
}

std::string ui_control_token(
  const std::optional<std::string> & value, const std::optional<std::string> & tag,
  const std::optional<std::string> & name)
{
  if (value) {
    return control_value_token(*value);
  }
  return control_path_token(tag, name);
}

}  // namespace toolxml
