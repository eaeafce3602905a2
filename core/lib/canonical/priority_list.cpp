// toolxml/canonical/priority_list.cpp
//
#include "toolxml/canonical/priority_list.hpp"

#include <stdexcept>
#include <utility>

#include "toolxml/basic/error.hpp"

namespace toolxml
{

PriorityList::PriorityList(std::string label, std::initializer_list<std::string_view> names)
: label_(std::move(label))
{
  names_.reserve(names.size());
  ranks_.reserve(names.size());
  for (const auto name : names) {
    const auto inserted = ranks_.emplace(std::string(name), names_.size()).second;
    if (!inserted) {
      throw std::invalid_argument(
        "duplicate entry '" + std::string(name) + "' in " + label_ + " order");
    }
    names_.emplace_back(name);
  }
}

std::optional<std::size_t> PriorityList::rank_of(std::string_view name) const
{
  const auto it = ranks_.find(std::string(name));
  if (it == ranks_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::size_t PriorityList::require_rank(std::string_view name) const
{
  if (auto rank = rank_of(name)) {
    return *rank;
  }
  throw SchemaOrderError(std::string(name), label_);
}

const PriorityList & tool_section_order()
{
  static const PriorityList list(
    "tool section",
    {"description", "macros", "edam_topics", "edam_operations", "parallelism", "requirements",
     "code", "stdio", "version_command", "command", "environment_variables", "configfiles",
     "inputs", "request_param_translation", "outputs", "tests", "help", "citations"});
  return list;
}

const PriorityList & attribute_order()
{
  static const PriorityList list(
    "attribute",
    {"name", "argument", "type", "format", "min", "truevalue", "max", "falsevalue", "value",
     "checked", "optional", "label", "help"});
  return list;
}

}  // namespace toolxml
