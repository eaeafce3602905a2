// toolxml/canonical/priority_list.hpp - Fixed orderings of names
//
// A priority list is a closed, ordered enumeration of recognized names
// (attribute names or element tags). Its rank map is the single lookup
// path used by the canonicalizer.
//
#pragma once

#include <cstddef>
#include <initializer_list>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace toolxml
{

class PriorityList
{
public:
  /**
   * @param label Human-readable name used in lookup errors (e.g. "tool section")
   * @param names Ordered names; must not contain duplicates
   */
  PriorityList(std::string label, std::initializer_list<std::string_view> names);

  /// Position of a name, or std::nullopt if it is not on the list.
  [[nodiscard]] std::optional<std::size_t> rank_of(std::string_view name) const;

  /// Position of a name. Throws SchemaOrderError if it is not on the list.
  [[nodiscard]] std::size_t require_rank(std::string_view name) const;

  [[nodiscard]] bool contains(std::string_view name) const { return rank_of(name).has_value(); }

  [[nodiscard]] const std::string & label() const noexcept { return label_; }
  [[nodiscard]] const std::vector<std::string> & names() const noexcept { return names_; }
  [[nodiscard]] std::size_t size() const noexcept { return names_.size(); }

private:
  std::string label_;
  std::vector<std::string> names_;
  std::unordered_map<std::string, std::size_t> ranks_;
};

/// Canonical order of direct children of the <tool> root.
[[nodiscard]] const PriorityList & tool_section_order();

/// Canonical order of well-known attributes; others sort alphabetically after.
[[nodiscard]] const PriorityList & attribute_order();

}  // namespace toolxml
