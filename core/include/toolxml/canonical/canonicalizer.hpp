// toolxml/canonical/canonicalizer.hpp - Deterministic ordering of a tool tree
//
// Produces the one canonical layout of a tree: attributes ordered by a
// priority list then alphabetically at every depth, and the root's
// children ordered by the tool section list.
//
#pragma once

#include <string>
#include <unordered_map>
#include <vector>

#include "toolxml/canonical/priority_list.hpp"
#include "toolxml/model/tool_node.hpp"

namespace toolxml
{

/**
 * Which priority lists apply where.
 *
 * Below the root, children keep their input order unless a list is
 * registered for the parent's tag in `nested_children`.
 */
struct OrderingPolicy
{
  const PriorityList * attributes = &attribute_order();
  const PriorityList * root_children = &tool_section_order();
  std::unordered_map<std::string, const PriorityList *> nested_children;

  /// Policy used for generated tool documents.
  [[nodiscard]] static OrderingPolicy tool_default() { return OrderingPolicy{}; }
};

class Canonicalizer
{
public:
  explicit Canonicalizer(OrderingPolicy policy = OrderingPolicy::tool_default());

  /**
   * Return the canonical copy of a tree rooted at `root`.
   *
   * @throws SchemaOrderError if a child at a tag-ordered level is not on
   *         that level's list
   */
  [[nodiscard]] Node canonicalize(const Node & root) const;

  /// Attributes in canonical order (priority group first, then alphabetical).
  [[nodiscard]] std::vector<Attribute> sort_attributes(
    const std::vector<Attribute> & attributes) const;

  /// True if canonicalize(root) would return an identical tree.
  [[nodiscard]] bool is_canonical(const Node & root) const;

private:
  [[nodiscard]] Node canonicalize_descendant(const Node & node) const;

  static void sort_children(std::vector<Node> & children, const PriorityList & order);

  OrderingPolicy policy_;
};

/// Canonicalize with the default tool policy.
[[nodiscard]] Node canonicalize(const Node & root);

}  // namespace toolxml
