// toolxml/canonical/canonicalizer.cpp - Canonical ordering implementation
//
#include "toolxml/canonical/canonicalizer.hpp"

#include <algorithm>
#include <cstddef>
#include <utility>

namespace toolxml
{

Canonicalizer::Canonicalizer(OrderingPolicy policy) : policy_(std::move(policy)) {}

std::vector<Attribute> Canonicalizer::sort_attributes(
  const std::vector<Attribute> & attributes) const
{
  std::vector<std::pair<std::size_t, const Attribute *>> ranked;
  std::vector<const Attribute *> remaining;

  for (const auto & attr : attributes) {
    if (auto rank = policy_.attributes->rank_of(attr.key)) {
      ranked.emplace_back(*rank, &attr);
    } else {
      remaining.push_back(&attr);
    }
  }

  std::stable_sort(ranked.begin(), ranked.end(), [](const auto & a, const auto & b) {
    return a.first < b.first;
  });
  std::stable_sort(remaining.begin(), remaining.end(), [](const Attribute * a, const Attribute * b) {
    return a->key < b->key;
  });

  std::vector<Attribute> out;
  out.reserve(attributes.size());
  for (const auto & entry : ranked) {
    out.push_back(*entry.second);
  }
  for (const auto * attr : remaining) {
    out.push_back(*attr);
  }
  return out;
}

void Canonicalizer::sort_children(std::vector<Node> & children, const PriorityList & order)
{
  // Every key is looked up before sorting so an unknown tag fails even when
  // there is nothing to reorder.
  std::vector<std::pair<std::size_t, Node>> keyed;
  keyed.reserve(children.size());
  for (auto & child : children) {
    const std::size_t rank = order.require_rank(child.tag);
    keyed.emplace_back(rank, std::move(child));
  }

  std::stable_sort(keyed.begin(), keyed.end(), [](const auto & a, const auto & b) {
    return a.first < b.first;
  });

  children.clear();
  for (auto & entry : keyed) {
    children.push_back(std::move(entry.second));
  }
}

Node Canonicalizer::canonicalize_descendant(const Node & node) const
{
  Node out;
  out.tag = node.tag;
  out.text = node.text;
  out.attributes = sort_attributes(node.attributes);

  out.children.reserve(node.children.size());
  for (const auto & child : node.children) {
    out.children.push_back(canonicalize_descendant(child));
  }

  const auto nested = policy_.nested_children.find(node.tag);
  if (nested != policy_.nested_children.end() && nested->second != nullptr) {
    sort_children(out.children, *nested->second);
  }
  return out;
}

Node Canonicalizer::canonicalize(const Node & root) const
{
  Node out;
  out.tag = root.tag;
  out.text = root.text;
  out.attributes = sort_attributes(root.attributes);

  out.children.reserve(root.children.size());
  for (const auto & child : root.children) {
    out.children.push_back(canonicalize_descendant(child));
  }

  if (policy_.root_children != nullptr) {
    sort_children(out.children, *policy_.root_children);
  }
  return out;
}

bool Canonicalizer::is_canonical(const Node & root) const { return canonicalize(root) == root; }

Node canonicalize(const Node & root)
{
  static const Canonicalizer canonicalizer;
  return canonicalizer.canonicalize(root);
}

}  // namespace toolxml
