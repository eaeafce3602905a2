#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "toolxml/basic/error.hpp"
#include "toolxml/canonical/canonicalizer.hpp"
#include "toolxml/canonical/priority_list.hpp"
#include "toolxml/model/tool_node.hpp"

using namespace toolxml;

namespace
{

std::vector<std::string> attribute_keys(const Node & n)
{
  std::vector<std::string> keys;
  for (const auto & a : n.attributes) {
    keys.push_back(a.key);
  }
  return keys;
}

std::vector<std::string> child_tags(const Node & n)
{
  std::vector<std::string> tags;
  for (const auto & c : n.children) {
    tags.push_back(c.tag);
  }
  return tags;
}

Node sample_tool()
{
  Node tool = make_node("tool", std::nullopt, {{"version", "2021.2"}, {"id", "x"}, {"name", "X"}});

  Node outputs = make_node("outputs");
  outputs.append_child(make_node("data", std::nullopt, {{"format", "qza"}, {"name", "out"}}));
  tool.append_child(std::move(outputs));

  Node inputs = make_node("inputs");
  inputs.append_child(make_node(
    "param", std::nullopt,
    {{"optional", "true"}, {"type", "integer"}, {"label", "n"}, {"name", "n"}, {"min", "1"}}));
  inputs.append_child(make_node(
    "param", std::nullopt, {{"zeta", "1"}, {"alpha", "2"}, {"help", "h"}, {"argument", "--a"}}));
  tool.append_child(std::move(inputs));

  tool.append_child(make_node("command", std::string("q2galaxy run x")));
  tool.append_child(make_node("description", std::string("Do a thing")));
  return tool;
}

}  // namespace

TEST(Canonicalizer, OrdersPriorityAttributesThenAlphabetical)
{
  Node root = make_node("tool");
  root.append_child(make_node("inputs"))
    .append_child(make_node(
      "param", std::nullopt, {{"help", "h"}, {"name", "n"}, {"zzz", "z"}, {"argument", "a"}}));

  const Node c = canonicalize(root);
  const Node & param = c.children.at(0).children.at(0);
  EXPECT_EQ(attribute_keys(param), (std::vector<std::string>{"name", "argument", "help", "zzz"}));
}

TEST(Canonicalizer, SortAttributesFollowsFullPriorityList)
{
  const Canonicalizer canon;
  const std::vector<Attribute> attrs = {
    {"help", ""},     {"label", ""}, {"optional", ""},  {"checked", ""}, {"value", ""},
    {"falsevalue", ""}, {"max", ""}, {"truevalue", ""}, {"min", ""},     {"format", ""},
    {"type", ""},     {"argument", ""}, {"name", ""},   {"b", ""},       {"a", ""}};

  std::vector<std::string> keys;
  for (const auto & a : canon.sort_attributes(attrs)) {
    keys.push_back(a.key);
  }
  EXPECT_EQ(
    keys, (std::vector<std::string>{
            "name", "argument", "type", "format", "min", "truevalue", "max", "falsevalue", "value",
            "checked", "optional", "label", "help", "a", "b"}));
}

TEST(Canonicalizer, AttributeValuesTravelWithKeys)
{
  const Node root = canonicalize(make_node("tool", std::nullopt, {{"zzz", "1"}, {"name", "2"}}));
  ASSERT_EQ(root.attributes.size(), 2U);
  EXPECT_EQ(root.attributes[0], (Attribute{"name", "2"}));
  EXPECT_EQ(root.attributes[1], (Attribute{"zzz", "1"}));
}

TEST(Canonicalizer, OrdersRootSections)
{
  Node root = make_node("tool");
  root.append_child(make_node("outputs"));
  root.append_child(make_node("description"));
  root.append_child(make_node("code"));

  const Node c = canonicalize(root);
  EXPECT_EQ(child_tags(c), (std::vector<std::string>{"description", "code", "outputs"}));
}

TEST(Canonicalizer, FullSectionListIsRespected)
{
  Node root = make_node("tool");
  const auto & names = tool_section_order().names();
  for (auto it = names.rbegin(); it != names.rend(); ++it) {
    root.append_child(make_node(*it));
  }

  const Node c = canonicalize(root);
  EXPECT_EQ(child_tags(c), names);
}

TEST(Canonicalizer, RepeatedSectionsKeepRelativeOrder)
{
  Node root = make_node("tool");
  root.append_child(make_node("help", std::string("second")));
  root.append_child(make_node("description"));
  root.append_child(make_node("help", std::string("first-in-input")));

  const Node c = canonicalize(root);
  ASSERT_EQ(child_tags(c), (std::vector<std::string>{"description", "help", "help"}));
  EXPECT_EQ(c.children[1].text, std::optional<std::string>("second"));
  EXPECT_EQ(c.children[2].text, std::optional<std::string>("first-in-input"));
}

TEST(Canonicalizer, UnknownRootSectionFailsFast)
{
  Node root = make_node("tool");
  root.append_child(make_node("description"));
  root.append_child(make_node("foobar"));

  try {
    (void)canonicalize(root);
    FAIL() << "expected SchemaOrderError";
  } catch (const SchemaOrderError & e) {
    EXPECT_EQ(e.tag(), "foobar");
    EXPECT_NE(std::string(e.what()).find("foobar"), std::string::npos);
  }
}

TEST(Canonicalizer, UnknownRootSectionFailsEvenWhenAlone)
{
  Node root = make_node("tool");
  root.append_child(make_node("foobar"));
  EXPECT_THROW((void)canonicalize(root), SchemaOrderError);
}

TEST(Canonicalizer, UnknownAttributeIsNeverFatal)
{
  const Node root = make_node("tool", std::nullopt, {{"completely-unknown", "x"}});
  EXPECT_NO_THROW((void)canonicalize(root));
}

TEST(Canonicalizer, NestedChildrenKeepInputOrder)
{
  Node root = make_node("tool");
  Node & inputs = root.append_child(make_node("inputs"));
  inputs.append_child(make_node("param", std::nullopt, {{"name", "b"}}));
  inputs.append_child(make_node("foobar"));
  inputs.append_child(make_node("param", std::nullopt, {{"name", "a"}}));

  const Node c = canonicalize(root);
  EXPECT_EQ(child_tags(c.children[0]), (std::vector<std::string>{"param", "foobar", "param"}));
  EXPECT_EQ(*c.children[0].children[0].find_attribute("name"), "b");
}

TEST(Canonicalizer, AttributeRuleAppliesAtEveryDepth)
{
  const Node c = canonicalize(sample_tool());

  ASSERT_EQ(child_tags(c), (std::vector<std::string>{"description", "command", "inputs", "outputs"}));
  EXPECT_EQ(attribute_keys(c), (std::vector<std::string>{"name", "id", "version"}));

  const Node & inputs = c.children[2];
  EXPECT_EQ(
    attribute_keys(inputs.children[0]),
    (std::vector<std::string>{"name", "type", "min", "optional", "label"}));
  EXPECT_EQ(
    attribute_keys(inputs.children[1]),
    (std::vector<std::string>{"argument", "help", "alpha", "zeta"}));

  const Node & data = c.children[3].children[0];
  EXPECT_EQ(attribute_keys(data), (std::vector<std::string>{"name", "format"}));
}

TEST(Canonicalizer, TextAndTagsAreCarriedThrough)
{
  const Node c = canonicalize(sample_tool());
  EXPECT_EQ(c.tag, "tool");
  EXPECT_EQ(c.children[0].text, std::optional<std::string>("Do a thing"));
  EXPECT_EQ(c.children[1].text, std::optional<std::string>("q2galaxy run x"));
  EXPECT_FALSE(c.children[2].text.has_value());
}

TEST(Canonicalizer, IsIdempotent)
{
  const Node once = canonicalize(sample_tool());
  const Node twice = canonicalize(once);
  EXPECT_EQ(once, twice);
  EXPECT_TRUE(Canonicalizer().is_canonical(once));
  EXPECT_FALSE(Canonicalizer().is_canonical(sample_tool()));
}

TEST(Canonicalizer, DoesNotModifyInput)
{
  const Node raw = sample_tool();
  const Node copy = raw;
  (void)canonicalize(raw);
  EXPECT_EQ(raw, copy);
}

TEST(Canonicalizer, NestedPolicyOrdersRegisteredParents)
{
  const PriorityList conditional_order("conditional", {"param", "when"});

  OrderingPolicy policy;
  policy.nested_children["conditional"] = &conditional_order;
  const Canonicalizer canon(policy);

  Node root = make_node("tool");
  Node & cond = root.append_child(make_node("inputs")).append_child(make_node("conditional"));
  cond.append_child(make_node("when", std::nullopt, {{"value", "a"}}));
  cond.append_child(make_node("param", std::nullopt, {{"name", "select"}}));
  cond.append_child(make_node("when", std::nullopt, {{"value", "b"}}));

  const Node c = canon.canonicalize(root);
  const Node & out = c.children[0].children[0];
  EXPECT_EQ(child_tags(out), (std::vector<std::string>{"param", "when", "when"}));
  EXPECT_EQ(*out.children[1].find_attribute("value"), "a");

  cond.append_child(make_node("section"));
  EXPECT_THROW((void)canon.canonicalize(root), SchemaOrderError);
}

TEST(Canonicalizer, RootOrderingCanBeDisabled)
{
  OrderingPolicy policy;
  policy.root_children = nullptr;
  const Canonicalizer canon(policy);

  Node root = make_node("macros");
  root.append_child(make_node("xml"));
  root.append_child(make_node("token"));
  EXPECT_EQ(child_tags(canon.canonicalize(root)), (std::vector<std::string>{"xml", "token"}));
}

TEST(PriorityList, RanksAndLookupFailure)
{
  const PriorityList list("test", {"a", "b", "c"});
  EXPECT_EQ(list.rank_of("a"), std::optional<std::size_t>(0));
  EXPECT_EQ(list.rank_of("c"), std::optional<std::size_t>(2));
  EXPECT_FALSE(list.rank_of("d").has_value());
  EXPECT_EQ(list.require_rank("b"), 1U);
  EXPECT_THROW((void)list.require_rank("d"), SchemaOrderError);
  EXPECT_TRUE(list.contains("a"));
  EXPECT_EQ(list.size(), 3U);
}

TEST(PriorityList, RejectsDuplicates)
{
  EXPECT_THROW(PriorityList("dup", {"a", "a"}), std::invalid_argument);
}

TEST(PriorityList, BuiltinLists)
{
  EXPECT_EQ(tool_section_order().label(), "tool section");
  EXPECT_EQ(attribute_order().label(), "attribute");
  EXPECT_EQ(tool_section_order().size(), 18U);
  EXPECT_EQ(tool_section_order().names().front(), "description");
  EXPECT_EQ(tool_section_order().names().back(), "citations");
  EXPECT_EQ(attribute_order().size(), 13U);
  EXPECT_EQ(attribute_order().names().front(), "name");
  EXPECT_EQ(attribute_order().names().back(), "help");
}
