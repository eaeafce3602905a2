#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <system_error>
#include <utility>

#include "toolxml/basic/error.hpp"
#include "toolxml/canonical/canonicalizer.hpp"
#include "toolxml/codec/escape_codec.hpp"
#include "toolxml/codegen/tool_document.hpp"
#include "toolxml/model/tool_node.hpp"

using namespace toolxml;

namespace fs = std::filesystem;

static void expect_contains(const std::string & haystack, const std::string & needle)
{
  EXPECT_NE(haystack.find(needle), std::string::npos)
    << "Expected to find: " << needle << "\nIn output:\n"
    << haystack;
}

namespace
{

DocumentMetadata pinned_metadata()
{
  DocumentMetadata meta;
  meta.generator_version = "0.1.0";
  meta.target_version = "2021.2.0";
  meta.year = 2021;
  return meta;
}

Node description_and_inputs()
{
  Node root = make_node("tool");
  root.append_child(make_node("inputs", std::nullopt, {{"name", "x"}}));
  root.append_child(make_node("description", std::string("Do a thing")));
  return root;
}

std::string read_file(const fs::path & p)
{
  std::ifstream in(p, std::ios::binary);
  std::ostringstream ss;
  ss << in.rdbuf();
  return ss.str();
}

struct TempDir
{
  fs::path path;
  explicit TempDir(fs::path p) : path(std::move(p))
  {
    std::error_code ec;
    fs::remove_all(path, ec);
    fs::create_directories(path);
  }
  ~TempDir()
  {
    std::error_code ec;
    fs::remove_all(path, ec);
  }
  TempDir(const TempDir &) = delete;
  TempDir & operator=(const TempDir &) = delete;
};

}  // namespace

TEST(ToolDocument, CopyrightNoticeUsesPinnedYear)
{
  EXPECT_EQ(
    copyright_notice(pinned_metadata()),
    "\nCopyright (c) 2021, QIIME 2 development team.\n\n"
    "Distributed under the terms of the Modified BSD License. (SPDX: BSD-3-Clause)\n");
}

TEST(ToolDocument, CopyrightNoticeDefaultsToCurrentYear)
{
  DocumentMetadata meta;
  expect_contains(copyright_notice(meta), "Copyright (c) " + std::to_string(current_year()));
  EXPECT_GE(current_year(), 2021);
}

TEST(ToolDocument, ProvenanceNotice)
{
  EXPECT_EQ(
    provenance_notice(pinned_metadata()),
    "\nThis tool was automatically generated by:\n"
    "    q2galaxy (version: 0.1.0)\n"
    "for:\n"
    "    qiime2 (version: 2021.2.0)\n");
}

TEST(ToolDocument, SerializesEndToEnd)
{
  const Node canonical = canonicalize(description_and_inputs());
  const std::string xml = ToolDocumentSerializer::serialize(canonical, pinned_metadata());

  EXPECT_EQ(
    xml,
    "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n"
    "<!--\n"
    "Copyright (c) 2021, QIIME 2 development team.\n"
    "\n"
    "Distributed under the terms of the Modified BSD License. (SPDX: BSD-3-Clause)\n"
    "-->\n"
    "<!--\n"
    "This tool was automatically generated by:\n"
    "    q2galaxy (version: 0.1.0)\n"
    "for:\n"
    "    qiime2 (version: 2021.2.0)\n"
    "-->\n"
    "<tool profile=\"20.09\" license=\"BSD-3-Clause\">\n"
    "    <description>Do a thing</description>\n"
    "    <inputs name=\"x\"/>\n"
    "</tool>\n");
}

TEST(ToolDocument, LayoutOrderHoldsWithUnpinnedYear)
{
  const Node canonical = canonicalize(description_and_inputs());
  const std::string xml = ToolDocumentSerializer::serialize(canonical, DocumentMetadata{});

  const auto decl = xml.find("<?xml");
  const auto first_comment = xml.find("<!--");
  const auto second_comment = xml.find("<!--", first_comment + 1);
  const auto root = xml.find("<tool profile=\"20.09\" license=\"BSD-3-Clause\">");
  const auto description = xml.find("<description>");
  const auto inputs = xml.find("<inputs");

  EXPECT_EQ(decl, 0U);
  ASSERT_NE(second_comment, std::string::npos);
  ASSERT_NE(root, std::string::npos);
  EXPECT_LT(first_comment, second_comment);
  EXPECT_LT(second_comment, root);
  EXPECT_LT(root, description);
  EXPECT_LT(description, inputs);
}

TEST(ToolDocument, NestedElementsIndentByFourSpaces)
{
  Node root = make_node("tool", std::nullopt, {{"name", "X"}, {"id", "x"}});
  root.append_child(make_node("inputs"))
    .append_child(make_node("param", std::nullopt, {{"name", "a"}, {"type", "text"}}));

  const std::string xml =
    ToolDocumentSerializer::serialize(canonicalize(root), pinned_metadata());
  expect_contains(xml, "<tool name=\"X\" id=\"x\" profile=\"20.09\" license=\"BSD-3-Clause\">\n");
  expect_contains(xml, "\n    <inputs>\n        <param name=\"a\" type=\"text\"/>\n    </inputs>\n");
}

TEST(ToolDocument, ExistingProfileIsReplacedInPlace)
{
  const Node root =
    make_node("tool", std::nullopt, {{"id", "x"}, {"profile", "16.04"}, {"version", "1"}});
  const std::string xml =
    ToolDocumentSerializer::serialize(canonicalize(root), pinned_metadata());
  expect_contains(xml, "<tool id=\"x\" profile=\"20.09\" version=\"1\" license=\"BSD-3-Clause\"");
}

TEST(ToolDocument, MetadataOverridesRootAttributes)
{
  DocumentMetadata meta = pinned_metadata();
  meta.profile = "21.01";
  meta.license = "MIT";
  const std::string xml = ToolDocumentSerializer::serialize(make_node("tool"), meta);
  expect_contains(xml, "<tool profile=\"21.01\" license=\"MIT\"/>");
  expect_contains(xml, "(SPDX: MIT)");
}

TEST(ToolDocument, EscapedValuesSurviveSerialization)
{
  Node root = make_node("tool");
  root.append_child(make_node("inputs"))
    .append_child(make_node(
      "param", std::nullopt,
      {{"name", "metric"}, {"value", encode(ScalarValue::make_text("a,b"))}}));
  root.append_child(make_node("command", std::string("run < in > out")));

  const std::string xml =
    ToolDocumentSerializer::serialize(canonicalize(root), pinned_metadata());
  expect_contains(xml, "value=\"a__comma__b\"");
  expect_contains(xml, "<command>run &lt; in &gt; out</command>");
}

TEST(ToolDocument, SerializationIsDeterministic)
{
  const Node canonical = canonicalize(description_and_inputs());
  EXPECT_EQ(
    ToolDocumentSerializer::serialize(canonical, pinned_metadata()),
    ToolDocumentSerializer::serialize(canonical, pinned_metadata()));
}

TEST(ToolDocument, WriteDocumentWritesBytes)
{
  const TempDir dir(fs::temp_directory_path() / "toolxml_write_document");
  const fs::path out = dir.path / "tool.xml";
  write_document(out, "<tool/>\n");
  EXPECT_EQ(read_file(out), "<tool/>\n");

  // Overwrites rather than appends
  write_document(out, "<x/>\n");
  EXPECT_EQ(read_file(out), "<x/>\n");
}

TEST(ToolDocument, WriteDocumentReportsUnopenablePath)
{
  const TempDir dir(fs::temp_directory_path() / "toolxml_write_document_unopenable");
  const fs::path out = dir.path / "missing" / "dir" / "tool.xml";
  try {
    write_document(out, "<tool/>\n");
    FAIL() << "expected OutputError";
  } catch (const OutputError & e) {
    EXPECT_EQ(e.path(), out);
  }
}

TEST(ToolDocument, WriteToolCanonicalizesBeforeWriting)
{
  const TempDir dir(fs::temp_directory_path() / "toolxml_write_tool");
  const fs::path out = dir.path / "tool.xml";
  write_tool(description_and_inputs(), pinned_metadata(), out);

  const std::string xml = read_file(out);
  EXPECT_EQ(xml, ToolDocumentSerializer::serialize(
                   canonicalize(description_and_inputs()), pinned_metadata()));
}

TEST(ToolDocument, WriteToolFailsBeforeTouchingTheFile)
{
  const TempDir dir(fs::temp_directory_path() / "toolxml_write_tool_fails");
  const fs::path out = dir.path / "tool.xml";

  Node root = make_node("tool");
  root.append_child(make_node("foobar"));
  EXPECT_THROW(write_tool(root, pinned_metadata(), out), SchemaOrderError);
  EXPECT_FALSE(fs::exists(out));
}
