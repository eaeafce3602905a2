// toolxml/codegen/tool_document.cpp - Tool document assembly (tinyxml2)
//
#include "toolxml/codegen/tool_document.hpp"

#include <chrono>
#include <ctime>
#include <fstream>
#include <string>
#include <string_view>

#include "tinyxml2.h"
#include "toolxml/basic/error.hpp"
#include "toolxml/canonical/canonicalizer.hpp"

namespace toolxml
{

namespace
{

tinyxml2::XMLElement * append_node_impl(
  tinyxml2::XMLDocument & doc, tinyxml2::XMLNode * parent, const Node & node)
{
  auto * elem = doc.NewElement(node.tag.c_str());
  for (const auto & attr : node.attributes) {
    elem->SetAttribute(attr.key.c_str(), attr.value.c_str());
  }
  if (node.text.has_value()) {
    elem->SetText(node.text->c_str());
  }
  parent->InsertEndChild(elem);

  for (const auto & child : node.children) {
    append_node_impl(doc, elem, child);
  }
  return elem;
}

}  // namespace

int current_year()
{
  const std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
  std::tm local{};
#ifdef _WIN32
  localtime_s(&local, &now);
#else
  localtime_r(&now, &local);
#endif
  return local.tm_year + 1900;
}

std::string copyright_notice(const DocumentMetadata & meta)
{
  const int year = meta.year.value_or(current_year());
  return "\nCopyright (c) " + std::to_string(year) + ", " + meta.copyright_holder +
         ".\n\nDistributed under the terms of the Modified BSD License. (SPDX: " + meta.license +
         ")\n";
}

std::string provenance_notice(const DocumentMetadata & meta)
{
  return "\nThis tool was automatically generated by:\n    " + meta.generator_name +
         " (version: " + meta.generator_version + ")\nfor:\n    " + meta.target_name +
         " (version: " + meta.target_version + ")\n";
}

std::string ToolDocumentSerializer::serialize(
  const Node & canonical_root, const DocumentMetadata & meta)
{
  Node root = canonical_root;
  root.set_attribute("profile", meta.profile);
  root.set_attribute("license", meta.license);

  tinyxml2::XMLDocument doc;
  doc.InsertEndChild(doc.NewDeclaration(R"(xml version="1.0" encoding="UTF-8")"));
  doc.InsertEndChild(doc.NewComment(copyright_notice(meta).c_str()));
  doc.InsertEndChild(doc.NewComment(provenance_notice(meta).c_str()));
  append_node_impl(doc, &doc, root);

  // XMLPrinter indents nested elements by four spaces per level.
  tinyxml2::XMLPrinter printer;
  doc.Print(&printer);
  return {printer.CStr()};
}

void write_document(const std::filesystem::path & path, std::string_view bytes)
{
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  if (!out.is_open()) {
    throw OutputError("failed to open output file", path);
  }

  out.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
  out.flush();
  if (!out) {
    throw OutputError("failed to write output file", path);
  }
}

void write_tool(
  const Node & raw_root, const DocumentMetadata & meta, const std::filesystem::path & path)
{
  const Node canonical = canonicalize(raw_root);
  write_document(path, ToolDocumentSerializer::serialize(canonical, meta));
}

}  // namespace toolxml
