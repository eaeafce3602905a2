// toolxml/driver/generator.cpp - Generation driver implementation
//
#include "toolxml/driver/generator.hpp"

#include <fmt/core.h>

#include <cstdio>
#include <exception>
#include <string>
#include <system_error>
#include <vector>

#include "toolxml/basic/error.hpp"
#include "toolxml/canonical/priority_list.hpp"
#include "toolxml/io/tool_json.hpp"

namespace toolxml
{

namespace
{

std::string join_names(const std::vector<std::string> & names)
{
  std::string out;
  for (const auto & name : names) {
    if (!out.empty()) {
      out += ", ";
    }
    out += name;
  }
  return out;
}

}  // namespace

std::filesystem::path Generator::output_name_for(const std::filesystem::path & tree_file)
{
  std::filesystem::path name = tree_file.filename();
  name.replace_extension(".xml");
  return name;
}

bool Generator::generate_one(
  const std::filesystem::path & tree_file, const std::filesystem::path & output_file,
  const DocumentMetadata & meta, const GenerateOptions & options, GenerateResult & result)
{
  const std::string where = tree_file.string();

  if (options.verbose) {
    fmt::print(stderr, "Generating: {} -> {}\n", where, output_file.string());
  }

  try {
    const Node raw = load_tree_file(tree_file);
    write_tool(raw, meta, output_file);
  } catch (const UnsupportedValueError & e) {
    result.diagnostics.report_error(e.what())
      .with_code(diag_code::k_unsupported_value)
      .with_file(where)
      .with_help("values must be strings, null, true or false");
    return false;
  } catch (const SchemaOrderError & e) {
    result.diagnostics.report_error(e.what())
      .with_code(diag_code::k_unknown_section)
      .with_file(where)
      .with_help(fmt::format(
        "{} tags must be one of: {}", tool_section_order().label(),
        join_names(tool_section_order().names())));
    return false;
  } catch (const OutputError & e) {
    result.diagnostics.report_error(e.what())
      .with_code(diag_code::k_output_failure)
      .with_file(output_file.string());
    return false;
  } catch (const TreeFormatError & e) {
    result.diagnostics.report_error(e.what())
      .with_code(diag_code::k_malformed_tree)
      .with_file(where);
    return false;
  }

  result.generated_files.push_back(output_file);
  return true;
}

GenerateResult Generator::generate_file(
  const std::filesystem::path & tree_file, const std::filesystem::path & output_file,
  const DocumentMetadata & meta, const GenerateOptions & options)
{
  GenerateResult result;
  generate_one(tree_file, output_file, meta, options, result);
  result.success = !result.diagnostics.has_errors();
  return result;
}

GenerateResult Generator::generate_project(
  const ProjectConfig & config, const GenerateOptions & options)
{
  namespace fs = std::filesystem;

  GenerateResult result;

  fs::path output_dir = options.output_dir.value_or(config.output.directory);
  if (output_dir.is_relative()) {
    output_dir = config.project_root / output_dir;
  }

  std::error_code ec;
  fs::create_directories(output_dir, ec);
  if (ec) {
    result.diagnostics.report_error("failed to create output directory: " + ec.message())
      .with_code(diag_code::k_output_failure)
      .with_file(output_dir.string());
    return result;
  }

  if (config.tools.empty()) {
    result.diagnostics.report_warning("no tools listed in configuration")
      .with_code(diag_code::k_config_error);
  }

  for (const auto & entry : config.tools) {
    const fs::path tree_file = entry.is_relative() ? config.project_root / entry : entry;
    generate_one(
      tree_file, output_dir / output_name_for(tree_file), config.metadata, options, result);
  }

  result.success = !result.diagnostics.has_errors();
  return result;
}

}  // namespace toolxml
