// toolxml/project/project_config.cpp - Project configuration implementation
//
#include "toolxml/project/project_config.hpp"

#include <yaml-cpp/yaml.h>

#include <optional>
#include <string>
#include <utility>

namespace toolxml
{

namespace
{

/// Copy a scalar string field if present; false if it is not a scalar.
bool read_string(const YAML::Node & section, const char * key, std::string & out)
{
  const YAML::Node node = section[key];
  if (!node) {
    return true;
  }
  if (!node.IsScalar()) {
    return false;
  }
  out = node.as<std::string>();
  return true;
}

std::optional<std::string> parse_metadata(const YAML::Node & node, DocumentMetadata & meta)
{
  if (!node.IsMap()) {
    return std::string("metadata must be a map");
  }

  const struct
  {
    const char * key;
    std::string * field;
  } fields[] = {
    {"generator_name", &meta.generator_name},
    {"generator_version", &meta.generator_version},
    {"target_name", &meta.target_name},
    {"target_version", &meta.target_version},
    {"profile", &meta.profile},
    {"license", &meta.license},
    {"copyright_holder", &meta.copyright_holder},
  };

  for (const auto & f : fields) {
    if (!read_string(node, f.key, *f.field)) {
      return "metadata." + std::string(f.key) + " must be a string";
    }
  }

  if (node["year"]) {
    try {
      meta.year = node["year"].as<int>();
    } catch (const YAML::BadConversion &) {
      return std::string("metadata.year must be an integer");
    }
  }

  return std::nullopt;
}

ConfigLoadResult parse_config_root(YAML::Node root, const std::filesystem::path & project_root)
{
  if (root.IsNull()) {
    root = YAML::Node(YAML::NodeType::Map);
  }
  if (!root.IsMap()) {
    return ConfigLoadResult::fail("configuration root must be a map");
  }

  ProjectConfig config;
  config.project_root = project_root;

  // Parse 'metadata' section
  if (root["metadata"]) {
    if (auto err = parse_metadata(root["metadata"], config.metadata)) {
      return ConfigLoadResult::fail(*err);
    }
  }

  // Parse 'output' section
  if (root["output"]) {
    const auto & out = root["output"];
    if (!out.IsMap()) {
      return ConfigLoadResult::fail("output must be a map");
    }
    std::string dir;
    if (!read_string(out, "directory", dir)) {
      return ConfigLoadResult::fail("output.directory must be a string");
    }
    if (!dir.empty()) {
      config.output.directory = dir;
    }
  }

  // Parse 'tools' section
  if (root["tools"]) {
    if (!root["tools"].IsSequence()) {
      return ConfigLoadResult::fail("tools must be a list");
    }
    for (const auto & entry : root["tools"]) {
      if (!entry.IsScalar()) {
        return ConfigLoadResult::fail("tools entries must be file paths");
      }
      config.tools.emplace_back(entry.as<std::string>());
    }
  }

  return ConfigLoadResult::ok(std::move(config));
}

}  // namespace

ConfigLoadResult parse_project_config(
  const std::string & yaml_text, const std::filesystem::path & project_root)
{
  YAML::Node root;
  try {
    root = YAML::Load(yaml_text);
  } catch (const YAML::Exception & e) {
    return ConfigLoadResult::fail("failed to parse YAML: " + std::string(e.what()));
  }
  return parse_config_root(root, project_root);
}

ConfigLoadResult load_project_config(const std::filesystem::path & config_path)
{
  namespace fs = std::filesystem;

  if (!fs::exists(config_path)) {
    return ConfigLoadResult::fail("configuration file not found: " + config_path.string());
  }

  YAML::Node root;
  try {
    root = YAML::LoadFile(config_path.string());
  } catch (const YAML::Exception & e) {
    return ConfigLoadResult::fail("failed to parse YAML: " + std::string(e.what()));
  }

  return parse_config_root(root, fs::absolute(config_path).parent_path());
}

std::optional<std::filesystem::path> find_project_config(const std::filesystem::path & start_dir)
{
  namespace fs = std::filesystem;

  fs::path current = fs::absolute(start_dir);

  // If start_dir is a file, start from its parent
  if (fs::is_regular_file(current)) {
    current = current.parent_path();
  }

  while (true) {
    fs::path candidate = current / k_project_config_file_name;
    if (fs::exists(candidate)) {
      return candidate;
    }

    const fs::path parent = current.parent_path();
    if (parent == current) {
      // Reached filesystem root
      break;
    }
    current = parent;
  }

  return std::nullopt;
}

}  // namespace toolxml
