// authzgen/project/project_config.cpp - Project configuration implementation
//
#include "authzgen/project/project_config.hpp"

#include <yaml-cpp/yaml.h>

#include <string_view>
#include <utility>

#include "authzgen/codegen/naming.hpp"

namespace authzgen
{

namespace
{

/// Reads `key` as a scalar string. Returns false and sets `error` on a non-scalar.
bool read_string(
  const YAML::Node & section, const char * section_name, const char * key, std::string & out,
  std::string & error)
{
  const YAML::Node node = section[key];
  if (!node) {
    return true;
  }
  if (!node.IsScalar()) {
    error = std::string(section_name) + "." + key + " must be a string";
    return false;
  }
  out = node.as<std::string>();
  return true;
}

std::optional<std::string> parse_generator(
  const YAML::Node & gen, const std::filesystem::path & root, GeneratorConfig & config)
{
  if (!gen.IsMap()) {
    return std::string("generator must be a map");
  }

  std::string error;
  std::string value;

  if (gen["schema"]) {
    if (!read_string(gen, "generator", "schema", value, error)) {
      return error;
    }
    config.schema = root / value;
  }

  value.clear();
  if (gen["output_dir"]) {
    if (!read_string(gen, "generator", "output_dir", value, error)) {
      return error;
    }
    config.output_dir = root / value;
  } else {
    config.output_dir = root / config.output_dir;
  }

  if (!read_string(gen, "generator", "default_package", config.default_package, error)) {
    return error;
  }
  if (!codegen::is_identifier(config.default_package)) {
    return "invalid generator.default_package: '" + config.default_package +
           "' (must be an identifier)";
  }

  if (!read_string(gen, "generator", "extension", config.extension, error)) {
    return error;
  }
  if (!codegen::is_file_extension(config.extension)) {
    return "invalid generator.extension: '" + config.extension +
           "' (must be non-empty without path separators)";
  }

  if (gen["format"]) {
    try {
      config.format = gen["format"].as<bool>();
    } catch (const YAML::Exception &) {
      return std::string("generator.format must be a boolean");
    }
  }

  if (gen["template"]) {
    value.clear();
    if (!read_string(gen, "generator", "template", value, error)) {
      return error;
    }
    config.template_path = root / value;
  }

  return std::nullopt;
}

}  // namespace

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

  ProjectConfig config;
  config.project_root = fs::absolute(config_path).parent_path();

  // An empty file is a valid config with all defaults.
  if (root.IsNull()) {
    config.generator.output_dir = config.project_root / config.generator.output_dir;
    return ConfigLoadResult::ok(std::move(config));
  }
  if (!root.IsMap()) {
    return ConfigLoadResult::fail("configuration root must be a map");
  }

  if (root["project"]) {
    const YAML::Node project = root["project"];
    if (!project.IsMap()) {
      return ConfigLoadResult::fail("project must be a map");
    }
    std::string error;
    if (!read_string(project, "project", "name", config.project.name, error)) {
      return ConfigLoadResult::fail(error);
    }
  }

  if (root["generator"]) {
    if (auto error = parse_generator(root["generator"], config.project_root, config.generator)) {
      return ConfigLoadResult::fail(std::move(*error));
    }
  } else {
    config.generator.output_dir = config.project_root / config.generator.output_dir;
  }

  return ConfigLoadResult::ok(std::move(config));
}

std::optional<std::filesystem::path> find_project_config(const std::filesystem::path & start_dir)
{
  namespace fs = std::filesystem;

  fs::path current = fs::absolute(start_dir);

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
      break;
    }
    current = parent;
  }

  return std::nullopt;
}

}  // namespace authzgen
