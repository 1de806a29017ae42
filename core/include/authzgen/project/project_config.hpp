// authzgen/project/project_config.hpp - Project configuration (authzgen.yaml)
//
// Parses and validates authzgen.yaml. Relative paths are resolved against
// the directory containing the file.
//
#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <utility>

namespace authzgen
{

// ============================================================================
// Configuration Structures
// ============================================================================

struct GeneratorConfig
{
  /// Schema file or directory of `*.zed` files
  std::optional<std::filesystem::path> schema;

  /// Output directory for the generated header
  std::filesystem::path output_dir = "generated";

  /// Package for definitions without a prefix
  std::string default_package = "authz";

  /// Generated file extension, without the leading dot
  std::string extension = "gen.hpp";

  bool format = true;

  /// Custom template file
  std::optional<std::filesystem::path> template_path;
};

struct ProjectInfo
{
  std::string name;
};

/**
 * Complete project configuration (authzgen.yaml).
 */
struct ProjectConfig
{
  ProjectInfo project;
  GeneratorConfig generator;

  /// Directory containing authzgen.yaml
  std::filesystem::path project_root;
};

// ============================================================================
// Configuration Loading Result
// ============================================================================

struct ConfigLoadResult
{
  /// Loaded configuration (only valid if success == true)
  ProjectConfig config;

  bool success = false;

  /// Error message if loading failed
  std::string error;

  static ConfigLoadResult ok(ProjectConfig cfg)
  {
    ConfigLoadResult r;
    r.config = std::move(cfg);
    r.success = true;
    return r;
  }

  static ConfigLoadResult fail(std::string msg)
  {
    ConfigLoadResult r;
    r.error = std::move(msg);
    r.success = false;
    return r;
  }
};

// ============================================================================
// Configuration Loading API
// ============================================================================

/**
 * Load a project configuration from an authzgen.yaml file.
 *
 * @param config_path Path to authzgen.yaml
 * @return ConfigLoadResult with the loaded config or error message
 */
[[nodiscard]] ConfigLoadResult load_project_config(const std::filesystem::path & config_path);

/**
 * Search for authzgen.yaml from start_dir upward to the filesystem root.
 */
[[nodiscard]] std::optional<std::filesystem::path> find_project_config(
  const std::filesystem::path & start_dir);

inline constexpr const char * k_project_config_file_name = "authzgen.yaml";

}  // namespace authzgen
