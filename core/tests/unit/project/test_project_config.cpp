// test_project_config.cpp - authzgen.yaml loading and discovery
//
#include <gtest/gtest.h>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>

#include "authzgen/project/project_config.hpp"

namespace authzgen
{

namespace fs = std::filesystem;

namespace
{

fs::path make_temp_dir(std::string_view prefix)
{
  const auto base = fs::temp_directory_path();
  const auto now = std::chrono::steady_clock::now().time_since_epoch().count();
  const fs::path dir = base / (std::string(prefix) + "_" + std::to_string(now));
  fs::create_directories(dir);
  return dir;
}

fs::path write_config(const fs::path & dir, const std::string & yaml)
{
  const fs::path path = dir / k_project_config_file_name;
  std::ofstream out(path);
  out << yaml;
  return path;
}

ConfigLoadResult load(std::string_view prefix, const std::string & yaml)
{
  return load_project_config(write_config(make_temp_dir(prefix), yaml));
}

}  // namespace

TEST(ProjectConfigTest, FullConfig)
{
  const fs::path dir = make_temp_dir("authzgen_cfg_full");
  const auto result = load_project_config(write_config(dir, R"(
project:
  name: my-service
generator:
  schema: schema/authz.zed
  output_dir: out/gen
  default_package: acme
  extension: h
  format: false
  template: templates/client.tmpl
)"));

  ASSERT_TRUE(result.success) << result.error;
  const ProjectConfig & cfg = result.config;
  EXPECT_EQ(cfg.project.name, "my-service");
  EXPECT_EQ(cfg.project_root, dir);
  ASSERT_TRUE(cfg.generator.schema.has_value());
  EXPECT_EQ(*cfg.generator.schema, dir / "schema/authz.zed");
  EXPECT_EQ(cfg.generator.output_dir, dir / "out/gen");
  EXPECT_EQ(cfg.generator.default_package, "acme");
  EXPECT_EQ(cfg.generator.extension, "h");
  EXPECT_FALSE(cfg.generator.format);
  ASSERT_TRUE(cfg.generator.template_path.has_value());
  EXPECT_EQ(*cfg.generator.template_path, dir / "templates/client.tmpl");
}

TEST(ProjectConfigTest, DefaultsWhenSectionsAreMissing)
{
  const fs::path dir = make_temp_dir("authzgen_cfg_defaults");
  const auto result = load_project_config(write_config(dir, "project:\n  name: bare\n"));

  ASSERT_TRUE(result.success) << result.error;
  const GeneratorConfig & gen = result.config.generator;
  EXPECT_FALSE(gen.schema.has_value());
  EXPECT_EQ(gen.output_dir, dir / "generated");
  EXPECT_EQ(gen.default_package, "authz");
  EXPECT_EQ(gen.extension, "gen.hpp");
  EXPECT_TRUE(gen.format);
  EXPECT_FALSE(gen.template_path.has_value());
}

TEST(ProjectConfigTest, EmptyFileIsValid)
{
  const fs::path dir = make_temp_dir("authzgen_cfg_empty");
  const auto result = load_project_config(write_config(dir, ""));
  ASSERT_TRUE(result.success) << result.error;
  EXPECT_EQ(result.config.generator.output_dir, dir / "generated");
}

TEST(ProjectConfigTest, AbsolutePathsAreKept)
{
  const fs::path elsewhere = make_temp_dir("authzgen_cfg_abs_target");
  const auto result = load(
    "authzgen_cfg_abs", "generator:\n  output_dir: " + (elsewhere / "gen").string() + "\n");
  ASSERT_TRUE(result.success) << result.error;
  EXPECT_EQ(result.config.generator.output_dir, elsewhere / "gen");
}

TEST(ProjectConfigTest, MissingFile)
{
  const auto result = load_project_config(make_temp_dir("authzgen_cfg_missing") / "authzgen.yaml");
  EXPECT_FALSE(result.success);
  EXPECT_EQ(result.error.rfind("configuration file not found: ", 0), 0u);
}

TEST(ProjectConfigTest, InvalidYaml)
{
  const auto result = load("authzgen_cfg_bad_yaml", "generator: [unclosed\n");
  EXPECT_FALSE(result.success);
  EXPECT_EQ(result.error.rfind("failed to parse YAML: ", 0), 0u);
}

TEST(ProjectConfigTest, StructuralErrors)
{
  EXPECT_EQ(load("authzgen_cfg_root", "- a\n- b\n").error, "configuration root must be a map");
  EXPECT_EQ(load("authzgen_cfg_project", "project: text\n").error, "project must be a map");
  EXPECT_EQ(load("authzgen_cfg_generator", "generator: 3\n").error, "generator must be a map");
  EXPECT_EQ(
    load("authzgen_cfg_schema", "generator:\n  schema: [a, b]\n").error,
    "generator.schema must be a string");
}

TEST(ProjectConfigTest, ValidatesGeneratorValues)
{
  EXPECT_EQ(
    load("authzgen_cfg_pkg", "generator:\n  default_package: my-pkg\n").error,
    "invalid generator.default_package: 'my-pkg' (must be an identifier)");
  EXPECT_EQ(
    load("authzgen_cfg_pkg_digit", "generator:\n  default_package: 9lives\n").error,
    "invalid generator.default_package: '9lives' (must be an identifier)");
  EXPECT_EQ(
    load("authzgen_cfg_ext", "generator:\n  extension: gen/hpp\n").error,
    "invalid generator.extension: 'gen/hpp' (must be non-empty without path separators)");
  EXPECT_EQ(
    load("authzgen_cfg_ext_empty", "generator:\n  extension: ''\n").error,
    "invalid generator.extension: '' (must be non-empty without path separators)");
  EXPECT_EQ(
    load("authzgen_cfg_format", "generator:\n  format: sometimes\n").error,
    "generator.format must be a boolean");
}

TEST(ProjectConfigTest, FindSearchesUpward)
{
  const fs::path root = make_temp_dir("authzgen_cfg_find");
  const fs::path nested = root / "a" / "b";
  fs::create_directories(nested);
  const fs::path config = write_config(root, "project:\n  name: found\n");

  const auto found = find_project_config(nested);
  ASSERT_TRUE(found.has_value());
  EXPECT_EQ(fs::weakly_canonical(*found), fs::weakly_canonical(config));

  {
    std::ofstream schema(nested / "schema.zed");
    schema << "definition user {}\n";
  }
  const auto from_file = find_project_config(nested / "schema.zed");
  ASSERT_TRUE(from_file.has_value());
  EXPECT_EQ(fs::weakly_canonical(*from_file), fs::weakly_canonical(config));
}

TEST(ProjectConfigTest, NearestConfigWins)
{
  const fs::path root = make_temp_dir("authzgen_cfg_nearest");
  const fs::path nested = root / "service";
  fs::create_directories(nested);
  write_config(root, "project:\n  name: outer\n");
  const fs::path inner = write_config(nested, "project:\n  name: inner\n");

  const auto found = find_project_config(nested);
  ASSERT_TRUE(found.has_value());
  EXPECT_EQ(fs::weakly_canonical(*found), fs::weakly_canonical(inner));
}

}  // namespace authzgen
