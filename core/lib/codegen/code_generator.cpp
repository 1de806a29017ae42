// authzgen/codegen/code_generator.cpp
#include "authzgen/codegen/code_generator.hpp"

#include <fmt/core.h>

#include <algorithm>
#include <map>
#include <utility>
#include <vector>

#include "authzgen/codegen/naming.hpp"

namespace authzgen::codegen
{

namespace
{

// Name -> first owner; a second owner for the same name is a collision.
class NameClaims
{
public:
  explicit NameClaims(std::string_view what) : what_(what) {}

  void claim(const std::string & name, const std::string & owner)
  {
    if (name.empty()) {
      throw GenerationError(fmt::format("'{}' does not produce a valid {}", owner, what_));
    }
    const auto [it, inserted] = owners_.emplace(name, owner);
    if (!inserted) {
      throw GenerationError(fmt::format(
        "'{}' and '{}' both generate {} '{}'", it->second, owner, what_, name));
    }
  }

private:
  std::string_view what_;
  std::map<std::string, std::string> owners_;
};

std::vector<const Definition *> sorted_definitions(const Schema & schema)
{
  std::vector<const Definition *> defs;
  defs.reserve(schema.definitions.size());
  for (const auto & def : schema.definitions) {
    defs.push_back(&def);
  }
  std::stable_sort(defs.begin(), defs.end(), [](const Definition * a, const Definition * b) {
    if (a->name != b->name) {
      return a->name < b->name;
    }
    return a->prefix < b->prefix;
  });
  return defs;
}

nlohmann::json relation_data(const Relation & rel, const Definition & def, NameClaims & factories)
{
  nlohmann::json types = nlohmann::json::array();
  for (const auto & subject : rel.types) {
    factories.claim(
      to_pascal_case(rel.name) + "From" + to_pascal_case(extract_type(subject)) +
        to_pascal_case(subject_relation(subject)),
      fmt::format("{}#{} subject {}", def.full_type, rel.name, subject));

    types.push_back({
      {"subject", subject},
      {"object_type", object_type(subject)},
      {"subject_relation", subject_relation(subject)},
    });
  }
  return {
    {"relation", rel.name},
    {"types", std::move(types)},
    {"is_union", rel.is_union},
  };
}

}  // namespace

HelperTable schema_helpers()
{
  return {
    {"camelcase", [](const std::string & s) { return to_pascal_case(s); }},
    {"lower", [](const std::string & s) { return to_lower(s); }},
    {"extract_type", [](const std::string & s) { return extract_type(s); }},
    {"object_type", [](const std::string & s) { return object_type(s); }},
    {"subject_relation", [](const std::string & s) { return subject_relation(s); }},
    {"identifier", [](const std::string & s) { return to_cpp_identifier(s); }},
  };
}

CodeGenerator::CodeGenerator(CodeGenOptions options) : options_(std::move(options)) {}

nlohmann::json CodeGenerator::build_template_data(const Schema & schema) const
{
  const std::string package = schema.package_name(options_.default_package);

  NameClaims classes("class");
  if (!options_.template_text) {
    for (const auto type : builtin_template_types()) {
      classes.claim(std::string(type), "built-in header");
    }
  }
  nlohmann::json definitions = nlohmann::json::array();

  for (const auto * def : sorted_definitions(schema)) {
    classes.claim(to_pascal_case(def->name), def->full_type);

    NameClaims members("member");
    NameClaims factories("subject factory");
    nlohmann::json relations = nlohmann::json::array();
    for (const auto & rel : def->relations) {
      members.claim(to_pascal_case(rel.name), fmt::format("{}#{}", def->full_type, rel.name));
      relations.push_back(relation_data(rel, *def, factories));
    }

    nlohmann::json permissions = nlohmann::json::array();
    for (const auto & perm : def->permissions) {
      members.claim(to_pascal_case(perm.name), fmt::format("{}#{}", def->full_type, perm.name));
      permissions.push_back({
        {"permission", perm.name},
        {"expression", perm.expression_text},
      });
    }

    definitions.push_back({
      {"definition", def->name},
      {"package", def->package},
      {"prefix", def->prefix},
      {"full_type", def->full_type},
      {"relations", std::move(relations)},
      {"permissions", std::move(permissions)},
    });
  }

  return {
    {"package", package},
    {"namespace", to_cpp_identifier(package)},
    {"definitions", std::move(definitions)},
  };
}

std::string CodeGenerator::render(const Schema & schema) const
{
  const nlohmann::json data = build_template_data(schema);
  const std::string_view source =
    options_.template_text ? std::string_view(*options_.template_text) : builtin_template();

  try {
    return Template::compile(source, schema_helpers()).render(data);
  } catch (const TemplateError & e) {
    throw GenerationError(e.what());
  }
}

FormatResult CodeGenerator::format(std::string_view text) { return format_source(text); }

GeneratedUnit CodeGenerator::generate(const Schema & schema) const
{
  GeneratedUnit unit;
  unit.package = schema.package_name(options_.default_package);
  unit.file_name = fmt::format("{}.{}", unit.package, options_.file_extension);

  std::string text = render(schema);
  if (!options_.format) {
    unit.source = std::move(text);
    return unit;
  }

  FormatResult result = format(text);
  if (result.ok) {
    unit.source = std::move(result.text);
    unit.formatted = true;
  } else {
    unit.source = std::move(text);
    unit.format_error = std::move(result.error);
  }
  return unit;
}

}  // namespace authzgen::codegen
