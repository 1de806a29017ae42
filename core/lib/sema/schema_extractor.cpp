// authzgen/sema/schema_extractor.cpp
#include "authzgen/sema/schema_extractor.hpp"

#include <fmt/core.h>

#include <map>
#include <string_view>
#include <utility>

#include "authzgen/ast/expr_printer.hpp"

namespace authzgen
{

SchemaExtractor::SchemaExtractor(ExtractOptions options, DiagnosticBag * diags)
: options_(std::move(options)), diags_(diags)
{
}

std::optional<Schema> SchemaExtractor::extract(const std::vector<DefinitionNode *> & definitions)
{
  error_count_ = 0;

  check_duplicate_definitions(definitions);
  for (const auto * def : definitions) {
    check_duplicate_members(*def);
  }
  if (has_errors()) {
    return std::nullopt;
  }

  Schema schema;
  schema.definitions.reserve(definitions.size());
  for (const auto * def : definitions) {
    schema.definitions.push_back(extract_definition(*def));
  }
  return schema;
}

Definition SchemaExtractor::extract_definition(const DefinitionNode & def)
{
  Definition out;
  out.name = std::string(def.objectType.name);
  out.prefix = std::string(def.objectType.prefix);
  out.full_type = def.objectType.full_name();
  out.package = def.objectType.has_prefix() ? out.prefix : options_.default_package;
  out.range = def.get_range();

  out.relations.reserve(def.relations.size());
  for (const auto * rel : def.relations) {
    Relation r;
    r.name = std::string(rel->name);
    r.types = flatten_relation_types(rel->expr);
    r.is_union = r.types.size() > 1;
    r.range = rel->get_range();
    out.relations.push_back(std::move(r));
  }

  out.permissions.reserve(def.permissions.size());
  for (const auto * perm : def.permissions) {
    Permission p;
    p.name = std::string(perm->name);
    p.expression_text = to_expression_text(perm->expr);
    p.range = perm->get_range();
    out.permissions.push_back(std::move(p));
  }
  return out;
}

void SchemaExtractor::check_duplicate_definitions(
  const std::vector<DefinitionNode *> & definitions)
{
  std::map<std::pair<std::string_view, std::string_view>, const DefinitionNode *> seen;
  for (const auto * def : definitions) {
    const auto key = std::make_pair(def->objectType.prefix, def->objectType.name);
    const auto [it, inserted] = seen.emplace(key, def);
    if (inserted) {
      continue;
    }
    ++error_count_;
    if (diags_ != nullptr) {
      diags_
        ->report_error(
          def->objectType.range,
          fmt::format("duplicate definition '{}'", def->objectType.full_name()), "redefined here")
        .with_code(diag_code::k_duplicate_definition)
        .with_secondary_label(it->second->objectType.range, "first defined here");
    }
  }
}

void SchemaExtractor::check_duplicate_members(const DefinitionNode & def)
{
  // Relations and permissions share one namespace per definition.
  std::map<std::string_view, SourceRange> seen;

  const auto visit = [&](std::string_view kind, std::string_view name, SourceRange range) {
    const auto [it, inserted] = seen.emplace(name, range);
    if (inserted) {
      return;
    }
    ++error_count_;
    if (diags_ != nullptr) {
      diags_
        ->report_error(
          range,
          fmt::format(
            "duplicate {} '{}' in definition '{}'", kind, name, def.objectType.full_name()),
          "redeclared here")
        .with_code(diag_code::k_duplicate_member)
        .with_secondary_label(it->second, "first declared here");
    }
  };

  for (const auto * rel : def.relations) {
    visit("relation", rel->name, rel->nameRange);
  }
  for (const auto * perm : def.permissions) {
    visit("permission", perm->name, perm->nameRange);
  }
}

}  // namespace authzgen
