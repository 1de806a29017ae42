// authzgen/sema/schema.hpp - Normalized schema model consumed by the generator
#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "authzgen/basic/source_manager.hpp"

namespace authzgen
{

/// Default package for definitions declared without a prefix.
inline constexpr std::string_view k_default_package = "authz";

struct Relation
{
  std::string name;
  /// Allowed subject types in source order, each `type` or `type#fragment`.
  std::vector<std::string> types;
  bool is_union = false;
  SourceRange range;
};

struct Permission
{
  std::string name;
  /// Canonical infix form, e.g. "viewer + parent -> view".
  std::string expression_text;
  SourceRange range;
};

struct Definition
{
  std::string name;
  std::string package;
  std::string prefix;     ///< empty for the bare form
  std::string full_type;  ///< `prefix/name` or `name`
  std::vector<Relation> relations;
  std::vector<Permission> permissions;
  SourceRange range;
};

struct Schema
{
  std::vector<Definition> definitions;

  /**
   * Package of the whole generated unit: the package of the first definition
   * in source order, or `fallback` for an empty schema.
   */
  [[nodiscard]] std::string package_name(std::string_view fallback = k_default_package) const
  {
    return definitions.empty() ? std::string(fallback) : definitions.front().package;
  }
};

}  // namespace authzgen
