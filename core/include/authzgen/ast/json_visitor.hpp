// authzgen/ast/json_visitor.hpp - JSON serialization for AST nodes
//
// Used by `authzgen --emit-ast` and by tests that assert on tree shape.
//
#pragma once

#include <nlohmann/json.hpp>
#include <vector>

#include "authzgen/ast/ast.hpp"

namespace authzgen
{

/**
 * Serialize any AST node (and its children) to JSON.
 *
 * Every object carries "type" (the node class name) and "range"
 * ({"start", "end"} byte offsets, or nulls when unknown).
 */
[[nodiscard]] nlohmann::json to_json(const AstNode * node);

/// Serialize a parsed document: {"type": "Document", "definitions": [...]}.
[[nodiscard]] nlohmann::json to_json(const std::vector<DefinitionNode *> & definitions);

}  // namespace authzgen
