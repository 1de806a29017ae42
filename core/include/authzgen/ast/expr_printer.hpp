// authzgen/ast/expr_printer.hpp - Canonical text for relation/permission expressions
#pragma once

#include <string>
#include <vector>

#include "authzgen/ast/ast.hpp"

namespace authzgen
{

/**
 * Canonical infix text of a permission expression: operands left to right,
 * single spaces around every operator, no parentheses.
 *
 *   a + b -> c   =>  "a + b -> c"
 */
[[nodiscard]] std::string to_expression_text(const PermissionExpr * expr);

/// `type` or `type#fragment`.
[[nodiscard]] std::string to_subject_text(const SingleRelation * rel);

/**
 * Subject types of a relation expression in left-to-right order, each
 * rendered with to_subject_text().
 */
[[nodiscard]] std::vector<std::string> flatten_relation_types(const RelationExpr * expr);

/**
 * Fully parenthesized form, e.g. "+(a, ->(b, c))". Exposes tree shape for
 * tests and --emit-ast style debugging.
 */
[[nodiscard]] std::string to_tree_text(const PermissionExpr * expr);

}  // namespace authzgen
