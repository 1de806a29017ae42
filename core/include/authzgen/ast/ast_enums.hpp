// authzgen/ast/ast_enums.hpp - AST enumeration definitions
#pragma once

#include <cstdint>
#include <string_view>

namespace authzgen
{

// ============================================================================
// NodeKind
// ============================================================================

/**
 * Node kind enumeration for LLVM-style RTTI, generated from ast_nodes.def.
 * Categories are contiguous so classof() can use range checks.
 */
enum class NodeKind : uint8_t {
#define AST_NODE_REL(Class, Kind, Snake) Kind,
#include "authzgen/ast/ast_nodes.def"

#define AST_NODE_PERM(Class, Kind, Snake) Kind,
#include "authzgen/ast/ast_nodes.def"

#define AST_NODE_DECL(Class, Kind, Snake) Kind,
#include "authzgen/ast/ast_nodes.def"
};

[[nodiscard]] constexpr std::string_view to_string(NodeKind k) noexcept
{
  switch (k) {
#define AST_NODE_REL(Class, Kind, Snake) \
  case NodeKind::Kind:                   \
    return #Class;
#define AST_NODE_PERM(Class, Kind, Snake) \
  case NodeKind::Kind:                    \
    return #Class;
#define AST_NODE_DECL(Class, Kind, Snake) \
  case NodeKind::Kind:                    \
    return #Class;
#include "authzgen/ast/ast_nodes.def"
  }
  return "";
}

// ============================================================================
// Operators
// ============================================================================

/**
 * Permission expression operators.
 */
enum class PermissionOp : uint8_t {
  Union,  ///< +
  Arrow,  ///< -> (tupleset traversal)
};

[[nodiscard]] constexpr std::string_view to_string(PermissionOp op) noexcept
{
  switch (op) {
    case PermissionOp::Union:
      return "+";
    case PermissionOp::Arrow:
      return "->";
  }
  return "";
}

// ============================================================================
// NodeKind Range Helpers
// ============================================================================

namespace detail
{

inline constexpr NodeKind k_first_rel_kind = NodeKind::SingleRelation;
inline constexpr NodeKind k_last_rel_kind = NodeKind::UnionRelation;

inline constexpr NodeKind k_first_perm_kind = NodeKind::Identifier;
inline constexpr NodeKind k_last_perm_kind = NodeKind::BinaryOp;

}  // namespace detail

[[nodiscard]] constexpr bool is_relation_expr_kind(NodeKind kind) noexcept
{
  return kind >= detail::k_first_rel_kind && kind <= detail::k_last_rel_kind;
}

[[nodiscard]] constexpr bool is_permission_expr_kind(NodeKind kind) noexcept
{
  return kind >= detail::k_first_perm_kind && kind <= detail::k_last_perm_kind;
}

}  // namespace authzgen
