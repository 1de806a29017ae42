// authzgen/ast/ast.hpp - AST node class definitions for schema documents
//
// LLVM/Clang style hierarchy with classof() for RTTI. All nodes live in an
// AstContext arena and must stay trivially destructible.
//
#pragma once

#include <gsl/span>
#include <optional>
#include <string>
#include <string_view>

#include "authzgen/ast/ast_enums.hpp"
#include "authzgen/basic/casting.hpp"
#include "authzgen/basic/source_manager.hpp"

namespace authzgen
{

// ============================================================================
// Base Classes
// ============================================================================

/**
 * Base class for all AST nodes.
 *
 * Nodes are non-copyable and owned by AstContext.
 */
class AstNode
{
public:
  const NodeKind kind;
  SourceRange range_;

  AstNode(const AstNode &) = delete;
  AstNode & operator=(const AstNode &) = delete;
  AstNode(AstNode &&) = delete;
  AstNode & operator=(AstNode &&) = delete;

  [[nodiscard]] NodeKind get_kind() const noexcept { return kind; }
  [[nodiscard]] SourceRange get_range() const noexcept { return range_; }

protected:
  explicit AstNode(NodeKind k, SourceRange r = {}) : kind(k), range_(r) {}
  ~AstNode() = default;
};

/**
 * CRTP base that implements classof() for a concrete node.
 */
template <typename Derived, typename Base, NodeKind K>
class NodeBase : public Base
{
public:
  static constexpr NodeKind kind_value = K;

  static bool classof(const AstNode * node) { return node->get_kind() == K; }

protected:
  explicit NodeBase(SourceRange r = {}) : Base(K, r) {}
};

/// Right-hand side of `relation name: ...`.
class RelationExpr : public AstNode
{
public:
  static bool classof(const AstNode * node) { return is_relation_expr_kind(node->kind); }

protected:
  explicit RelationExpr(NodeKind k, SourceRange r = {}) : AstNode(k, r) {}
};

/// Right-hand side of `permission name = ...`.
class PermissionExpr : public AstNode
{
public:
  static bool classof(const AstNode * node) { return is_permission_expr_kind(node->kind); }

protected:
  explicit PermissionExpr(NodeKind k, SourceRange r = {}) : AstNode(k, r) {}
};

// ============================================================================
// Relation Expressions
// ============================================================================

/// A single allowed subject type: `user`, `tenant/user` or `group#member`.
class SingleRelation : public NodeBase<SingleRelation, RelationExpr, NodeKind::SingleRelation>
{
public:
  std::string_view typeName;  ///< includes the prefix when present
  std::optional<std::string_view> subjectFragment;

  SingleRelation(
    std::string_view type_name, std::optional<std::string_view> fragment, SourceRange r = {})
  : NodeBase(r), typeName(type_name), subjectFragment(fragment)
  {
  }
};

/// `left | right`. Chains are left-associative.
class UnionRelation : public NodeBase<UnionRelation, RelationExpr, NodeKind::UnionRelation>
{
public:
  RelationExpr * left;
  RelationExpr * right;

  UnionRelation(RelationExpr * l, RelationExpr * r, SourceRange range = {})
  : NodeBase(range), left(l), right(r)
  {
  }
};

// ============================================================================
// Permission Expressions
// ============================================================================

class IdentifierExpr : public NodeBase<IdentifierExpr, PermissionExpr, NodeKind::Identifier>
{
public:
  std::string_view name;

  explicit IdentifierExpr(std::string_view n, SourceRange r = {}) : NodeBase(r), name(n) {}
};

class BinaryOpExpr : public NodeBase<BinaryOpExpr, PermissionExpr, NodeKind::BinaryOp>
{
public:
  PermissionOp op;
  PermissionExpr * left;
  PermissionExpr * right;

  BinaryOpExpr(PermissionOp o, PermissionExpr * l, PermissionExpr * r, SourceRange range = {})
  : NodeBase(range), op(o), left(l), right(r)
  {
  }
};

// ============================================================================
// Declarations
// ============================================================================

/**
 * Name of a definition. `prefix` is empty for the bare form.
 */
struct ObjectTypeRef
{
  std::string_view name;
  std::string_view prefix;
  SourceRange range;

  [[nodiscard]] bool has_prefix() const noexcept { return !prefix.empty(); }

  /// `prefix/name` or `name`.
  [[nodiscard]] std::string full_name() const
  {
    if (prefix.empty()) {
      return std::string(name);
    }
    std::string out(prefix);
    out += '/';
    out += name;
    return out;
  }
};

class RelationNode : public NodeBase<RelationNode, AstNode, NodeKind::Relation>
{
public:
  std::string_view name;
  SourceRange nameRange;
  RelationExpr * expr;

  RelationNode(std::string_view n, SourceRange name_range, RelationExpr * e, SourceRange r = {})
  : NodeBase(r), name(n), nameRange(name_range), expr(e)
  {
  }
};

class PermissionNode : public NodeBase<PermissionNode, AstNode, NodeKind::Permission>
{
public:
  std::string_view name;
  SourceRange nameRange;
  PermissionExpr * expr;

  PermissionNode(std::string_view n, SourceRange name_range, PermissionExpr * e, SourceRange r = {})
  : NodeBase(r), name(n), nameRange(name_range), expr(e)
  {
  }
};

/**
 * `definition <objectType> { ... }`. Members keep source order.
 */
class DefinitionNode : public NodeBase<DefinitionNode, AstNode, NodeKind::Definition>
{
public:
  ObjectTypeRef objectType;
  gsl::span<RelationNode *> relations;
  gsl::span<PermissionNode *> permissions;

  DefinitionNode(
    ObjectTypeRef type, gsl::span<RelationNode *> rels, gsl::span<PermissionNode *> perms,
    SourceRange r = {})
  : NodeBase(r), objectType(type), relations(rels), permissions(perms)
  {
  }
};

}  // namespace authzgen
