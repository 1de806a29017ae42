// authzgen/ast/expr_printer.cpp
#include "authzgen/ast/expr_printer.hpp"

#include <fmt/core.h>

namespace authzgen
{

namespace
{

void append_expression(const PermissionExpr * expr, std::string & out)
{
  switch (expr->get_kind()) {
    case NodeKind::Identifier:
      out += cast<IdentifierExpr>(expr)->name;
      return;
    case NodeKind::BinaryOp: {
      const auto * bin = cast<BinaryOpExpr>(expr);
      append_expression(bin->left, out);
      out += ' ';
      out += to_string(bin->op);
      out += ' ';
      append_expression(bin->right, out);
      return;
    }
    case NodeKind::SingleRelation:
    case NodeKind::UnionRelation:
    case NodeKind::Relation:
    case NodeKind::Permission:
    case NodeKind::Definition:
      break;
  }
}

void append_types(const RelationExpr * expr, std::vector<std::string> & out)
{
  switch (expr->get_kind()) {
    case NodeKind::SingleRelation:
      out.push_back(to_subject_text(cast<SingleRelation>(expr)));
      return;
    case NodeKind::UnionRelation: {
      const auto * u = cast<UnionRelation>(expr);
      append_types(u->left, out);
      append_types(u->right, out);
      return;
    }
    case NodeKind::Identifier:
    case NodeKind::BinaryOp:
    case NodeKind::Relation:
    case NodeKind::Permission:
    case NodeKind::Definition:
      break;
  }
}

}  // namespace

std::string to_expression_text(const PermissionExpr * expr)
{
  std::string out;
  if (expr != nullptr) {
    append_expression(expr, out);
  }
  return out;
}

std::string to_subject_text(const SingleRelation * rel)
{
  std::string out(rel->typeName);
  if (rel->subjectFragment) {
    out += '#';
    out += *rel->subjectFragment;
  }
  return out;
}

std::vector<std::string> flatten_relation_types(const RelationExpr * expr)
{
  std::vector<std::string> out;
  if (expr != nullptr) {
    append_types(expr, out);
  }
  return out;
}

std::string to_tree_text(const PermissionExpr * expr)
{
  if (const auto * bin = dyn_cast<BinaryOpExpr>(expr)) {
    return fmt::format(
      "{}({}, {})", to_string(bin->op), to_tree_text(bin->left), to_tree_text(bin->right));
  }
  if (const auto * id = dyn_cast<IdentifierExpr>(expr)) {
    return std::string(id->name);
  }
  return "<missing>";
}

}  // namespace authzgen
