// authzgen/ast/json_visitor.cpp - JSON serialization implementation
//
#include "authzgen/ast/json_visitor.hpp"

#include <nlohmann/json.hpp>
#include <string>

#include "authzgen/ast/ast.hpp"
#include "authzgen/ast/ast_enums.hpp"
#include "authzgen/basic/casting.hpp"

namespace authzgen
{
namespace
{

using nlohmann::json;

json j_range(SourceRange r)
{
  if (!r.is_valid()) {
    return json{{"start", nullptr}, {"end", nullptr}};
  }
  return json{{"start", r.get_begin().offset()}, {"end", r.get_end().offset()}};
}

json j_node(const AstNode * node);

json j_single_relation(const SingleRelation * s)
{
  json j{
    {"type", "SingleRelation"},
    {"range", j_range(s->get_range())},
    {"typeName", std::string(s->typeName)}};
  j["subjectFragment"] = s->subjectFragment ? json(std::string(*s->subjectFragment)) : json();
  return j;
}

json j_definition(const DefinitionNode * d)
{
  json rels = json::array();
  for (const auto * r : d->relations) {
    rels.push_back(j_node(r));
  }
  json perms = json::array();
  for (const auto * p : d->permissions) {
    perms.push_back(j_node(p));
  }

  json object_type{
    {"name", std::string(d->objectType.name)},
    {"prefix", std::string(d->objectType.prefix)},
    {"range", j_range(d->objectType.range)}};

  return json{
    {"type", "DefinitionNode"},
    {"range", j_range(d->get_range())},
    {"objectType", object_type},
    {"relations", rels},
    {"permissions", perms}};
}

json j_node(const AstNode * node)
{
  if (node == nullptr) {
    return json{{"type", "Missing"}, {"range", j_range({})}};
  }

  switch (node->get_kind()) {
    case NodeKind::SingleRelation:
      return j_single_relation(cast<SingleRelation>(node));

    case NodeKind::UnionRelation: {
      const auto * u = cast<UnionRelation>(node);
      return json{
        {"type", "UnionRelation"},
        {"range", j_range(u->get_range())},
        {"left", j_node(u->left)},
        {"right", j_node(u->right)}};
    }

    case NodeKind::Identifier: {
      const auto * id = cast<IdentifierExpr>(node);
      return json{
        {"type", "IdentifierExpr"},
        {"range", j_range(id->get_range())},
        {"name", std::string(id->name)}};
    }

    case NodeKind::BinaryOp: {
      const auto * b = cast<BinaryOpExpr>(node);
      return json{
        {"type", "BinaryOpExpr"},
        {"range", j_range(b->get_range())},
        {"op", std::string(to_string(b->op))},
        {"left", j_node(b->left)},
        {"right", j_node(b->right)}};
    }

    case NodeKind::Relation: {
      const auto * r = cast<RelationNode>(node);
      return json{
        {"type", "RelationNode"},
        {"range", j_range(r->get_range())},
        {"name", std::string(r->name)},
        {"expression", j_node(r->expr)}};
    }

    case NodeKind::Permission: {
      const auto * p = cast<PermissionNode>(node);
      return json{
        {"type", "PermissionNode"},
        {"range", j_range(p->get_range())},
        {"name", std::string(p->name)},
        {"expression", j_node(p->expr)}};
    }

    case NodeKind::Definition:
      return j_definition(cast<DefinitionNode>(node));
  }

  return json{{"type", "Unknown"}, {"range", j_range(node->get_range())}};
}

}  // namespace

nlohmann::json to_json(const AstNode * node) { return j_node(node); }

nlohmann::json to_json(const std::vector<DefinitionNode *> & definitions)
{
  json defs = json::array();
  for (const auto * d : definitions) {
    defs.push_back(j_node(d));
  }
  return json{{"type", "Document"}, {"definitions", defs}};
}

}  // namespace authzgen
