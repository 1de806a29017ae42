// authzgen/syntax/parser.cpp - Recursive-descent schema parser
#include "authzgen/syntax/parser.hpp"

#include <fmt/core.h>

#include <utility>

namespace authzgen::syntax
{

// ============================================================================
// SyntaxError
// ============================================================================

void SyntaxError::add_context(std::string_view context)
{
  message = fmt::format("{}: {}", context, message);
}

Diagnostic SyntaxError::to_diagnostic() const
{
  Diagnostic d;
  d.severity = Severity::Error;
  d.code = std::string(diag_code::k_syntax);
  d.message = message;
  d.labels.push_back(Label{
    range, fmt::format("expected {}, got {}", to_string(expected), to_string(actual)),
    LabelStyle::Primary});
  if (actual == TokenKind::Illegal) {
    d.help_message = "identifiers may contain only letters, digits and '_'";
  } else if (expected == TokenKind::Colon) {
    d.help_message = "relations are declared as `relation <name>: <type>`";
  } else if (expected == TokenKind::Eq) {
    d.help_message = "permissions are declared as `permission <name> = <expression>`";
  }
  return d;
}

// ============================================================================
// Parser
// ============================================================================

Parser::Parser(AstContext & ast, std::vector<Token> tokens) : ast_(ast), tokens_(std::move(tokens))
{
  if (tokens_.empty() || tokens_.back().kind != TokenKind::Eof) {
    Token eof;
    eof.kind = TokenKind::Eof;
    eof.line = tokens_.empty() ? 1 : tokens_.back().line;
    eof.column = tokens_.empty() ? 1 : tokens_.back().column;
    tokens_.push_back(std::move(eof));
  }
}

const Token & Parser::peek(size_t lookahead) const
{
  const size_t i = idx_ + lookahead;
  if (i >= tokens_.size()) {
    return tokens_.back();
  }
  return tokens_[i];
}

const Token & Parser::advance()
{
  const Token & t = peek();
  if (!at_eof()) {
    ++idx_;
  }
  return t;
}

const Token * Parser::consume(TokenKind expected)
{
  if (at(expected)) {
    return &advance();
  }
  fail(mismatch(expected, peek()));
  return nullptr;
}

SyntaxError Parser::mismatch(TokenKind expected, const Token & actual) const
{
  std::string_view reason = "token mismatch";
  if (actual.kind == TokenKind::Eof && expected != TokenKind::Eof) {
    reason = "unexpected end of file";
  } else if (actual.kind == TokenKind::Illegal) {
    reason = "illegal character encountered";
  } else if (expected == TokenKind::LBrace && actual.kind == TokenKind::Identifier) {
    reason = "missing opening brace after object type definition";
  } else if (expected == TokenKind::Slash && actual.kind == TokenKind::Identifier) {
    reason = "missing slash in object type definition (expected format: prefix/name)";
  } else if (expected == TokenKind::RBrace) {
    reason = "missing closing brace to end definition block";
  }

  SyntaxError err;
  err.message = fmt::format(
    "{}: expected {}, got {} ({}) at line {}", reason, to_string(expected),
    to_string(actual.kind), actual.text, actual.line);
  err.expected = expected;
  err.actual = actual.kind;
  err.actual_text = actual.text;
  err.line = actual.line;
  err.column = actual.column;
  err.range = actual.range;
  return err;
}

void Parser::fail(SyntaxError err) { error_ = std::move(err); }

std::nullptr_t Parser::fail_with_context(std::string_view context)
{
  if (error_) {
    error_->add_context(context);
  }
  return nullptr;
}

SourceRange Parser::range_from(const Token & first) const
{
  if (idx_ == 0) {
    return first.range;
  }
  return join_ranges(first.range, tokens_[idx_ - 1].range);
}

void Parser::synchronize_to_definition(size_t failed_at)
{
  if (idx_ == failed_at) {
    advance();
  }
  while (!at_eof() && !at(TokenKind::KwDefinition)) {
    advance();
  }
}

// ============================================================================
// Entry points
// ============================================================================

ParseResult<std::vector<DefinitionNode *>> Parser::parse_definitions()
{
  std::vector<DefinitionNode *> defs;
  while (!at_eof()) {
    if (!at(TokenKind::KwDefinition)) {
      return mismatch(TokenKind::KwDefinition, peek());
    }
    DefinitionNode * def = parse_definition();
    if (def == nullptr) {
      return std::move(*error_);
    }
    defs.push_back(def);
  }
  return defs;
}

ParseResult<PermissionExpr *> Parser::parse_permission_expression()
{
  PermissionExpr * expr = parse_permission_expr();
  if (expr == nullptr) {
    return std::move(*error_);
  }
  if (!at_eof()) {
    return mismatch(TokenKind::Eof, peek());
  }
  return expr;
}

std::vector<DefinitionNode *> Parser::parse_definitions_recovering(
  std::vector<SyntaxError> & errors)
{
  std::vector<DefinitionNode *> defs;
  while (!at_eof()) {
    const size_t start = idx_;
    error_.reset();

    if (!at(TokenKind::KwDefinition)) {
      errors.push_back(mismatch(TokenKind::KwDefinition, peek()));
      synchronize_to_definition(start);
      continue;
    }

    if (DefinitionNode * def = parse_definition()) {
      defs.push_back(def);
      continue;
    }
    if (error_) {
      errors.push_back(std::move(*error_));
    }
    synchronize_to_definition(start);
  }
  error_.reset();
  return defs;
}

// ============================================================================
// Definitions
// ============================================================================

DefinitionNode * Parser::parse_definition()
{
  const Token & def_tok = advance();  // 'definition'

  const std::optional<ObjectTypeRef> type = parse_object_type();
  if (!type) {
    return nullptr;
  }
  const std::string full_name = type->full_name();

  if (consume(TokenKind::LBrace) == nullptr) {
    return fail_with_context(fmt::format("expected '{{' after object type '{}'", full_name));
  }

  std::vector<RelationNode *> relations;
  std::vector<PermissionNode *> permissions;
  while (at(TokenKind::KwRelation) || at(TokenKind::KwPermission)) {
    if (at(TokenKind::KwRelation)) {
      RelationNode * rel = parse_relation();
      if (rel == nullptr) {
        return nullptr;
      }
      relations.push_back(rel);
    } else {
      PermissionNode * perm = parse_permission();
      if (perm == nullptr) {
        return nullptr;
      }
      permissions.push_back(perm);
    }
  }

  if (consume(TokenKind::RBrace) == nullptr) {
    return fail_with_context(fmt::format("expected '}}' to close definition '{}'", full_name));
  }

  return ast_.create<DefinitionNode>(
    *type, ast_.copy_to_arena(relations), ast_.copy_to_arena(permissions), range_from(def_tok));
}

std::optional<ObjectTypeRef> Parser::parse_object_type()
{
  const Token * first = consume(TokenKind::Identifier);
  if (first == nullptr) {
    fail_with_context("expected object type identifier after 'definition'");
    return std::nullopt;
  }

  ObjectTypeRef ref;
  if (at(TokenKind::Slash)) {
    advance();
    const Token * name = consume(TokenKind::Identifier);
    if (name == nullptr) {
      fail_with_context(fmt::format("expected object type name after '{}/'", first->text));
      return std::nullopt;
    }
    ref.prefix = ast_.intern(first->text);
    ref.name = ast_.intern(name->text);
    ref.range = join_ranges(first->range, name->range);
    return ref;
  }

  if (at(TokenKind::LBrace)) {
    ref.name = ast_.intern(first->text);
    ref.range = first->range;
    return ref;
  }

  const Token & t = peek();
  SyntaxError err = mismatch(TokenKind::LBrace, t);
  err.message = fmt::format(
    "expected either '/' (for prefix/name format) or '{{' (for standard format) after "
    "identifier '{}', got {} at line {}",
    first->text, to_string(t.kind), t.line);
  fail(std::move(err));
  return std::nullopt;
}

// ============================================================================
// Relations
// ============================================================================

RelationNode * Parser::parse_relation()
{
  const Token & kw = advance();  // 'relation'

  const Token * name = consume(TokenKind::Identifier);
  if (name == nullptr) {
    return fail_with_context("expected relation name after 'relation' keyword");
  }
  if (consume(TokenKind::Colon) == nullptr) {
    return fail_with_context(fmt::format("expected ':' after relation name '{}'", name->text));
  }

  RelationExpr * expr = parse_relation_expr();
  if (expr == nullptr) {
    return fail_with_context(
      fmt::format("failed to parse expression for relation '{}'", name->text));
  }

  return ast_.create<RelationNode>(ast_.intern(name->text), name->range, expr, range_from(kw));
}

RelationExpr * Parser::parse_relation_expr()
{
  RelationExpr * left = parse_single_relation();
  if (left == nullptr) {
    return nullptr;
  }

  while (at(TokenKind::Pipe)) {
    advance();
    RelationExpr * right = parse_single_relation();
    if (right == nullptr) {
      return nullptr;
    }
    left = ast_.create<UnionRelation>(
      left, right, join_ranges(left->get_range(), right->get_range()));
  }
  return left;
}

RelationExpr * Parser::parse_single_relation()
{
  const Token * ident = consume(TokenKind::Identifier);
  if (ident == nullptr) {
    return nullptr;
  }

  std::string type_name = ident->text;
  if (at(TokenKind::Slash)) {
    advance();
    const Token * name = consume(TokenKind::Identifier);
    if (name == nullptr) {
      return fail_with_context(fmt::format("expected type name after '{}/'", type_name));
    }
    type_name += '/';
    type_name += name->text;
  }

  std::optional<std::string_view> fragment;
  if (at(TokenKind::Hash)) {
    advance();
    const Token * frag = consume(TokenKind::Identifier);
    if (frag == nullptr) {
      return fail_with_context(fmt::format("expected subject relation after '{}#'", type_name));
    }
    fragment = ast_.intern(frag->text);
  }

  return ast_.create<SingleRelation>(ast_.intern(type_name), fragment, range_from(*ident));
}

// ============================================================================
// Permissions
// ============================================================================

PermissionNode * Parser::parse_permission()
{
  const Token & kw = advance();  // 'permission'

  const Token * name = consume(TokenKind::Identifier);
  if (name == nullptr) {
    return fail_with_context("expected permission name after 'permission' keyword");
  }
  if (consume(TokenKind::Eq) == nullptr) {
    return fail_with_context(fmt::format("expected '=' after permission name '{}'", name->text));
  }

  PermissionExpr * expr = parse_permission_expr();
  if (expr == nullptr) {
    return fail_with_context(
      fmt::format("failed to parse expression for permission '{}'", name->text));
  }

  return ast_.create<PermissionNode>(ast_.intern(name->text), name->range, expr, range_from(kw));
}

PermissionExpr * Parser::parse_permission_expr()
{
  PermissionExpr * left = parse_primary();
  if (left == nullptr) {
    return nullptr;
  }

  while (at(TokenKind::Plus)) {
    advance();
    PermissionExpr * right = parse_primary();
    if (right == nullptr) {
      return nullptr;
    }
    left = ast_.create<BinaryOpExpr>(
      PermissionOp::Union, left, right, join_ranges(left->get_range(), right->get_range()));
  }
  return left;
}

PermissionExpr * Parser::parse_primary()
{
  const Token * ident = consume(TokenKind::Identifier);
  if (ident == nullptr) {
    return nullptr;
  }

  PermissionExpr * left = ast_.create<IdentifierExpr>(ast_.intern(ident->text), ident->range);
  while (at(TokenKind::Arrow)) {
    advance();
    const Token * rhs = consume(TokenKind::Identifier);
    if (rhs == nullptr) {
      return nullptr;
    }
    auto * right = ast_.create<IdentifierExpr>(ast_.intern(rhs->text), rhs->range);
    left = ast_.create<BinaryOpExpr>(
      PermissionOp::Arrow, left, right, join_ranges(left->get_range(), right->get_range()));
  }
  return left;
}

ParseResult<std::vector<DefinitionNode *>> parse(AstContext & ast, std::vector<Token> tokens)
{
  Parser parser(ast, std::move(tokens));
  return parser.parse_definitions();
}

}  // namespace authzgen::syntax
