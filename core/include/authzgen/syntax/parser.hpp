// authzgen/syntax/parser.hpp - Schema parser
#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

#include "authzgen/ast/ast.hpp"
#include "authzgen/ast/ast_context.hpp"
#include "authzgen/basic/diagnostic.hpp"
#include "authzgen/syntax/token.hpp"

namespace authzgen::syntax
{

// ============================================================================
// Error Types
// ============================================================================

/**
 * A single parse failure.
 *
 * `message` is the full text, including every enclosing construct that was
 * being parsed, e.g.
 *   expected ':' after relation name 'owner': token mismatch: expected ':',
 *   got IDENTIFIER (user) at line 3
 */
struct SyntaxError
{
  std::string message;
  TokenKind expected = TokenKind::Eof;
  TokenKind actual = TokenKind::Eof;
  std::string actual_text;
  uint32_t line = 0;
  uint32_t column = 0;
  SourceRange range;

  /// Prepend an enclosing-construct description to the message.
  void add_context(std::string_view context);

  [[nodiscard]] Diagnostic to_diagnostic() const;
};

// ============================================================================
// Result Type
// ============================================================================

/**
 * Holds either a parsed value or the first syntax error.
 */
template <typename T>
class ParseResult
{
public:
  using ValueType = T;
  using ErrorType = SyntaxError;

  ParseResult(T value) : data_(std::move(value)) {}
  ParseResult(SyntaxError error) : data_(std::move(error)) {}

  [[nodiscard]] bool has_value() const { return std::holds_alternative<T>(data_); }
  [[nodiscard]] bool has_error() const { return std::holds_alternative<ErrorType>(data_); }
  explicit operator bool() const { return has_value(); }

  T & value() & { return std::get<T>(data_); }
  [[nodiscard]] const T & value() const & { return std::get<T>(data_); }
  T && value() && { return std::get<T>(std::move(data_)); }

  [[nodiscard]] const ErrorType & error() const & { return std::get<ErrorType>(data_); }
  ErrorType && error() && { return std::get<ErrorType>(std::move(data_)); }

  T * operator->() { return &value(); }
  const T * operator->() const { return &value(); }
  T & operator*() & { return value(); }
  const T & operator*() const & { return value(); }

private:
  std::variant<T, ErrorType> data_;
};

// ============================================================================
// Parser
// ============================================================================

/**
 * Recursive-descent parser over a complete token stream.
 *
 *   document    := definition* EOF
 *   definition  := "definition" objectType "{" (relation | permission)* "}"
 *   objectType  := IDENT ("/" IDENT)?
 *   relation    := "relation" IDENT ":" relExpr
 *   relExpr     := singleRel ("|" singleRel)*
 *   singleRel   := IDENT ("/" IDENT)? ("#" IDENT)?
 *   permission  := "permission" IDENT "=" permExpr
 *   permExpr    := primary ("+" primary)*
 *   primary     := IDENT ("->" IDENT)*
 *
 * The first error aborts the parse; no partial AST is returned.
 */
class Parser
{
public:
  Parser(AstContext & ast, std::vector<Token> tokens);

  [[nodiscard]] ParseResult<std::vector<DefinitionNode *>> parse_definitions();

  /// Parses `permExpr EOF`.
  [[nodiscard]] ParseResult<PermissionExpr *> parse_permission_expression();

  /**
   * Parses every definition it can, resynchronizing at the next `definition`
   * keyword after each failure. Errors are appended to `errors`.
   */
  [[nodiscard]] std::vector<DefinitionNode *> parse_definitions_recovering(
    std::vector<SyntaxError> & errors);

private:
  // Token helpers
  [[nodiscard]] const Token & peek(size_t lookahead = 0) const;
  [[nodiscard]] bool at(TokenKind k) const { return peek().kind == k; }
  [[nodiscard]] bool at_eof() const { return at(TokenKind::Eof); }
  const Token & advance();

  /// Returns the matched token, or nullptr after recording an error.
  const Token * consume(TokenKind expected);

  void fail(SyntaxError err);
  [[nodiscard]] SyntaxError mismatch(TokenKind expected, const Token & actual) const;
  std::nullptr_t fail_with_context(std::string_view context);

  void synchronize_to_definition(size_t failed_at);

  // Productions
  [[nodiscard]] DefinitionNode * parse_definition();
  [[nodiscard]] std::optional<ObjectTypeRef> parse_object_type();
  [[nodiscard]] RelationNode * parse_relation();
  [[nodiscard]] RelationExpr * parse_relation_expr();
  [[nodiscard]] RelationExpr * parse_single_relation();
  [[nodiscard]] PermissionNode * parse_permission();
  [[nodiscard]] PermissionExpr * parse_permission_expr();
  [[nodiscard]] PermissionExpr * parse_primary();

  [[nodiscard]] SourceRange range_from(const Token & first) const;

  AstContext & ast_;
  std::vector<Token> tokens_;
  size_t idx_ = 0;
  std::optional<SyntaxError> error_;
};

/// Convenience wrapper: parse a full token stream.
[[nodiscard]] ParseResult<std::vector<DefinitionNode *>> parse(
  AstContext & ast, std::vector<Token> tokens);

}  // namespace authzgen::syntax
