// authzgen/syntax/token.hpp - Token kinds and tokens
#pragma once

#include <cstdint>
#include <string>
#include <string_view>

#include "authzgen/basic/source_manager.hpp"

namespace authzgen::syntax
{

enum class TokenKind : uint8_t {
  Eof,
  Illegal,

  Identifier,

  // Keywords
  KwDefinition,
  KwRelation,
  KwPermission,

  // Punctuation / operators
  Eq,
  Plus,
  Minus,
  Pipe,
  Star,
  LBrace,
  RBrace,
  Colon,
  Slash,
  Hash,
  Arrow,
};

/**
 * A lexed token. Owns its text so token streams outlive the source buffer.
 */
struct Token
{
  TokenKind kind = TokenKind::Illegal;
  std::string text;
  uint32_t line = 0;    // 1-based
  uint32_t column = 0;  // 1-based
  SourceRange range;

  [[nodiscard]] bool is(TokenKind k) const noexcept { return kind == k; }
};

/// Display name used in diagnostics, e.g. "IDENTIFIER" or "'{'".
[[nodiscard]] constexpr std::string_view to_string(TokenKind k) noexcept
{
  switch (k) {
    case TokenKind::Eof:
      return "EOF";
    case TokenKind::Illegal:
      return "ILLEGAL";
    case TokenKind::Identifier:
      return "IDENTIFIER";
    case TokenKind::KwDefinition:
      return "'definition'";
    case TokenKind::KwRelation:
      return "'relation'";
    case TokenKind::KwPermission:
      return "'permission'";
    case TokenKind::Eq:
      return "'='";
    case TokenKind::Plus:
      return "'+'";
    case TokenKind::Minus:
      return "'-'";
    case TokenKind::Pipe:
      return "'|'";
    case TokenKind::Star:
      return "'*'";
    case TokenKind::LBrace:
      return "'{'";
    case TokenKind::RBrace:
      return "'}'";
    case TokenKind::Colon:
      return "':'";
    case TokenKind::Slash:
      return "'/'";
    case TokenKind::Hash:
      return "'#'";
    case TokenKind::Arrow:
      return "'->'";
  }
  return "<unknown>";
}

}  // namespace authzgen::syntax
