// authzgen/syntax/lexer.cpp - Schema lexer
#include "authzgen/syntax/lexer.hpp"

#include <cctype>
#include <string>
#include <utility>

#include "authzgen/syntax/keywords.hpp"

namespace authzgen::syntax
{
namespace
{

bool is_ident_start(unsigned char c) { return (std::isalpha(c) != 0) || c == '_'; }
bool is_ident_continue(unsigned char c) { return (std::isalnum(c) != 0) || c == '_'; }

}  // namespace

void Lexer::advance(size_t n) noexcept
{
  for (size_t i = 0; i < n && !eof(); ++i) {
    if (src_[pos_] == '\n') {
      ++line_;
      column_ = 1;
    } else {
      ++column_;
    }
    ++pos_;
  }
}

void Lexer::skip_trivia()
{
  while (!eof()) {
    const char c = peek();
    if (c == ' ' || c == '\t' || c == '\n' || c == '\r') {
      advance();
      continue;
    }
    if (c == '/' && peek(1) == '/') {
      while (!eof() && peek() != '\n') {
        advance();
      }
      continue;
    }
    break;
  }
}

Token Lexer::make_token(TokenKind kind, size_t start, uint32_t line, uint32_t column) const
{
  Token t;
  t.kind = kind;
  t.text = std::string(src_.substr(start, pos_ - start));
  t.line = line;
  t.column = column;
  t.range = {file_id_, static_cast<uint32_t>(start), static_cast<uint32_t>(pos_)};
  return t;
}

Token Lexer::lex_identifier_or_keyword()
{
  const size_t start = pos_;
  const uint32_t line = line_;
  const uint32_t column = column_;

  advance();
  while (!eof() && is_ident_continue(static_cast<unsigned char>(peek()))) {
    advance();
  }

  Token t = make_token(TokenKind::Identifier, start, line, column);
  if (const auto kw = keyword_kind(t.text)) {
    t.kind = *kw;
  }
  return t;
}

Token Lexer::next_token()
{
  skip_trivia();

  const size_t start = pos_;
  const uint32_t line = line_;
  const uint32_t column = column_;

  if (eof()) {
    return make_token(TokenKind::Eof, start, line, column);
  }

  const char c = peek();
  if (is_ident_start(static_cast<unsigned char>(c))) {
    return lex_identifier_or_keyword();
  }

  if (c == '-' && peek(1) == '>') {
    advance(2);
    return make_token(TokenKind::Arrow, start, line, column);
  }

  TokenKind kind = TokenKind::Illegal;
  switch (c) {
    case '=':
      kind = TokenKind::Eq;
      break;
    case '+':
      kind = TokenKind::Plus;
      break;
    case '-':
      kind = TokenKind::Minus;
      break;
    case '|':
      kind = TokenKind::Pipe;
      break;
    case '*':
      kind = TokenKind::Star;
      break;
    case '{':
      kind = TokenKind::LBrace;
      break;
    case '}':
      kind = TokenKind::RBrace;
      break;
    case ':':
      kind = TokenKind::Colon;
      break;
    case '/':
      kind = TokenKind::Slash;
      break;
    case '#':
      kind = TokenKind::Hash;
      break;
    default:
      break;
  }

  advance();
  return make_token(kind, start, line, column);
}

std::vector<Token> Lexer::lex_all()
{
  std::vector<Token> out;
  while (true) {
    Token t = next_token();
    const bool done = t.kind == TokenKind::Eof;
    out.push_back(std::move(t));
    if (done) {
      break;
    }
  }
  return out;
}

std::vector<Token> tokenize(std::string_view src, FileId file_id)
{
  Lexer lexer(file_id, src);
  return lexer.lex_all();
}

}  // namespace authzgen::syntax
