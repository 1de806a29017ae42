// authzgen/syntax/lexer.hpp - Schema lexer
#pragma once

#include <cstdint>
#include <string_view>
#include <vector>

#include "authzgen/syntax/token.hpp"

namespace authzgen::syntax
{

/**
 * Single-pass lexer for schema text.
 *
 * Never fails: unrecognized bytes become Illegal tokens and the stream always
 * ends with exactly one Eof token.
 */
class Lexer
{
public:
  Lexer(FileId file_id, std::string_view src) : file_id_(file_id), src_(src) {}
  explicit Lexer(std::string_view src) : Lexer(FileId::invalid(), src) {}

  [[nodiscard]] std::vector<Token> lex_all();

private:
  [[nodiscard]] Token next_token();

  [[nodiscard]] bool eof() const noexcept { return pos_ >= src_.size(); }
  [[nodiscard]] char peek(size_t lookahead = 0) const noexcept
  {
    const size_t i = pos_ + lookahead;
    return (i < src_.size()) ? src_[i] : '\0';
  }

  void advance(size_t n = 1) noexcept;

  void skip_trivia();

  [[nodiscard]] Token lex_identifier_or_keyword();
  [[nodiscard]] Token make_token(TokenKind kind, size_t start, uint32_t line, uint32_t column) const;

  FileId file_id_;
  std::string_view src_;
  size_t pos_ = 0;
  uint32_t line_ = 1;
  uint32_t column_ = 1;
};

/// Convenience wrapper: lexes `src` without a registered file.
[[nodiscard]] std::vector<Token> tokenize(std::string_view src, FileId file_id = FileId::invalid());

}  // namespace authzgen::syntax
