// authzgen/syntax/keywords.hpp - Reserved words
#pragma once

#include <array>
#include <optional>
#include <string_view>
#include <utility>

#include "authzgen/syntax/token.hpp"

namespace authzgen::syntax
{

inline constexpr std::array<std::pair<std::string_view, TokenKind>, 3> k_keywords = {{
  {"definition", TokenKind::KwDefinition},
  {"relation", TokenKind::KwRelation},
  {"permission", TokenKind::KwPermission},
}};

[[nodiscard]] constexpr std::optional<TokenKind> keyword_kind(std::string_view ident) noexcept
{
  for (const auto & kw : k_keywords) {
    if (kw.first == ident) {
      return kw.second;
    }
  }
  return std::nullopt;
}

}  // namespace authzgen::syntax
