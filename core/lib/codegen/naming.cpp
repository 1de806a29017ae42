// authzgen/codegen/naming.cpp
#include "authzgen/codegen/naming.hpp"

#include <algorithm>
#include <array>
#include <cctype>

namespace authzgen::codegen
{

namespace
{

bool is_word_delimiter(char c) { return c == '-' || c == '_' || c == ' '; }

// Sorted for binary search.
constexpr std::array<std::string_view, 92> k_cpp_keywords = {
  "alignas",      "alignof",     "and",          "and_eq",       "asm",
  "auto",         "bitand",      "bitor",        "bool",         "break",
  "case",         "catch",       "char",         "char16_t",     "char32_t",
  "char8_t",      "class",       "co_await",     "co_return",    "co_yield",
  "compl",        "concept",     "const",        "const_cast",   "consteval",
  "constexpr",    "constinit",   "continue",     "decltype",     "default",
  "delete",       "do",          "double",       "dynamic_cast", "else",
  "enum",         "explicit",    "export",       "extern",       "false",
  "float",        "for",         "friend",       "goto",         "if",
  "inline",       "int",         "long",         "mutable",      "namespace",
  "new",          "noexcept",    "not",          "not_eq",       "nullptr",
  "operator",     "or",          "or_eq",        "private",      "protected",
  "public",       "register",    "reinterpret_cast", "requires", "return",
  "short",        "signed",      "sizeof",       "static",       "static_assert",
  "static_cast",  "struct",      "switch",       "template",     "this",
  "thread_local", "throw",       "true",         "try",          "typedef",
  "typeid",       "typename",    "union",        "unsigned",     "using",
  "virtual",      "void",        "volatile",     "wchar_t",      "while",
  "xor",          "xor_eq",
};

}  // namespace

std::string to_pascal_case(std::string_view s)
{
  std::string out;
  out.reserve(s.size());
  bool word_start = true;
  for (const char c : s) {
    if (is_word_delimiter(c)) {
      word_start = true;
      continue;
    }
    const auto uc = static_cast<unsigned char>(c);
    out += static_cast<char>(word_start ? std::toupper(uc) : std::tolower(uc));
    word_start = false;
  }
  return out;
}

std::string to_lower(std::string_view s)
{
  std::string out(s);
  std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return out;
}

std::string object_type(std::string_view subject)
{
  return std::string(subject.substr(0, subject.find('#')));
}

std::string extract_type(std::string_view subject)
{
  std::string_view type = subject.substr(0, subject.find('#'));
  if (const auto slash = type.find('/'); slash != std::string_view::npos) {
    type = type.substr(slash + 1);
    type = type.substr(0, type.find('/'));
  }
  return std::string(type);
}

std::string subject_relation(std::string_view subject)
{
  const auto hash = subject.find('#');
  return hash == std::string_view::npos ? std::string() : std::string(subject.substr(hash + 1));
}

bool is_cpp_keyword(std::string_view s)
{
  return std::binary_search(k_cpp_keywords.begin(), k_cpp_keywords.end(), s);
}

std::string to_cpp_identifier(std::string_view s)
{
  std::string out;
  out.reserve(s.size() + 1);
  for (const char c : s) {
    const auto uc = static_cast<unsigned char>(c);
    out += (std::isalnum(uc) != 0 || c == '_') ? c : '_';
  }
  if (out.empty() || std::isdigit(static_cast<unsigned char>(out.front())) != 0) {
    out.insert(out.begin(), '_');
  }
  if (is_cpp_keyword(out)) {
    out += '_';
  }
  return out;
}

bool is_identifier(std::string_view s)
{
  if (s.empty() || std::isdigit(static_cast<unsigned char>(s.front())) != 0) {
    return false;
  }
  return std::all_of(s.begin(), s.end(), [](char c) {
    return std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '_';
  });
}

bool is_file_extension(std::string_view s)
{
  return !s.empty() && s.find_first_of("/\\") == std::string_view::npos;
}

}  // namespace authzgen::codegen
