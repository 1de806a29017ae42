// authzgen/codegen/source_formatter.cpp
#include "authzgen/codegen/source_formatter.hpp"

#include <fmt/core.h>

#include <cctype>
#include <optional>
#include <utility>
#include <vector>

namespace authzgen::codegen
{

namespace
{

constexpr size_t k_indent_width = 2;

bool is_opener(char c) { return c == '{' || c == '(' || c == '['; }
bool is_closer(char c) { return c == '}' || c == ')' || c == ']'; }

char matching_opener(char closer)
{
  switch (closer) {
    case '}':
      return '{';
    case ')':
      return '(';
    default:
      return '[';
  }
}

char matching_closer(char opener)
{
  switch (opener) {
    case '{':
      return '}';
    case '(':
      return ')';
    default:
      return ']';
  }
}

std::string_view rtrim(std::string_view s)
{
  while (!s.empty() && (s.back() == ' ' || s.back() == '\t' || s.back() == '\r')) {
    s.remove_suffix(1);
  }
  return s;
}

std::string_view ltrim(std::string_view s)
{
  while (!s.empty() && (s.front() == ' ' || s.front() == '\t')) {
    s.remove_prefix(1);
  }
  return s;
}

bool starts_with(std::string_view s, std::string_view prefix)
{
  return s.substr(0, prefix.size()) == prefix;
}

bool starts_with_word(std::string_view s, std::string_view word)
{
  if (!starts_with(s, word)) {
    return false;
  }
  if (s.size() == word.size()) {
    return true;
  }
  const auto next = static_cast<unsigned char>(s[word.size()]);
  return std::isalnum(next) == 0 && next != '_';
}

bool is_access_specifier(std::string_view content)
{
  for (const std::string_view spec : {"public:", "protected:", "private:"}) {
    if (starts_with(content, spec)) {
      return true;
    }
  }
  return false;
}

struct FormattedLine
{
  std::string text;  ///< indented, right-trimmed; empty for a blank line
  std::string_view content;
};

class Formatter
{
public:
  explicit Formatter(std::string_view text) : text_(text) {}

  std::optional<std::string> run()
  {
    size_t pos = 0;
    while (pos <= text_.size()) {
      const size_t nl = text_.find('\n', pos);
      const size_t end = nl == std::string_view::npos ? text_.size() : nl;
      ++line_no_;
      if (!format_line(text_.substr(pos, end - pos))) {
        return std::nullopt;
      }
      if (nl == std::string_view::npos) {
        break;
      }
      pos = nl + 1;
    }

    if (in_block_comment_) {
      error_ = fmt::format("unterminated block comment opened at line {}", comment_line_);
      return std::nullopt;
    }
    if (!stack_.empty()) {
      const auto & open = stack_.back();
      error_ = fmt::format("unclosed '{}' opened at line {}", open.ch, open.line);
      return std::nullopt;
    }
    return assemble();
  }

  [[nodiscard]] const std::string & error() const noexcept { return error_; }

private:
  struct OpenBracket
  {
    char ch;
    bool indents;
    size_t line;
  };

  size_t depth() const
  {
    size_t d = 0;
    for (const auto & open : stack_) {
      if (open.indents) {
        ++d;
      }
    }
    return d;
  }

  bool format_line(std::string_view raw)
  {
    const std::string_view trimmed = rtrim(raw);

    // Inside a block comment the line is left as written.
    if (in_block_comment_) {
      lines_.push_back(FormattedLine{std::string(trimmed), ltrim(trimmed)});
      return scan(trimmed, nullptr);
    }

    const std::string_view content = ltrim(trimmed);
    if (content.empty()) {
      lines_.push_back(FormattedLine{});
      return true;
    }
    if (content.front() == '#') {
      lines_.push_back(FormattedLine{std::string(content), content});
      return true;
    }

    if (starts_with_word(content, "namespace") || starts_with_word(content, "inline")) {
      pending_namespace_ = content.find("namespace") != std::string_view::npos;
    }

    size_t line_depth = depth();
    if (!scan(content, &line_depth)) {
      return false;
    }

    size_t indent = line_depth * k_indent_width;
    if (is_access_specifier(content) && line_depth > 0) {
      indent = (line_depth - 1) * k_indent_width + 1;
    }
    lines_.push_back(FormattedLine{std::string(indent, ' ') + std::string(content), content});
    return true;
  }

  // Updates the bracket stack. Leading closers lower `*line_depth`.
  bool scan(std::string_view line, size_t * line_depth)
  {
    bool leading = line_depth != nullptr;
    char quote = 0;

    for (size_t i = 0; i < line.size(); ++i) {
      const char c = line[i];

      if (in_block_comment_) {
        if (c == '*' && i + 1 < line.size() && line[i + 1] == '/') {
          in_block_comment_ = false;
          ++i;
        }
        continue;
      }
      if (quote != 0) {
        if (c == '\\') {
          ++i;
        } else if (c == quote) {
          quote = 0;
        }
        continue;
      }

      if (c == '/' && i + 1 < line.size()) {
        if (line[i + 1] == '/') {
          break;
        }
        if (line[i + 1] == '*') {
          in_block_comment_ = true;
          comment_line_ = line_no_;
          ++i;
          continue;
        }
      }
      if (c == '"') {
        quote = c;
        leading = false;
        continue;
      }
      if (c == '\'') {
        // Digit separator, as in 1'000.
        if (i > 0 && std::isdigit(static_cast<unsigned char>(line[i - 1])) != 0) {
          continue;
        }
        quote = c;
        leading = false;
        continue;
      }

      if (is_closer(c)) {
        if (stack_.empty()) {
          error_ = fmt::format("unbalanced '{}' at line {}", c, line_no_);
          return false;
        }
        const auto open = stack_.back();
        if (open.ch != matching_opener(c)) {
          error_ = fmt::format(
            "mismatched '{}' at line {}, expected '{}' to close '{}' from line {}", c, line_no_,
            matching_closer(open.ch), open.ch, open.line);
          return false;
        }
        stack_.pop_back();
        if (leading && open.indents && *line_depth > 0) {
          --*line_depth;
        }
        continue;
      }

      if (c != ' ' && c != '\t') {
        leading = false;
      }
      if (c == ';') {
        pending_namespace_ = false;
      }
      if (is_opener(c)) {
        const bool namespace_body = c == '{' && pending_namespace_;
        if (c == '{') {
          pending_namespace_ = false;
        }
        stack_.push_back(OpenBracket{c, !namespace_body, line_no_});
      }
    }

    if (quote != 0) {
      error_ = fmt::format(
        "unterminated {} literal at line {}", quote == '"' ? "string" : "character", line_no_);
      return false;
    }
    return true;
  }

  std::string assemble() const
  {
    std::string out;
    bool pending_blank = false;
    bool after_open = false;

    for (const auto & line : lines_) {
      if (line.text.empty()) {
        pending_blank = !out.empty();
        continue;
      }
      if (pending_blank && !after_open && line.content.front() != '}') {
        out += '\n';
      }
      pending_blank = false;
      out += line.text;
      out += '\n';
      after_open = line.text.back() == '{';
    }
    return out;
  }

  std::string_view text_;
  std::vector<FormattedLine> lines_;
  std::vector<OpenBracket> stack_;
  size_t line_no_ = 0;
  bool in_block_comment_ = false;
  size_t comment_line_ = 0;
  bool pending_namespace_ = false;
  std::string error_;
};

}  // namespace

FormatResult format_source(std::string_view text)
{
  Formatter formatter(text);
  auto formatted = formatter.run();
  if (!formatted) {
    return FormatResult{std::string(text), false, formatter.error()};
  }
  return FormatResult{std::move(*formatted), true, {}};
}

}  // namespace authzgen::codegen
