// authzgen/codegen/source_formatter.hpp - Canonical layout for generated C++ source
#pragma once

#include <string>
#include <string_view>

namespace authzgen::codegen
{

struct FormatResult
{
  std::string text;
  bool ok = true;
  /// Set when `ok` is false; `text` then holds the input unchanged.
  std::string error;
};

/**
 * Re-indent C-family source by bracket nesting.
 *
 * - 2 spaces per `{`, `(` or `[` level; `namespace` bodies stay at column 0
 * - access specifiers (`public:` etc.) are indented by one space
 * - trailing whitespace stripped, blank-line runs collapsed, no blank line
 *   directly after `{` or before `}`
 * - exactly one trailing newline
 *
 * Only whitespace between lines and at line edges is touched. Fails on
 * unbalanced or mismatched brackets and on unterminated literals or block
 * comments.
 */
[[nodiscard]] FormatResult format_source(std::string_view text);

}  // namespace authzgen::codegen
