// authzgen/codegen/template_engine.hpp - Handlebars-style template subset over JSON data
//
// Supported tags:
//   {{path}}  {{.}}  {{@index}}  {{path | helper | helper}}  {{"literal" | helper}}
//   {{#each path}}...{{/each}}
//   {{#if path}}...{{else}}...{{/if}}   {{#unless path}}...{{/unless}}
//   {{! comment }}
//
// A line that holds nothing but a block tag (#, /, else, !) is dropped from
// the output together with its newline.
//
#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace authzgen::codegen
{

/// Compile or render failure. `line()` is the 1-based template line.
class TemplateError : public std::runtime_error
{
public:
  TemplateError(const std::string & message, size_t line);

  [[nodiscard]] size_t line() const noexcept { return line_; }
  [[nodiscard]] const std::string & message() const noexcept { return message_; }

private:
  std::string message_;
  size_t line_;
};

using TemplateHelper = std::function<std::string(const std::string &)>;
using HelperTable = std::map<std::string, TemplateHelper, std::less<>>;

enum class TemplateNodeKind : uint8_t {
  Text,
  Value,
  Each,
  If,
  Unless,
};

struct TemplateNode
{
  TemplateNodeKind kind = TemplateNodeKind::Text;
  size_t line = 1;

  /// Text: literal output. Value: variable path or literal string.
  /// Blocks: the path being tested or iterated.
  std::string text;
  bool is_literal = false;
  std::vector<std::string> helpers;

  std::vector<TemplateNode> body;
  std::vector<TemplateNode> else_body;
  bool has_else = false;
};

/**
 * A compiled template.
 *
 * Helpers are resolved at compile time, so an unknown helper is reported
 * before anything is rendered.
 *
 * ```cpp
 * auto tmpl = Template::compile("Hello {{name | lower}}\n", helpers);
 * std::string out = tmpl.render({{"name", "World"}});
 * ```
 */
class Template
{
public:
  /// @throws TemplateError on malformed tags, unbalanced blocks or unknown helpers
  [[nodiscard]] static Template compile(std::string_view source, HelperTable helpers = {});

  /// @throws TemplateError on undefined variables or `#each` over a non-array
  [[nodiscard]] std::string render(const nlohmann::json & data) const;

  [[nodiscard]] const std::vector<TemplateNode> & nodes() const noexcept { return nodes_; }

private:
  Template() = default;

  std::vector<TemplateNode> nodes_;
  HelperTable helpers_;
};

}  // namespace authzgen::codegen
