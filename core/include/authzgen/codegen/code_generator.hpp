// authzgen/codegen/code_generator.hpp - Schema -> typed C++ client header
#pragma once

#include <gsl/span>
#include <nlohmann/json.hpp>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

#include "authzgen/codegen/source_formatter.hpp"
#include "authzgen/codegen/template_engine.hpp"
#include "authzgen/sema/schema.hpp"

namespace authzgen::codegen
{

/// Fatal render failure: template errors or generated-name collisions.
class GenerationError : public std::runtime_error
{
public:
  using std::runtime_error::runtime_error;
};

struct CodeGenOptions
{
  /// Package used when the schema has no definitions.
  std::string default_package = std::string(k_default_package);
  std::string file_extension = "gen.hpp";
  bool format = true;
  /// Replaces the built-in template when set.
  std::optional<std::string> template_text;
};

struct GeneratedUnit
{
  std::string package;
  std::string file_name;  ///< `<package>.<extension>`
  std::string source;
  bool formatted = false;
  /// Formatter message when formatting was requested and failed.
  std::string format_error;
};

/// Helpers available to templates: camelcase, lower, extract_type,
/// object_type, subject_relation, identifier.
[[nodiscard]] HelperTable schema_helpers();

/// The template used when CodeGenOptions::template_text is unset.
[[nodiscard]] std::string_view builtin_template();

/// Namespace-scope types the built-in template always declares.
[[nodiscard]] gsl::span<const std::string_view> builtin_template_types();

/**
 * Generates one header per schema.
 *
 * The pipeline is render (template instantiation) followed by format. Both
 * steps are public so they can be tested separately.
 *
 * ```cpp
 * CodeGenerator gen;
 * GeneratedUnit unit = gen.generate(schema);
 * ```
 */
class CodeGenerator
{
public:
  explicit CodeGenerator(CodeGenOptions options = {});

  /**
   * Template data for `schema`. Definitions are sorted by name, then prefix.
   *
   * @throws GenerationError when two names map to the same generated identifier
   */
  [[nodiscard]] nlohmann::json build_template_data(const Schema & schema) const;

  /// @throws GenerationError
  [[nodiscard]] std::string render(const Schema & schema) const;

  [[nodiscard]] static FormatResult format(std::string_view text);

  /**
   * Render and format. A formatting failure is not fatal: the unformatted
   * text is returned with `formatted == false`.
   *
   * @throws GenerationError
   */
  [[nodiscard]] GeneratedUnit generate(const Schema & schema) const;

  [[nodiscard]] const CodeGenOptions & options() const noexcept { return options_; }

private:
  CodeGenOptions options_;
};

}  // namespace authzgen::codegen
