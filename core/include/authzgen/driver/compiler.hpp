// authzgen/driver/compiler.hpp - Compiler driver
//
// Single entry point for the compile pipeline:
// parse -> extract -> generate -> write.
// Used by the CLI and embeddable in other tools.
//
#pragma once

#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "authzgen/basic/diagnostic.hpp"
#include "authzgen/basic/source_manager.hpp"
#include "authzgen/codegen/code_generator.hpp"
#include "authzgen/driver/schema_io.hpp"
#include "authzgen/sema/schema.hpp"

namespace authzgen
{

// ============================================================================
// Compile Mode
// ============================================================================

enum class CompileMode {
  Check,  ///< Syntax and semantic checks only, collecting every syntax error
  Build,  ///< Full build including code generation
};

// ============================================================================
// Compile Options
// ============================================================================

struct CompileOptions
{
  CompileMode mode = CompileMode::Build;

  /// Directory the generated header is written to
  std::filesystem::path output_dir = ".";

  /// Package for definitions without a prefix; must be an identifier (E6001)
  std::string default_package = std::string(k_default_package);

  /// Generated file name is `<package>.<file_extension>`
  std::string file_extension = "gen.hpp";

  bool format_output = true;

  /// Custom template text; the built-in template is used when unset
  std::optional<std::string> template_text;

  /// Polled between stages; returning true stops the compile with E5001
  std::function<bool()> cancel_requested;
};

// ============================================================================
// Compile Result
// ============================================================================

struct CompileResult
{
  /// Whether compilation succeeded (no errors)
  bool success = false;

  /// Collected diagnostics (errors, warnings, etc.)
  DiagnosticBag diagnostics;

  /// Sources the diagnostics refer to
  SourceRegistry sources;

  /// Normalized schema, once extraction succeeded
  std::optional<Schema> schema;

  /// Generated unit (Build mode only)
  std::optional<codegen::GeneratedUnit> unit;

  /// Files handed to the writer (Build mode only)
  std::vector<std::filesystem::path> generated_files;
};

// ============================================================================
// Compiler
// ============================================================================

class Compiler
{
public:
  /**
   * Compile schema text.
   *
   * @param source_text Document text
   * @param virtual_path Path used in diagnostics
   * @param writer Receives the generated file; nullptr keeps the output in
   *        CompileResult::unit only
   */
  [[nodiscard]] static CompileResult compile_source(
    std::string source_text, const std::filesystem::path & virtual_path,
    const CompileOptions & options, OutputWriter * writer = nullptr);

  /**
   * Compile several files as one schema. Each file is registered on its own,
   * so diagnostics name the file and the line within it.
   */
  [[nodiscard]] static CompileResult compile_sources(
    std::vector<SourceText> inputs, const CompileOptions & options,
    OutputWriter * writer = nullptr);

  /**
   * Compile a schema file or a directory of `*.zed` files.
   *
   * Read failures are reported as E4001 diagnostics.
   */
  [[nodiscard]] static CompileResult compile_path(
    const std::filesystem::path & input, const CompileOptions & options, OutputWriter & writer);

private:
  static bool options_valid(const CompileOptions & options, CompileResult & result);
  static bool cancelled(const CompileOptions & options, CompileResult & result, const char * stage);
};

}  // namespace authzgen
