// authzgen/driver/compiler.cpp - Compiler driver implementation
//
#include "authzgen/driver/compiler.hpp"

#include <fmt/core.h>

#include <utility>

#include "authzgen/ast/ast_context.hpp"
#include "authzgen/codegen/naming.hpp"
#include "authzgen/sema/schema_extractor.hpp"
#include "authzgen/syntax/frontend.hpp"

namespace authzgen
{

bool Compiler::cancelled(const CompileOptions & options, CompileResult & result, const char * stage)
{
  if (!options.cancel_requested || !options.cancel_requested()) {
    return false;
  }
  result.diagnostics.report_error(SourceRange{}, fmt::format("compilation cancelled {}", stage))
    .with_code(diag_code::k_cancelled);
  return true;
}

bool Compiler::options_valid(const CompileOptions & options, CompileResult & result)
{
  if (!codegen::is_identifier(options.default_package)) {
    result.diagnostics
      .report_error(
        SourceRange{}, fmt::format("invalid package name '{}'", options.default_package))
      .with_code(diag_code::k_invalid_option)
      .with_help("a package must be an identifier such as 'authz'");
    return false;
  }
  if (!codegen::is_file_extension(options.file_extension)) {
    result.diagnostics
      .report_error(
        SourceRange{}, fmt::format("invalid file extension '{}'", options.file_extension))
      .with_code(diag_code::k_invalid_option)
      .with_help("an extension must be non-empty without path separators");
    return false;
  }
  return true;
}

CompileResult Compiler::compile_source(
  std::string source_text, const std::filesystem::path & virtual_path,
  const CompileOptions & options, OutputWriter * writer)
{
  std::vector<SourceText> inputs;
  inputs.push_back(SourceText{virtual_path, std::move(source_text)});
  return compile_sources(std::move(inputs), options, writer);
}

CompileResult Compiler::compile_sources(
  std::vector<SourceText> inputs, const CompileOptions & options, OutputWriter * writer)
{
  CompileResult result;

  if (!options_valid(options, result)) {
    return result;
  }

  if (cancelled(options, result, "before parsing")) {
    return result;
  }

  // 1. Parse
  AstContext ast;
  const ParseMode parse_mode =
    options.mode == CompileMode::Check ? ParseMode::CollectAll : ParseMode::FirstError;
  const ParseOutput parsed =
    parse_sources(result.sources, std::move(inputs), ast, result.diagnostics, parse_mode);
  if (!parsed.success) {
    return result;
  }

  if (cancelled(options, result, "before semantic analysis")) {
    return result;
  }

  // 2. Extract the normalized schema
  SchemaExtractor extractor(ExtractOptions{options.default_package}, &result.diagnostics);
  result.schema = extractor.extract(parsed.definitions);
  if (!result.schema) {
    return result;
  }

  if (options.mode == CompileMode::Check) {
    result.success = !result.diagnostics.has_errors();
    return result;
  }

  if (cancelled(options, result, "before code generation")) {
    return result;
  }

  // 3. Generate
  codegen::CodeGenOptions gen_options;
  gen_options.default_package = options.default_package;
  gen_options.file_extension = options.file_extension;
  gen_options.format = options.format_output;
  gen_options.template_text = options.template_text;

  try {
    result.unit = codegen::CodeGenerator(std::move(gen_options)).generate(*result.schema);
  } catch (const codegen::GenerationError & e) {
    result.diagnostics
      .report_error(SourceRange{}, fmt::format("code generation failed: {}", e.what()))
      .with_code(diag_code::k_generation);
    return result;
  }

  if (!result.unit->formatted && !result.unit->format_error.empty()) {
    result.diagnostics
      .report_warning(
        SourceRange{},
        fmt::format("generated source could not be formatted: {}", result.unit->format_error))
      .with_code(diag_code::k_format_fallback)
      .with_help("the unformatted source was emitted instead");
  }

  if (cancelled(options, result, "before writing output")) {
    return result;
  }

  // 4. Write
  if (writer != nullptr) {
    const std::filesystem::path output_path = options.output_dir / result.unit->file_name;
    try {
      writer->write(output_path, result.unit->source);
    } catch (const IoError & e) {
      result.diagnostics.report_error(SourceRange{}, e.what()).with_code(diag_code::k_io);
      return result;
    }
    result.generated_files.push_back(output_path);
  }

  result.success = !result.diagnostics.has_errors();
  return result;
}

CompileResult Compiler::compile_path(
  const std::filesystem::path & input, const CompileOptions & options, OutputWriter & writer)
{
  SchemaInput schema_input;
  try {
    schema_input = read_schema_input(input);
  } catch (const IoError & e) {
    CompileResult result;
    result.diagnostics.report_error(SourceRange{}, e.what()).with_code(diag_code::k_io);
    return result;
  }
  return compile_sources(std::move(schema_input.files), options, &writer);
}

}  // namespace authzgen
