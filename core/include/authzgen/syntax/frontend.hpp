// authzgen/syntax/frontend.hpp - High-level parse pipeline entry point
#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "authzgen/ast/ast.hpp"
#include "authzgen/ast/ast_context.hpp"
#include "authzgen/basic/diagnostic.hpp"
#include "authzgen/basic/source_manager.hpp"

namespace authzgen
{

enum class ParseMode {
  FirstError,   ///< abort on the first syntax error
  CollectAll,   ///< resynchronize at each `definition` and keep going
};

struct ParseOutput
{
  FileId file_id = FileId::invalid();
  std::vector<DefinitionNode *> definitions;
  bool success = false;
};

// source -> lexer (token stream) -> recursive-descent parser (AST) -> diagnostics
[[nodiscard]] ParseOutput parse_source(
  SourceRegistry & sources, const std::filesystem::path & path, std::string source_text,
  AstContext & ast, DiagnosticBag & diags, ParseMode mode = ParseMode::FirstError);

/**
 * Registers and parses each input as its own file, so diagnostics point into
 * the file they came from. Definitions are concatenated in input order.
 *
 * `file_id` is the first input's. In FirstError mode parsing stops at the
 * first file with an error.
 */
[[nodiscard]] ParseOutput parse_sources(
  SourceRegistry & sources, std::vector<SourceText> inputs, AstContext & ast,
  DiagnosticBag & diags, ParseMode mode = ParseMode::FirstError);

}  // namespace authzgen
