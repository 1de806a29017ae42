// authzgen/syntax/frontend.cpp - Source registration, lexing and parsing
#include "authzgen/syntax/frontend.hpp"

#include <utility>

#include "authzgen/syntax/lexer.hpp"
#include "authzgen/syntax/parser.hpp"

namespace authzgen
{

ParseOutput parse_source(
  SourceRegistry & sources, const std::filesystem::path & path, std::string source_text,
  AstContext & ast, DiagnosticBag & diags, ParseMode mode)
{
  ParseOutput out;
  out.file_id = sources.register_file(path, std::move(source_text));

  const SourceFile * file = sources.get_file(out.file_id);
  if (file == nullptr) {
    diags.report_error(SourceRange{}, "too many source files registered: " + path.string())
      .with_code(diag_code::k_io);
    return out;
  }

  syntax::Parser parser(ast, syntax::tokenize(file->content(), out.file_id));

  if (mode == ParseMode::CollectAll) {
    std::vector<syntax::SyntaxError> errors;
    out.definitions = parser.parse_definitions_recovering(errors);
    for (const auto & err : errors) {
      diags.add(err.to_diagnostic());
    }
    out.success = errors.empty();
    return out;
  }

  auto result = parser.parse_definitions();
  if (!result) {
    diags.add(result.error().to_diagnostic());
    return out;
  }
  out.definitions = std::move(result).value();
  out.success = true;
  return out;
}

ParseOutput parse_sources(
  SourceRegistry & sources, std::vector<SourceText> inputs, AstContext & ast,
  DiagnosticBag & diags, ParseMode mode)
{
  ParseOutput out;
  out.success = true;
  for (auto & input : inputs) {
    ParseOutput parsed =
      parse_source(sources, input.path, std::move(input.text), ast, diags, mode);
    if (!out.file_id.is_valid()) {
      out.file_id = parsed.file_id;
    }
    out.definitions.insert(
      out.definitions.end(), parsed.definitions.begin(), parsed.definitions.end());
    if (!parsed.success) {
      out.success = false;
      if (mode == ParseMode::FirstError) {
        break;
      }
    }
  }
  return out;
}

}  // namespace authzgen
