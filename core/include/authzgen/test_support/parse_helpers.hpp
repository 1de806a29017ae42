// authzgen/test_support/parse_helpers.hpp - helpers for unit tests
//
// Single-document parse and extract pipelines that keep the SourceRegistry
// and AstContext alive alongside the results.
//
#pragma once

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "authzgen/ast/ast_context.hpp"
#include "authzgen/basic/diagnostic.hpp"
#include "authzgen/basic/source_manager.hpp"
#include "authzgen/sema/schema_extractor.hpp"
#include "authzgen/syntax/frontend.hpp"

namespace authzgen::test_support
{

struct TestParseUnit
{
  SourceRegistry sources;
  FileId file_id = FileId::invalid();
  std::unique_ptr<AstContext> ast;
  DiagnosticBag diags;
  std::vector<DefinitionNode *> definitions;
  bool success = false;

  [[nodiscard]] std::string_view slice(SourceRange r) const noexcept
  {
    return sources.get_slice(r);
  }

  [[nodiscard]] FullSourceRange full_range(SourceRange r) const noexcept
  {
    return sources.get_full_range(r);
  }
};

[[nodiscard]] inline TestParseUnit parse(
  std::string src, const std::filesystem::path & virtual_path = "<test>.zed",
  ParseMode mode = ParseMode::FirstError)
{
  TestParseUnit out;
  out.ast = std::make_unique<AstContext>();

  const ParseOutput parsed =
    parse_source(out.sources, virtual_path, std::move(src), *out.ast, out.diags, mode);
  out.file_id = parsed.file_id;
  out.definitions = parsed.definitions;
  out.success = parsed.success;
  return out;
}

/// Parse then extract. `schema` is empty if either step failed.
struct TestSchemaUnit
{
  TestParseUnit parsed;
  std::optional<Schema> schema;
};

[[nodiscard]] inline TestSchemaUnit extract(std::string src, ExtractOptions options = {})
{
  TestSchemaUnit out{parse(std::move(src)), std::nullopt};
  if (out.parsed.success) {
    SchemaExtractor extractor(std::move(options), &out.parsed.diags);
    out.schema = extractor.extract(out.parsed.definitions);
  }
  return out;
}

}  // namespace authzgen::test_support
