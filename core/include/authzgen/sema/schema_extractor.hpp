// authzgen/sema/schema_extractor.hpp - AST -> Schema normalization pass
//
// Flattens relation unions into ordered subject-type lists, re-serializes
// permission expressions and assigns each definition its package. Rejects
// duplicate definitions and duplicate member names.
//
#pragma once

#include <optional>
#include <string>
#include <vector>

#include "authzgen/ast/ast.hpp"
#include "authzgen/basic/diagnostic.hpp"
#include "authzgen/sema/schema.hpp"

namespace authzgen
{

struct ExtractOptions
{
  /// Package used for definitions without a prefix.
  std::string default_package = std::string(k_default_package);
};

/**
 * Builds a Schema from parsed definitions.
 *
 * ## Usage
 * ```cpp
 * SchemaExtractor extractor({}, &diags);
 * if (auto schema = extractor.extract(defs)) { ... }
 * ```
 */
class SchemaExtractor
{
public:
  explicit SchemaExtractor(ExtractOptions options = {}, DiagnosticBag * diags = nullptr);

  /**
   * Normalize `definitions`, preserving source order.
   *
   * @return the schema, or std::nullopt if any semantic error was reported
   */
  [[nodiscard]] std::optional<Schema> extract(const std::vector<DefinitionNode *> & definitions);

  [[nodiscard]] bool has_errors() const noexcept { return error_count_ > 0; }
  [[nodiscard]] size_t error_count() const noexcept { return error_count_; }

private:
  [[nodiscard]] Definition extract_definition(const DefinitionNode & def);
  void check_duplicate_definitions(const std::vector<DefinitionNode *> & definitions);
  void check_duplicate_members(const DefinitionNode & def);

  ExtractOptions options_;
  DiagnosticBag * diags_;
  size_t error_count_ = 0;
};

}  // namespace authzgen
