// test_extractor.cpp - AST to Schema normalization
//
#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "authzgen/sema/schema_extractor.hpp"
#include "authzgen/test_support/parse_helpers.hpp"

namespace authzgen
{

using test_support::extract;

TEST(SemaExtractor, EmptySchema)
{
  auto unit = extract("");
  ASSERT_TRUE(unit.schema.has_value());
  EXPECT_TRUE(unit.schema->definitions.empty());
  EXPECT_EQ(unit.schema->package_name(), "authz");
  EXPECT_EQ(unit.schema->package_name("fallback"), "fallback");
}

TEST(SemaExtractor, BareDefinitionUsesDefaultPackage)
{
  auto unit = extract("definition user {}");
  ASSERT_TRUE(unit.schema.has_value());
  ASSERT_EQ(unit.schema->definitions.size(), 1u);

  const Definition & def = unit.schema->definitions[0];
  EXPECT_EQ(def.name, "user");
  EXPECT_EQ(def.prefix, "");
  EXPECT_EQ(def.full_type, "user");
  EXPECT_EQ(def.package, "authz");

  ExtractOptions options;
  options.default_package = "acme";
  auto custom = extract("definition user {}", options);
  ASSERT_TRUE(custom.schema.has_value());
  EXPECT_EQ(custom.schema->definitions[0].package, "acme");
}

TEST(SemaExtractor, PrefixBecomesPackage)
{
  auto unit = extract("definition tenant/document {}");
  ASSERT_TRUE(unit.schema.has_value());

  const Definition & def = unit.schema->definitions[0];
  EXPECT_EQ(def.name, "document");
  EXPECT_EQ(def.prefix, "tenant");
  EXPECT_EQ(def.full_type, "tenant/document");
  EXPECT_EQ(def.package, "tenant");
}

TEST(SemaExtractor, PackageComesFromFirstDefinition)
{
  auto unit = extract("definition user {}\ndefinition tenant/document {}");
  ASSERT_TRUE(unit.schema.has_value());
  EXPECT_EQ(unit.schema->package_name(), "authz");

  auto prefixed_first = extract("definition tenant/document {}\ndefinition user {}");
  ASSERT_TRUE(prefixed_first.schema.has_value());
  EXPECT_EQ(prefixed_first.schema->package_name(), "tenant");
}

TEST(SemaExtractor, UnionFlattening)
{
  auto unit = extract("definition doc { relation viewer: a | b | c\n relation owner: user }");
  ASSERT_TRUE(unit.schema.has_value());

  const auto & rels = unit.schema->definitions[0].relations;
  ASSERT_EQ(rels.size(), 2u);

  EXPECT_EQ(rels[0].name, "viewer");
  EXPECT_EQ(rels[0].types, (std::vector<std::string>{"a", "b", "c"}));
  EXPECT_TRUE(rels[0].is_union);

  EXPECT_EQ(rels[1].types, (std::vector<std::string>{"user"}));
  EXPECT_FALSE(rels[1].is_union);
}

TEST(SemaExtractor, SubjectFragmentKeptVerbatim)
{
  auto unit = extract("definition folder { relation editor: document#editor | tenant/team#member }");
  ASSERT_TRUE(unit.schema.has_value());

  const Relation & rel = unit.schema->definitions[0].relations[0];
  EXPECT_EQ(rel.types, (std::vector<std::string>{"document#editor", "tenant/team#member"}));
}

TEST(SemaExtractor, PermissionExpressionText)
{
  auto unit = extract(
    "definition doc {\n"
    "  relation parent: folder\n"
    "  permission view = viewer+parent->view\n"
    "  permission edit = owner\n"
    "}");
  ASSERT_TRUE(unit.schema.has_value());

  const auto & perms = unit.schema->definitions[0].permissions;
  ASSERT_EQ(perms.size(), 2u);
  EXPECT_EQ(perms[0].name, "view");
  EXPECT_EQ(perms[0].expression_text, "viewer + parent -> view");
  EXPECT_EQ(perms[1].expression_text, "owner");
}

TEST(SemaExtractor, SourceOrderIsPreserved)
{
  auto unit = extract("definition zeta {}\ndefinition alpha {}\ndefinition mid {}");
  ASSERT_TRUE(unit.schema.has_value());

  const auto & defs = unit.schema->definitions;
  ASSERT_EQ(defs.size(), 3u);
  EXPECT_EQ(defs[0].name, "zeta");
  EXPECT_EQ(defs[1].name, "alpha");
  EXPECT_EQ(defs[2].name, "mid");
}

TEST(SemaExtractor, DuplicateDefinition)
{
  auto unit = extract("definition user {}\ndefinition user {}");
  EXPECT_FALSE(unit.schema.has_value());

  const Diagnostic * diag = unit.parsed.diags.find_code("E2001");
  ASSERT_NE(diag, nullptr);
  EXPECT_EQ(diag->message, "duplicate definition 'user'");
  ASSERT_EQ(diag->labels.size(), 2u);
  EXPECT_EQ(diag->labels[0].message, "redefined here");
  EXPECT_EQ(unit.parsed.full_range(diag->labels[0].range).start_line, 2u);
  EXPECT_EQ(diag->labels[1].style, LabelStyle::Secondary);
  EXPECT_EQ(unit.parsed.full_range(diag->labels[1].range).start_line, 1u);
}

TEST(SemaExtractor, SameNameDifferentPrefixIsDistinct)
{
  auto unit = extract("definition user {}\ndefinition tenant/user {}");
  ASSERT_TRUE(unit.schema.has_value());
  EXPECT_EQ(unit.schema->definitions.size(), 2u);
}

TEST(SemaExtractor, DuplicateRelation)
{
  auto unit = extract("definition doc { relation owner: user\n relation owner: team }");
  EXPECT_FALSE(unit.schema.has_value());

  const Diagnostic * diag = unit.parsed.diags.find_code("E2002");
  ASSERT_NE(diag, nullptr);
  EXPECT_EQ(diag->message, "duplicate relation 'owner' in definition 'doc'");
  EXPECT_EQ(unit.parsed.slice(diag->primary_range()), "owner");
}

TEST(SemaExtractor, PermissionMayNotShadowRelation)
{
  auto unit = extract("definition doc { relation view: user\n permission view = view }");
  EXPECT_FALSE(unit.schema.has_value());

  const Diagnostic * diag = unit.parsed.diags.find_code("E2002");
  ASSERT_NE(diag, nullptr);
  EXPECT_EQ(diag->message, "duplicate permission 'view' in definition 'doc'");
}

TEST(SemaExtractor, ReportsEveryDuplicate)
{
  auto unit = extract(
    "definition a { relation r: x\n relation r: y }\n"
    "definition b { permission p = q\n permission p = q }\n"
    "definition a {}");
  EXPECT_FALSE(unit.schema.has_value());
  EXPECT_EQ(unit.parsed.diags.errors().size(), 3u);
}

TEST(SemaExtractor, ErrorCountWithoutDiagnosticBag)
{
  auto parsed = test_support::parse("definition a {}\ndefinition a {}");
  ASSERT_TRUE(parsed.success);

  SchemaExtractor extractor;
  EXPECT_FALSE(extractor.extract(parsed.definitions).has_value());
  EXPECT_TRUE(extractor.has_errors());
  EXPECT_EQ(extractor.error_count(), 1u);
}

}  // namespace authzgen
