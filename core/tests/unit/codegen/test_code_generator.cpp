// test_code_generator.cpp - Template data, rendering and the generated client header
//
#include <gtest/gtest.h>

#include <nlohmann/json.hpp>
#include <string>

#include "authzgen/codegen/code_generator.hpp"
#include "authzgen/test_support/parse_helpers.hpp"

namespace authzgen::codegen
{

namespace
{

constexpr const char * k_document_schema = R"(
definition user {}

definition group {
  relation member: user | group#member
}

definition document {
  relation owner: user
  relation viewer: user | group#member
  permission edit = owner
  permission view = viewer + edit
}
)";

Schema schema_of(std::string src)
{
  auto unit = test_support::extract(std::move(src));
  EXPECT_TRUE(unit.schema.has_value());
  return unit.schema.value_or(Schema{});
}

bool contains(const std::string & haystack, std::string_view needle)
{
  return haystack.find(needle) != std::string::npos;
}

std::string generation_error(const Schema & schema, CodeGenOptions options = {})
{
  try {
    (void)CodeGenerator(std::move(options)).generate(schema);
  } catch (const GenerationError & e) {
    return e.what();
  }
  ADD_FAILURE() << "generation succeeded unexpectedly";
  return {};
}

}  // namespace

// ============================================================================
// Template data
// ============================================================================

TEST(CodegenGenerator, TemplateDataIsSortedByName)
{
  const Schema schema = schema_of(k_document_schema);
  const nlohmann::json data = CodeGenerator().build_template_data(schema);

  EXPECT_EQ(data["package"], "authz");
  EXPECT_EQ(data["namespace"], "authz");
  ASSERT_EQ(data["definitions"].size(), 3u);
  EXPECT_EQ(data["definitions"][0]["definition"], "document");
  EXPECT_EQ(data["definitions"][1]["definition"], "group");
  EXPECT_EQ(data["definitions"][2]["definition"], "user");
}

TEST(CodegenGenerator, TemplateDataRelationShape)
{
  const Schema schema = schema_of(k_document_schema);
  const nlohmann::json data = CodeGenerator().build_template_data(schema);

  const nlohmann::json & document = data["definitions"][0];
  EXPECT_EQ(document["full_type"], "document");
  EXPECT_EQ(document["prefix"], "");
  ASSERT_EQ(document["relations"].size(), 2u);

  const nlohmann::json & viewer = document["relations"][1];
  EXPECT_EQ(viewer["relation"], "viewer");
  EXPECT_EQ(viewer["is_union"], true);
  ASSERT_EQ(viewer["types"].size(), 2u);
  EXPECT_EQ(viewer["types"][1]["subject"], "group#member");
  EXPECT_EQ(viewer["types"][1]["object_type"], "group");
  EXPECT_EQ(viewer["types"][1]["subject_relation"], "member");

  ASSERT_EQ(document["permissions"].size(), 2u);
  EXPECT_EQ(document["permissions"][1]["permission"], "view");
  EXPECT_EQ(document["permissions"][1]["expression"], "viewer + edit");
}

TEST(CodegenGenerator, SortIgnoresPrefix)
{
  const Schema schema = schema_of("definition tenant/zeta {}\ndefinition alpha {}");
  const nlohmann::json data = CodeGenerator().build_template_data(schema);

  ASSERT_EQ(data["definitions"].size(), 2u);
  EXPECT_EQ(data["definitions"][0]["full_type"], "alpha");
  EXPECT_EQ(data["definitions"][1]["full_type"], "tenant/zeta");
  EXPECT_EQ(data["definitions"][1]["package"], "tenant");
  EXPECT_EQ(data["package"], "tenant");
}

// ============================================================================
// Generated header
// ============================================================================

TEST(CodegenGenerator, BuiltinHeaderContents)
{
  const GeneratedUnit unit = CodeGenerator().generate(schema_of(k_document_schema));

  EXPECT_EQ(unit.package, "authz");
  EXPECT_EQ(unit.file_name, "authz.gen.hpp");
  EXPECT_TRUE(unit.formatted);
  EXPECT_TRUE(unit.format_error.empty());

  const std::string & src = unit.source;
  EXPECT_EQ(src.rfind("// Code generated by authzgen. DO NOT EDIT.\n", 0), 0u);
  EXPECT_TRUE(contains(src, "#pragma once\n"));
  EXPECT_TRUE(contains(src, "\nnamespace authz\n{\n"));
  EXPECT_TRUE(contains(src, "class Client\n{\n public:\n  virtual ~Client() = default;\n"));

  EXPECT_TRUE(contains(src, "class Document\n{\n public:\n"));
  EXPECT_TRUE(contains(src, "  static constexpr std::string_view k_type = \"document\";\n"));
  EXPECT_TRUE(contains(src, "  explicit Document(std::string id) : id_(std::move(id)) {}\n"));

  EXPECT_TRUE(contains(src, "  // relation viewer: user | group#member\n"));
  EXPECT_TRUE(contains(src, "  static constexpr std::string_view k_viewer_subject_types[] = {\n"));
  EXPECT_TRUE(contains(src, "    \"group#member\",\n"));
  EXPECT_TRUE(contains(src, "  void AddViewer(Client & client, const SubjectRef & subject) const\n"));
  EXPECT_TRUE(contains(src, "  void RemoveViewer(Client & client, const SubjectRef & subject) const\n"));
  EXPECT_TRUE(contains(src, "ReadViewer(Client & client) const\n"));
  EXPECT_TRUE(contains(src, "HasViewer(Client & client, const SubjectRef & subject) const\n"));
  EXPECT_TRUE(contains(src, "  static SubjectRef ViewerFromUser(std::string id)\n"));
  EXPECT_TRUE(contains(src, "  static SubjectRef ViewerFromGroupMember(std::string id)\n"));
  EXPECT_TRUE(contains(
    src, "    return SubjectRef{ObjectRef{\"group\", std::move(id)}, \"member\"};\n"));

  EXPECT_TRUE(contains(src, "  // permission view = viewer + edit\n"));
  EXPECT_TRUE(contains(
    src, "  [[nodiscard]] bool CheckView(Client & client, const SubjectRef & subject) const\n"));
  EXPECT_TRUE(contains(src, "  [[nodiscard]] static std::vector<Document> LookupView(\n"));
  EXPECT_TRUE(contains(src, " private:\n  std::string id_;\n};\n"));

  EXPECT_TRUE(contains(src, "class Group\n"));
  EXPECT_TRUE(contains(src, "class User\n"));
  EXPECT_EQ(src.substr(src.size() - 22), "}  // namespace authz\n");
}

TEST(CodegenGenerator, ClassesFollowSortedOrder)
{
  const std::string src = CodeGenerator().generate(schema_of(k_document_schema)).source;
  const size_t document = src.find("class Document\n");
  const size_t group = src.find("class Group\n");
  const size_t user = src.find("class User\n");
  ASSERT_NE(document, std::string::npos);
  EXPECT_LT(document, group);
  EXPECT_LT(group, user);
}

TEST(CodegenGenerator, FormattedOutputHasNoDoubleBlankLines)
{
  const std::string src = CodeGenerator().generate(schema_of(k_document_schema)).source;
  EXPECT_FALSE(contains(src, "\n\n\n"));
  EXPECT_FALSE(contains(src, "{\n\n"));
  EXPECT_FALSE(contains(src, " \n"));
}

TEST(CodegenGenerator, EmptySchemaStillProducesHeader)
{
  CodeGenOptions options;
  options.default_package = "acme";
  const GeneratedUnit unit = CodeGenerator(options).generate(Schema{});

  EXPECT_EQ(unit.package, "acme");
  EXPECT_EQ(unit.file_name, "acme.gen.hpp");
  EXPECT_TRUE(contains(unit.source, "namespace acme\n{\n"));
  EXPECT_TRUE(contains(unit.source, "class Client\n"));
}

TEST(CodegenGenerator, PackageOfFirstDefinitionWins)
{
  const GeneratedUnit bare_first =
    CodeGenerator().generate(schema_of("definition user {}\ndefinition tenant/doc {}"));
  EXPECT_EQ(bare_first.package, "authz");
  EXPECT_TRUE(contains(bare_first.source, "namespace authz\n"));
  EXPECT_TRUE(contains(bare_first.source, "k_type = \"tenant/doc\";"));

  const GeneratedUnit prefixed_first =
    CodeGenerator().generate(schema_of("definition tenant/doc {}\ndefinition user {}"));
  EXPECT_EQ(prefixed_first.package, "tenant");
  EXPECT_EQ(prefixed_first.file_name, "tenant.gen.hpp");
}

TEST(CodegenGenerator, OutputIsIndependentOfDefinitionOrder)
{
  const std::string forward = CodeGenerator().generate(schema_of(k_document_schema)).source;
  const std::string reversed = CodeGenerator()
                                 .generate(schema_of(R"(
definition document {
  relation owner: user
  relation viewer: user | group#member
  permission edit = owner
  permission view = viewer + edit
}
definition group { relation member: user | group#member }
definition user {}
)"))
                                 .source;
  EXPECT_EQ(forward, reversed);
}

TEST(CodegenGenerator, PackageNamespaceIsSanitized)
{
  CodeGenOptions options;
  options.default_package = "class";
  const GeneratedUnit unit = CodeGenerator(options).generate(Schema{});
  EXPECT_TRUE(contains(unit.source, "namespace class_\n"));
  EXPECT_EQ(unit.file_name, "class.gen.hpp");
}

TEST(CodegenGenerator, FileExtensionOption)
{
  CodeGenOptions options;
  options.file_extension = "h";
  EXPECT_EQ(CodeGenerator(options).generate(Schema{}).file_name, "authz.h");
}

// ============================================================================
// Format step
// ============================================================================

TEST(CodegenGenerator, FormattingCanBeDisabled)
{
  CodeGenOptions options;
  options.format = false;
  options.template_text = "namespace {{namespace}}\n{\n    int x;\n\n\n}\n";

  const GeneratedUnit unit = CodeGenerator(options).generate(Schema{});
  EXPECT_FALSE(unit.formatted);
  EXPECT_TRUE(unit.format_error.empty());
  EXPECT_EQ(unit.source, "namespace authz\n{\n    int x;\n\n\n}\n");
}

TEST(CodegenGenerator, FormatFailureFallsBackToRenderedText)
{
  CodeGenOptions options;
  options.template_text = "struct {{namespace}} {\n  int x;\n";

  const GeneratedUnit unit = CodeGenerator(options).generate(Schema{});
  EXPECT_FALSE(unit.formatted);
  EXPECT_EQ(unit.format_error, "unclosed '{' opened at line 1");
  EXPECT_EQ(unit.source, "struct authz {\n  int x;\n");
}

TEST(CodegenGenerator, RenderAndFormatAreSeparateSteps)
{
  CodeGenOptions options;
  options.template_text = "struct S {\nint {{namespace}};\n};\n";
  const CodeGenerator gen(options);

  const std::string rendered = gen.render(Schema{});
  EXPECT_EQ(rendered, "struct S {\nint authz;\n};\n");

  const FormatResult formatted = CodeGenerator::format(rendered);
  ASSERT_TRUE(formatted.ok);
  EXPECT_EQ(formatted.text, "struct S {\n  int authz;\n};\n");
}

TEST(CodegenGenerator, CustomTemplateSeesSchemaData)
{
  CodeGenOptions options;
  options.format = false;
  options.template_text =
    "{{#each definitions}}\n"
    "{{definition | camelcase}}:{{#each relations}} {{relation}}={{#each types}}{{subject | "
    "extract_type}}{{/each}}{{/each}}\n"
    "{{/each}}\n";

  const std::string out =
    CodeGenerator(options).render(schema_of("definition b { relation r: x }\ndefinition a {}"));
  EXPECT_EQ(out, "A:\nB: r=x\n");
}

// ============================================================================
// Errors
// ============================================================================

TEST(CodegenGeneratorErrors, TemplateErrorsBecomeGenerationErrors)
{
  CodeGenOptions options;
  options.template_text = "{{#each definitions}}\n{{definition | shout}}\n{{/each}}\n";
  EXPECT_EQ(generation_error(Schema{}, options), "template line 2: unknown helper 'shout'");

  options.template_text = "{{missing}}";
  EXPECT_EQ(generation_error(Schema{}, options), "template line 1: undefined variable 'missing'");
}

TEST(CodegenGeneratorErrors, ClassNameCollision)
{
  const std::string message = generation_error(schema_of("definition user {}\ndefinition tenant/user {}"));
  EXPECT_EQ(message, "'user' and 'tenant/user' both generate class 'User'");

  const std::string underscores =
    generation_error(schema_of("definition doc_type {}\ndefinition doc__type {}"));
  EXPECT_EQ(underscores, "'doc__type' and 'doc_type' both generate class 'DocType'");
}

TEST(CodegenGeneratorErrors, MemberNameCollision)
{
  const std::string message = generation_error(
    schema_of("definition doc { relation is_owner: user\n permission is__owner = is_owner }"));
  EXPECT_EQ(message, "'doc#is_owner' and 'doc#is__owner' both generate member 'IsOwner'");
}

TEST(CodegenGeneratorErrors, SubjectFactoryCollision)
{
  const std::string message =
    generation_error(schema_of("definition doc { relation reader: tenant/user | user }"));
  EXPECT_EQ(
    message,
    "'doc#reader subject tenant/user' and 'doc#reader subject user' both generate subject "
    "factory 'ReaderFromUser'");
}

TEST(CodegenGeneratorErrors, SubjectFactoryCollisionAcrossRelations)
{
  const std::string message =
    generation_error(schema_of("definition doc {\n relation a: b_from_c\n relation a_from_b: c\n}"));
  EXPECT_EQ(
    message,
    "'doc#a subject b_from_c' and 'doc#a_from_b subject c' both generate subject factory "
    "'AFromBFromC'");
}

TEST(CodegenGeneratorErrors, ClassNameClashesWithBuiltinType)
{
  EXPECT_EQ(
    generation_error(schema_of("definition user {}\ndefinition client { relation owner: user }")),
    "'built-in header' and 'client' both generate class 'Client'");
  EXPECT_EQ(
    generation_error(schema_of("definition object_ref {}")),
    "'built-in header' and 'object_ref' both generate class 'ObjectRef'");
  EXPECT_EQ(
    generation_error(schema_of("definition relationship {}")),
    "'built-in header' and 'relationship' both generate class 'Relationship'");
}

TEST(CodegenGeneratorErrors, NearBuiltinNamesStillGenerate)
{
  const GeneratedUnit unit = CodeGenerator().generate(schema_of("definition client_ref {}"));
  EXPECT_TRUE(contains(unit.source, "class ClientRef\n"));
  const auto first = unit.source.find("class Client\n");
  ASSERT_NE(first, std::string::npos);
  EXPECT_EQ(unit.source.find("class Client\n", first + 1), std::string::npos);
}

TEST(CodegenGeneratorErrors, CustomTemplateMayUseBuiltinNames)
{
  CodeGenOptions options;
  options.format = false;
  options.template_text = "{{#each definitions}}\n{{definition | camelcase}}\n{{/each}}\n";
  EXPECT_EQ(CodeGenerator(options).render(schema_of("definition client {}")), "Client\n");
}

TEST(CodegenGeneratorErrors, NameWithoutLettersIsRejected)
{
  const std::string message = generation_error(schema_of("definition _ {}"));
  EXPECT_EQ(message, "'_' does not produce a valid class");
}

}  // namespace authzgen::codegen
