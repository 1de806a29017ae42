// test_naming.cpp - Identifier helpers
//
#include <gtest/gtest.h>

#include "authzgen/codegen/naming.hpp"

namespace authzgen::codegen
{

TEST(CodegenNaming, PascalCase)
{
  EXPECT_EQ(to_pascal_case("document"), "Document");
  EXPECT_EQ(to_pascal_case("document_viewer"), "DocumentViewer");
  EXPECT_EQ(to_pascal_case("can-EDIT"), "CanEdit");
  EXPECT_EQ(to_pascal_case("two words"), "TwoWords");
  EXPECT_EQ(to_pascal_case("parentFolder"), "Parentfolder");
  EXPECT_EQ(to_pascal_case("__x__"), "X");
  EXPECT_EQ(to_pascal_case(""), "");
}

TEST(CodegenNaming, Lower)
{
  EXPECT_EQ(to_lower("ViewerOf_Doc"), "viewerof_doc");
}

TEST(CodegenNaming, SubjectParts)
{
  EXPECT_EQ(extract_type("user"), "user");
  EXPECT_EQ(extract_type("tenant/user"), "user");
  EXPECT_EQ(extract_type("group#member"), "group");
  EXPECT_EQ(extract_type("tenant/group#member"), "group");

  EXPECT_EQ(object_type("tenant/group#member"), "tenant/group");
  EXPECT_EQ(object_type("user"), "user");

  EXPECT_EQ(subject_relation("group#member"), "member");
  EXPECT_EQ(subject_relation("tenant/user"), "");
}

TEST(CodegenNaming, Keywords)
{
  EXPECT_TRUE(is_cpp_keyword("class"));
  EXPECT_TRUE(is_cpp_keyword("namespace"));
  EXPECT_TRUE(is_cpp_keyword("xor_eq"));
  EXPECT_TRUE(is_cpp_keyword("alignas"));
  EXPECT_FALSE(is_cpp_keyword("authz"));
  EXPECT_FALSE(is_cpp_keyword("Class"));
}

TEST(CodegenNaming, CppIdentifier)
{
  EXPECT_EQ(to_cpp_identifier("authz"), "authz");
  EXPECT_EQ(to_cpp_identifier("my-pkg.v2"), "my_pkg_v2");
  EXPECT_EQ(to_cpp_identifier("2fa"), "_2fa");
  EXPECT_EQ(to_cpp_identifier(""), "_");
  EXPECT_EQ(to_cpp_identifier("namespace"), "namespace_");
  EXPECT_EQ(to_cpp_identifier("private"), "private_");
}

TEST(CodegenNaming, PackageAndExtensionChecks)
{
  EXPECT_TRUE(is_identifier("authz"));
  EXPECT_TRUE(is_identifier("_tenant2"));
  EXPECT_FALSE(is_identifier(""));
  EXPECT_FALSE(is_identifier("2fa"));
  EXPECT_FALSE(is_identifier("../x"));
  EXPECT_FALSE(is_identifier("my-pkg"));

  EXPECT_TRUE(is_file_extension("gen.hpp"));
  EXPECT_TRUE(is_file_extension("h"));
  EXPECT_FALSE(is_file_extension(""));
  EXPECT_FALSE(is_file_extension("a/b"));
  EXPECT_FALSE(is_file_extension("a\\b"));
}

}  // namespace authzgen::codegen
