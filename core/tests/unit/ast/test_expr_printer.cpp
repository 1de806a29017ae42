// test_expr_printer.cpp - Canonical expression text
//
#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "authzgen/ast/ast.hpp"
#include "authzgen/ast/ast_context.hpp"
#include "authzgen/ast/expr_printer.hpp"

namespace authzgen
{

class ExprPrinterTest : public ::testing::Test
{
protected:
  IdentifierExpr * id(std::string_view name)
  {
    return ctx_.create<IdentifierExpr>(ctx_.intern(name));
  }

  BinaryOpExpr * op(PermissionOp o, PermissionExpr * l, PermissionExpr * r)
  {
    return ctx_.create<BinaryOpExpr>(o, l, r);
  }

  SingleRelation * single(std::string_view type, std::optional<std::string_view> fragment = {})
  {
    return ctx_.create<SingleRelation>(ctx_.intern(type), fragment);
  }

  AstContext ctx_;
};

TEST_F(ExprPrinterTest, IdentifierText)
{
  EXPECT_EQ(to_expression_text(id("owner")), "owner");
  EXPECT_EQ(to_tree_text(id("owner")), "owner");
}

TEST_F(ExprPrinterTest, BinaryOperatorsAreSpaced)
{
  auto * expr = op(PermissionOp::Union, id("a"), op(PermissionOp::Arrow, id("b"), id("c")));
  EXPECT_EQ(to_expression_text(expr), "a + b -> c");
  EXPECT_EQ(to_tree_text(expr), "+(a, ->(b, c))");
}

TEST_F(ExprPrinterTest, NullExpression)
{
  EXPECT_EQ(to_expression_text(nullptr), "");
  EXPECT_TRUE(flatten_relation_types(nullptr).empty());
}

TEST_F(ExprPrinterTest, SubjectText)
{
  EXPECT_EQ(to_subject_text(single("user")), "user");
  EXPECT_EQ(to_subject_text(single("group", ctx_.intern("member"))), "group#member");
  EXPECT_EQ(to_subject_text(single("tenant/group", ctx_.intern("admin"))), "tenant/group#admin");
}

TEST_F(ExprPrinterTest, FlattenKeepsLeftToRightOrder)
{
  auto * ab = ctx_.create<UnionRelation>(single("a"), single("b", ctx_.intern("member")));
  auto * abc = ctx_.create<UnionRelation>(ab, single("c"));

  const std::vector<std::string> expected = {"a", "b#member", "c"};
  EXPECT_EQ(flatten_relation_types(abc), expected);
  EXPECT_EQ(flatten_relation_types(single("only")), std::vector<std::string>{"only"});
}

TEST_F(ExprPrinterTest, InternReturnsSameStorage)
{
  const std::string_view a = ctx_.intern("viewer");
  const std::string_view b = ctx_.intern(std::string("viewer"));
  EXPECT_EQ(a.data(), b.data());
  EXPECT_EQ(ctx_.get_string_count(), 1u);
}

}  // namespace authzgen
