/***
 * Name: test_syntax_tree
 * Purpose: Validate the tree-sitter wrapper: node kinds, fields, positions, errors.
 */
#include <gtest/gtest.h>

#include <string>
#include <string_view>

#include "jflow/syntax/syntax_tree.h"

using namespace jflow::syntax;

TEST(SyntaxTree, RootIsProgram) {
  const std::string src = "class A { void f() {} }\n";
  const auto tree = SyntaxTree::Parse(src);
  const auto root = tree.Root();
  ASSERT_FALSE(root.IsNull());
  EXPECT_EQ(root.Kind(), "program");
  EXPECT_EQ(root.StartByte(), 0u);
  EXPECT_FALSE(tree.FirstError().has_value());
}

TEST(SyntaxTree, FieldLookupAndText) {
  const std::string src = "class Greeter { void hello() {} }";
  const auto tree = SyntaxTree::Parse(src);
  const auto named = tree.Root().NamedChildren();
  ASSERT_EQ(named.size(), 1u);
  const auto& cls = named[0];
  EXPECT_EQ(cls.Kind(), "class_declaration");
  EXPECT_EQ(cls.ChildByFieldName("name").Text(src), "Greeter");
  EXPECT_TRUE(cls.ChildByFieldName("no_such_field").IsNull());
}

TEST(SyntaxTree, PositionsAreOneBased) {
  const std::string src = "class A {\n  void f() {}\n}\n";
  const auto tree = SyntaxTree::Parse(src);
  const auto cls = tree.Root().NamedChildren().at(0);
  EXPECT_EQ(cls.StartLine(), 1u);
  EXPECT_EQ(cls.StartColumn(), 1u);
  const auto body = cls.ChildByFieldName("body");
  const auto method = body.NamedChildren().at(0);
  EXPECT_EQ(method.Kind(), "method_declaration");
  EXPECT_EQ(method.StartLine(), 2u);
  EXPECT_EQ(method.StartColumn(), 3u);
  EXPECT_EQ(method.StartByte(), src.find("void f"));
}

TEST(SyntaxTree, BrokenSourceReportsFirstError) {
  const std::string src = "class A {\n  void f( {\n}\n";
  const auto tree = SyntaxTree::Parse(src);
  const auto error = tree.FirstError();
  ASSERT_TRUE(error.has_value());
  EXPECT_GE(error->StartLine(), 1u);
}

TEST(SyntaxNode, NullNodeIsSafe) {
  const SyntaxNode node;
  EXPECT_TRUE(node.IsNull());
  EXPECT_TRUE(node.Children().empty());
  EXPECT_EQ(node.Text("abc"), std::string_view{});
}
