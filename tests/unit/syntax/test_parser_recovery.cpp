// tests/unit/syntax/test_parser_recovery.cpp - Error recovery and multi-error reporting
#include <gtest/gtest.h>

#include "asdl/ast/ast.hpp"
#include "asdl/basic/casting.hpp"
#include "asdl/test_support/load_helpers.hpp"

using namespace asdl;
using asdl::test_support::parse;

TEST(SyntaxParserRecovery, ContinuesWithNextDeclaration)
{
  auto unit = parse(
    "module m {\n"
    "  broken = A(int)\n"
    "  ok = B | C\n"
    "}\n");
  ASSERT_NE(unit.file, nullptr);
  EXPECT_EQ(unit.diags.count(ErrorCode::ParseError), 1U) << unit.rendered();

  const auto & types = unit.file->modules[0]->types;
  ASSERT_EQ(types.size(), 1U);
  EXPECT_EQ(types[0]->name, "ok");
}

TEST(SyntaxParserRecovery, ReportsErrorsInSeveralDeclarations)
{
  auto unit = parse(
    "module m {\n"
    "  a = X(int)\n"
    "  b = (string s\n"
    "  c = Y(bool, int i)\n"
    "  d = Z\n"
    "}\n");
  ASSERT_NE(unit.file, nullptr);
  EXPECT_EQ(unit.diags.count(ErrorCode::ParseError), 3U) << unit.rendered();

  const auto & types = unit.file->modules[0]->types;
  ASSERT_EQ(types.size(), 1U);
  EXPECT_EQ(types[0]->name, "d");
}

TEST(SyntaxParserRecovery, LocalDuplicatesDoNotDropTheDeclaration)
{
  auto unit = parse("module m { t = A | A  u = (int x, int x) }");
  ASSERT_NE(unit.file, nullptr);
  EXPECT_EQ(unit.diags.count(ErrorCode::ParseError), 2U) << unit.rendered();
  EXPECT_EQ(unit.file->modules[0]->types.size(), 2U);
}

TEST(SyntaxParserRecovery, MissingBraceBeforeNextModule)
{
  auto unit = parse(
    "module a { t = A\n"
    "module b { u = B }\n");
  ASSERT_NE(unit.file, nullptr);
  ASSERT_EQ(unit.diags.count(ErrorCode::ParseError), 1U) << unit.rendered();
  EXPECT_EQ(unit.diags.all().front().message, "expected `}` to close module `a`");

  ASSERT_EQ(unit.file->modules.size(), 2U);
  EXPECT_EQ(unit.file->modules[1]->name, "b");
  EXPECT_EQ(unit.file->modules[1]->types.size(), 1U);
}

TEST(SyntaxParserRecovery, StrayTokensBetweenDeclarations)
{
  auto unit = parse("module m { t = A ) ) u = B }");
  ASSERT_NE(unit.file, nullptr);
  ASSERT_EQ(unit.diags.count(ErrorCode::ParseError), 1U) << unit.rendered();
  EXPECT_EQ(unit.diags.all().front().message, "expected `|` or the end of type `t`");

  const auto & types = unit.file->modules[0]->types;
  ASSERT_EQ(types.size(), 1U);
  EXPECT_EQ(types[0]->name, "u");
}

TEST(SyntaxParserRecovery, GarbageAtTopLevelSkipsToNextModule)
{
  auto unit = parse("junk ( ) module m { t = A }");
  ASSERT_NE(unit.file, nullptr);
  EXPECT_EQ(unit.diags.count(ErrorCode::ParseError), 1U) << unit.rendered();
  ASSERT_EQ(unit.file->modules.size(), 1U);
  EXPECT_EQ(unit.file->modules[0]->name, "m");
}
