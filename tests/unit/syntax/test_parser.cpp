// tests/unit/syntax/test_parser.cpp - Declaration tree shape
#include <gtest/gtest.h>

#include "asdl/ast/ast.hpp"
#include "asdl/basic/casting.hpp"
#include "asdl/test_support/load_helpers.hpp"

using namespace asdl;
using asdl::test_support::parse;

TEST(SyntaxParser, EmptyModule)
{
  auto unit = parse("module empty {}");
  ASSERT_NE(unit.file, nullptr);
  EXPECT_TRUE(unit.diags.empty()) << unit.rendered();

  ASSERT_EQ(unit.file->modules.size(), 1U);
  const ModuleDecl * mod = unit.file->modules[0];
  EXPECT_EQ(mod->name, "empty");
  EXPECT_EQ(unit.slice(mod->name_range), "empty");
  EXPECT_TRUE(mod->types.empty());
}

TEST(SyntaxParser, SumTypeWithConstructors)
{
  auto unit = parse(
    "module cflow {\n"
    "  cflow = Break | Continue | Return(int status)\n"
    "}\n");
  ASSERT_NE(unit.file, nullptr);
  ASSERT_TRUE(unit.diags.empty()) << unit.rendered();

  const ModuleDecl * mod = unit.file->modules[0];
  ASSERT_EQ(mod->types.size(), 1U);

  const auto * sum = dyn_cast<SumTypeDecl>(mod->types[0]);
  ASSERT_NE(sum, nullptr);
  EXPECT_EQ(sum->name, "cflow");
  ASSERT_EQ(sum->constructors.size(), 3U);
  EXPECT_EQ(sum->constructors[0]->name, "Break");
  EXPECT_TRUE(sum->constructors[0]->fields.empty());
  EXPECT_EQ(sum->constructors[2]->name, "Return");

  ASSERT_EQ(sum->constructors[2]->fields.size(), 1U);
  const FieldDecl * status = sum->constructors[2]->fields[0];
  EXPECT_EQ(status->type_name, "int");
  EXPECT_EQ(status->name, "status");
  EXPECT_EQ(status->multiplicity, Multiplicity::Single);
  EXPECT_FALSE(status->is_qualified());
  EXPECT_EQ(unit.slice(status->get_range()), "int status");
}

TEST(SyntaxParser, ProductTypeAndMultiplicities)
{
  auto unit = parse("module m { slice = (int* items, string? label, bool flag) }");
  ASSERT_NE(unit.file, nullptr);
  ASSERT_TRUE(unit.diags.empty()) << unit.rendered();

  const auto * product = dyn_cast<ProductTypeDecl>(unit.file->modules[0]->types[0]);
  ASSERT_NE(product, nullptr);
  EXPECT_FALSE(isa<SumTypeDecl>(product));
  ASSERT_EQ(product->fields.size(), 3U);
  EXPECT_EQ(product->fields[0]->multiplicity, Multiplicity::Repeated);
  EXPECT_EQ(product->fields[1]->multiplicity, Multiplicity::Optional);
  EXPECT_EQ(product->fields[2]->multiplicity, Multiplicity::Single);
  EXPECT_EQ(product->fields[1]->name, "label");
  EXPECT_EQ(unit.slice(product->get_range()), "slice = (int* items, string? label, bool flag)");
}

TEST(SyntaxParser, EmptyFieldListsAreAllowed)
{
  auto unit = parse("module m { unit = () t = A() | B }");
  ASSERT_NE(unit.file, nullptr);
  ASSERT_TRUE(unit.diags.empty()) << unit.rendered();

  const auto & types = unit.file->modules[0]->types;
  ASSERT_EQ(types.size(), 2U);
  EXPECT_TRUE(cast<ProductTypeDecl>(types[0])->fields.empty());
  EXPECT_TRUE(cast<SumTypeDecl>(types[1])->constructors[0]->fields.empty());
}

TEST(SyntaxParser, QualifiedFieldType)
{
  auto unit = parse("module m { t = (core.token* toks) }");
  ASSERT_NE(unit.file, nullptr);
  ASSERT_TRUE(unit.diags.empty()) << unit.rendered();

  const FieldDecl * f = cast<ProductTypeDecl>(unit.file->modules[0]->types[0])->fields[0];
  EXPECT_TRUE(f->is_qualified());
  EXPECT_EQ(f->type_module, "core");
  EXPECT_EQ(f->type_name, "token");
  EXPECT_EQ(f->multiplicity, Multiplicity::Repeated);
  EXPECT_EQ(unit.slice(f->type_range), "core.token");
  EXPECT_EQ(unit.slice(f->name_range), "toks");
}

TEST(SyntaxParser, AttributesAttachToTheType)
{
  auto unit = parse(
    "module m {\n"
    "  expr = Num(int n) | Neg(expr e)\n"
    "    attributes (int line, int col)\n"
    "}\n");
  ASSERT_NE(unit.file, nullptr);
  ASSERT_TRUE(unit.diags.empty()) << unit.rendered();

  const auto * sum = cast<SumTypeDecl>(unit.file->modules[0]->types[0]);
  ASSERT_EQ(sum->attributes.size(), 2U);
  EXPECT_EQ(sum->attributes[0]->name, "line");
  EXPECT_EQ(sum->attributes[1]->name, "col");
  EXPECT_EQ(sum->constructors[0]->fields.size(), 1U);
}

TEST(SyntaxParser, MultipleModulesInOneFile)
{
  auto unit = parse(
    "-- shared tokens\n"
    "module core { token = (string text) }\n"
    "module lang { stmt = Pass | Expr(core.token t) }\n");
  ASSERT_NE(unit.file, nullptr);
  ASSERT_TRUE(unit.diags.empty()) << unit.rendered();

  ASSERT_EQ(unit.file->modules.size(), 2U);
  EXPECT_EQ(unit.file->modules[0]->name, "core");
  EXPECT_EQ(unit.file->modules[1]->name, "lang");
  EXPECT_EQ(unit.file->file_id, unit.file_id);
}

TEST(SyntaxParser, CommentsAreIgnored)
{
  auto unit = parse(
    "module m { -- a comment\n"
    "  /* block */ t = A -- after\n"
    "    | B\n"
    "}\n");
  ASSERT_NE(unit.file, nullptr);
  ASSERT_TRUE(unit.diags.empty()) << unit.rendered();
  EXPECT_EQ(cast<SumTypeDecl>(unit.file->modules[0]->types[0])->constructors.size(), 2U);
}

// ============================================================================
// Errors
// ============================================================================

TEST(SyntaxParser, DuplicateConstructorInOneType)
{
  auto unit = parse("module m { t = A | B | A }");
  EXPECT_EQ(unit.diags.count(ErrorCode::ParseError), 1U) << unit.rendered();

  const Diagnostic & d = unit.diags.all().front();
  EXPECT_EQ(d.message, "duplicate constructor `A` in type `t`");
  ASSERT_EQ(d.labels.size(), 2U);
  EXPECT_EQ(d.labels[1].style, LabelStyle::Secondary);
  EXPECT_EQ(d.labels[1].message, "first defined here");
}

TEST(SyntaxParser, DuplicateFieldInConstructor)
{
  auto unit = parse("module m { t = A(int x, string x) }");
  ASSERT_EQ(unit.diags.count(ErrorCode::ParseError), 1U) << unit.rendered();
  EXPECT_EQ(unit.diags.all().front().message, "duplicate field `x` in `A`");
}

TEST(SyntaxParser, DuplicateFieldInProduct)
{
  auto unit = parse("module m { p = (int a, int a) }");
  ASSERT_EQ(unit.diags.count(ErrorCode::ParseError), 1U) << unit.rendered();
  EXPECT_EQ(unit.diags.all().front().message, "duplicate field `a` in `p`");
}

TEST(SyntaxParser, AttributeClashesWithConstructorField)
{
  auto unit = parse("module m { t = A(int line) | B attributes (int line) }");
  ASSERT_EQ(unit.diags.count(ErrorCode::ParseError), 1U) << unit.rendered();
  EXPECT_EQ(
    unit.diags.all().front().message, "attribute `line` clashes with a field of `A`");
}

TEST(SyntaxParser, SameFieldNameInDifferentConstructorsIsFine)
{
  auto unit = parse("module m { t = A(int x) | B(string x) }");
  EXPECT_TRUE(unit.diags.empty()) << unit.rendered();
}

TEST(SyntaxParser, ReservedWordAsFieldName)
{
  auto unit = parse("module m { t = (int module) }");
  ASSERT_TRUE(unit.diags.has_error(ErrorCode::ParseError)) << unit.rendered();
  EXPECT_EQ(
    unit.diags.all().front().message, "reserved word `module` cannot be used as field name");
}

TEST(SyntaxParser, ReservedWordAsTypeName)
{
  auto unit = parse("module m { attributes = A }");
  ASSERT_TRUE(unit.diags.has_error(ErrorCode::ParseError)) << unit.rendered();
  EXPECT_EQ(
    unit.diags.all().front().message, "reserved word `attributes` cannot be used as a type name");
}

TEST(SyntaxParser, MissingFieldName)
{
  auto unit = parse("module m { t = A(int) }");
  ASSERT_TRUE(unit.diags.has_error(ErrorCode::ParseError)) << unit.rendered();

  const Diagnostic & d = unit.diags.all().front();
  EXPECT_EQ(d.message, "expected field name");
  ASSERT_FALSE(d.labels.empty());
  EXPECT_EQ(d.labels[0].message, "unexpected `)`");
  EXPECT_EQ(unit.slice(d.primary_range()), ")");
}

TEST(SyntaxParser, MissingClosingBraceAtEof)
{
  auto unit = parse("module m { t = A");
  ASSERT_TRUE(unit.diags.has_error(ErrorCode::ParseError)) << unit.rendered();

  const Diagnostic & d = unit.diags.all().front();
  EXPECT_EQ(d.message, "expected `}` to close module `m`");
  EXPECT_EQ(d.labels[0].message, "unexpected end of input");
}

TEST(SyntaxParser, TopLevelMustBeModule)
{
  auto unit = parse("t = A");
  ASSERT_TRUE(unit.diags.has_error(ErrorCode::ParseError)) << unit.rendered();
  EXPECT_EQ(unit.diags.all().front().message, "expected `module` declaration");
}

TEST(SyntaxParser, LexErrorStopsBeforeParsing)
{
  auto unit = parse("module m { t = A$ }");
  EXPECT_EQ(unit.file, nullptr);
  ASSERT_EQ(unit.diags.size(), 1U) << unit.rendered();
  EXPECT_TRUE(unit.diags.has_error(ErrorCode::LexError));
  EXPECT_EQ(unit.diags.all().front().message, "invalid character `$`");
  EXPECT_EQ(unit.slice(unit.diags.all().front().primary_range()), "$");
}

TEST(SyntaxParser, UnterminatedCommentIsALexError)
{
  auto unit = parse("module m { /* t = A }");
  EXPECT_EQ(unit.file, nullptr);
  ASSERT_TRUE(unit.diags.has_error(ErrorCode::LexError));

  const Diagnostic & d = unit.diags.all().front();
  EXPECT_EQ(d.message, "unterminated block comment");
  ASSERT_TRUE(d.help_message.has_value());
  EXPECT_EQ(*d.help_message, "close the comment with `*/`");
}

TEST(SyntaxParser, NonPrintableCharacterIsShownAsBytes)
{
  auto unit = parse("module m {\x01}");
  ASSERT_TRUE(unit.diags.has_error(ErrorCode::LexError));
  EXPECT_EQ(unit.diags.all().front().message, "invalid character `\\x01`");
}
