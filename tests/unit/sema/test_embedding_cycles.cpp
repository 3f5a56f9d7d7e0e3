// tests/unit/sema/test_embedding_cycles.cpp - Types without a finite value
#include <gtest/gtest.h>

#include <string>

#include "asdl/sema/embedding_cycle_checker.hpp"
#include "asdl/test_support/load_helpers.hpp"

using namespace asdl;
using asdl::test_support::first_message;
using asdl::test_support::load;
using asdl::test_support::rendered;

TEST(SemaEmbeddingCycles, SelfEmbeddingThroughSingleField)
{
  const auto result = load("module m { t = (t inner) }");
  ASSERT_FALSE(result.success);
  EXPECT_EQ(result.model, nullptr);
  ASSERT_EQ(result.diagnostics.count(ErrorCode::CycleError), 1U) << rendered(result);

  const Diagnostic & d = result.diagnostics.all().front();
  EXPECT_EQ(d.code, "E0004");
  EXPECT_NE(d.message.find("t -> t"), std::string::npos) << d.message;
  EXPECT_EQ(result.sources.get_slice(d.primary_range()), "t inner");
}

TEST(SemaEmbeddingCycles, RepeatedOrOptionalFieldBreaksTheCycle)
{
  EXPECT_TRUE(load("module m { t = (t* children) }").success);
  EXPECT_TRUE(load("module m { t = (t? next) }").success);
  EXPECT_TRUE(load("module m { list = Cons(int head, list? tail) }").success);
}

TEST(SemaEmbeddingCycles, RecursiveSumWithBaseCaseIsAccepted)
{
  const auto result = load(
    "module arith {\n"
    "  expr = Num(int n)\n"
    "       | Add(expr left, expr right)\n"
    "       | Neg(expr operand)\n"
    "}\n");
  EXPECT_TRUE(result.success) << rendered(result);
}

TEST(SemaEmbeddingCycles, MutualCycle)
{
  const auto result = load(
    "module m {\n"
    "  a = (b x)\n"
    "  b = (a y)\n"
    "}\n");
  ASSERT_FALSE(result.success);
  ASSERT_EQ(result.diagnostics.count(ErrorCode::CycleError), 1U) << rendered(result);
  EXPECT_NE(first_message(result.diagnostics).find("a -> b -> a"), std::string::npos)
    << first_message(result.diagnostics);
}

TEST(SemaEmbeddingCycles, SumWithoutBaseCase)
{
  const auto result = load("module m { t = A(t x) | B(t y, int z) }");
  ASSERT_FALSE(result.success);
  EXPECT_TRUE(result.diagnostics.has_error(ErrorCode::CycleError)) << rendered(result);
}

TEST(SemaEmbeddingCycles, TypeLeadingIntoACycleIsNotReportedTwice)
{
  const auto result = load(
    "module m {\n"
    "  root = (loop l)\n"
    "  loop = (loop again)\n"
    "}\n");
  ASSERT_FALSE(result.success);
  EXPECT_EQ(result.diagnostics.count(ErrorCode::CycleError), 1U) << rendered(result);
  EXPECT_NE(first_message(result.diagnostics).find("loop -> loop"), std::string::npos);
}

TEST(SemaEmbeddingCycles, CycleAcrossModules)
{
  const auto result = load(
    "module core { node = (node? parent, int id) }\n"
    "module tree { wrap = (core.node n) }\n");
  EXPECT_TRUE(result.success) << rendered(result);
}

TEST(SemaEmbeddingCycles, CheckerCountsWithoutDiagnostics)
{
  const auto ok = load("module m { a = A | B(a inner) }");
  ASSERT_TRUE(ok.success) << rendered(ok);

  EmbeddingCycleChecker checker;
  EXPECT_TRUE(checker.check(*ok.model));
  EXPECT_FALSE(checker.has_errors());
  EXPECT_EQ(checker.error_count(), 0U);
}
