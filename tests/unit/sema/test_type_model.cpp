// tests/unit/sema/test_type_model.cpp - TypeModel queries and JSON dump
#include <gtest/gtest.h>

#include <nlohmann/json.hpp>

#include "asdl/sema/type_model_json.hpp"
#include "asdl/test_support/load_helpers.hpp"

using namespace asdl;
using asdl::test_support::load;
using asdl::test_support::rendered;

namespace
{

constexpr const char * k_two_modules =
  "module core {\n"
  "  token = (string text, int pos)\n"
  "  kind = Word | Number\n"
  "}\n"
  "module lang {\n"
  "  token = (core.token inner, core.kind kind)\n"
  "  stmt = Expr(token t) | Pass attributes (int line)\n"
  "}\n";

}  // namespace

TEST(SemaTypeModel, TypesInLoadOrder)
{
  const auto result = load(k_two_modules);
  ASSERT_TRUE(result.success) << rendered(result);
  const TypeModel & model = *result.model;

  ASSERT_EQ(model.types().size(), 4U);
  EXPECT_EQ(model.types()[0]->qualified_name(), "core.token");
  EXPECT_EQ(model.types()[1]->qualified_name(), "core.kind");
  EXPECT_EQ(model.types()[2]->qualified_name(), "lang.token");
  EXPECT_EQ(model.types()[3]->qualified_name(), "lang.stmt");
  for (uint32_t i = 0; i < model.types().size(); ++i) {
    EXPECT_EQ(model.types()[i]->index, i);
  }
  EXPECT_EQ(model.constructor_count(), 6U);
}

TEST(SemaTypeModel, FindTypeAndModule)
{
  const auto result = load(k_two_modules);
  ASSERT_TRUE(result.success) << rendered(result);
  const TypeModel & model = *result.model;

  // Declared in both modules
  EXPECT_EQ(model.find_type("token"), nullptr);
  ASSERT_NE(model.find_type("lang.token"), nullptr);
  EXPECT_EQ(model.find_type("lang.token")->module, model.find_module("lang"));

  ASSERT_NE(model.find_type("kind"), nullptr);
  EXPECT_EQ(model.find_type("kind"), model.find_type("core.kind"));
  EXPECT_EQ(model.find_type("lang.kind"), nullptr);
  EXPECT_EQ(model.find_type("nope.kind"), nullptr);
  EXPECT_EQ(model.find_type("int"), nullptr);

  EXPECT_EQ(model.find_module("core")->types.size(), 2U);
  EXPECT_EQ(model.find_module("missing"), nullptr);
}

TEST(SemaTypeModel, TypeRefNames)
{
  const auto result = load(k_two_modules);
  ASSERT_TRUE(result.success) << rendered(result);

  EXPECT_EQ(TypeRef::primitive(PrimitiveKind::Integer).name(), "int");
  EXPECT_EQ(TypeRef().name(), "<unresolved>");
  EXPECT_FALSE(TypeRef().is_valid());

  const TypeInfo * kind = result.model->find_type("core.kind");
  const TypeRef ref = TypeRef::declared(kind);
  EXPECT_TRUE(ref.is_declared());
  EXPECT_FALSE(ref.is_primitive());
  EXPECT_EQ(ref.name(), "kind");
  EXPECT_NE(ref, TypeRef::declared(result.model->find_type("lang.token")));
}

TEST(SemaTypeModel, JsonDump)
{
  const auto result = load(k_two_modules);
  ASSERT_TRUE(result.success) << rendered(result);

  const nlohmann::json j = to_json(*result.model);
  EXPECT_EQ(j["primitives"]["int"], "int");
  EXPECT_EQ(j["primitives"]["identifier"], "string");
  ASSERT_EQ(j["modules"].size(), 2U);

  const auto & stmt = j["modules"][1]["types"][1];
  EXPECT_EQ(stmt["qualifiedName"], "lang.stmt");
  EXPECT_EQ(stmt["kind"], "sum");
  EXPECT_EQ(stmt["index"], 3);
  EXPECT_EQ(stmt["simple"], false);

  const auto & expr = stmt["constructors"][0];
  EXPECT_EQ(expr["name"], "Expr");
  EXPECT_EQ(expr["tag"], 0);
  EXPECT_EQ(expr["fields"][0]["type"]["kind"], "declared");
  EXPECT_EQ(expr["fields"][0]["type"]["name"], "lang.token");
  EXPECT_EQ(expr["fields"][1]["name"], "line");
  EXPECT_EQ(expr["fields"][1]["attribute"], true);
  EXPECT_EQ(expr["fields"][1]["index"], 1);

  const auto & kind = j["modules"][0]["types"][1];
  EXPECT_EQ(kind["simple"], true);
  EXPECT_EQ(kind["constructors"][1]["tag"], 1);
}

TEST(SemaTypeModel, JsonDumpIsDeterministic)
{
  const auto first = load(k_two_modules);
  const auto second = load(k_two_modules);
  ASSERT_TRUE(first.success);
  ASSERT_TRUE(second.success);

  EXPECT_EQ(to_json(*first.model).dump(), to_json(*second.model).dump());
}

TEST(SemaTypeModel, ModelOutlivesLoadResult)
{
  std::shared_ptr<const TypeModel> model;
  {
    auto result = load(k_two_modules);
    ASSERT_TRUE(result.success);
    model = result.model;
  }
  ASSERT_NE(model, nullptr);
  EXPECT_EQ(model->find_type("core.token")->constructors[0].fields[1].name, "pos");
}

TEST(SemaPrimitiveTable, AliasesAndLookup)
{
  PrimitiveTable table;
  table.register_builtins();
  EXPECT_EQ(table.size(), 4U);

  EXPECT_TRUE(table.define_alias("id", PrimitiveKind::Integer));
  EXPECT_FALSE(table.define_alias("id", PrimitiveKind::String));
  EXPECT_FALSE(table.define_alias("bool", PrimitiveKind::Integer));

  EXPECT_EQ(table.lookup("id"), PrimitiveKind::Integer);
  EXPECT_EQ(table.lookup("identifier"), PrimitiveKind::String);
  EXPECT_FALSE(table.lookup("float").has_value());

  EXPECT_TRUE(table.is_alias("id"));
  EXPECT_FALSE(table.is_alias("int"));
  EXPECT_FALSE(table.is_alias("float"));

  EXPECT_EQ(parse_primitive_kind("bool"), PrimitiveKind::Bool);
  EXPECT_FALSE(parse_primitive_kind("identifier").has_value());
}
