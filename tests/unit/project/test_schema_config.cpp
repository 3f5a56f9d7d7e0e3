// tests/unit/project/test_schema_config.cpp - asdl.yaml parsing and discovery
#include <gtest/gtest.h>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>

#include "asdl/project/schema_config.hpp"
#include "asdl/test_support/load_helpers.hpp"

using namespace asdl;

namespace
{

struct TempDir
{
  std::filesystem::path path;
  explicit TempDir(std::filesystem::path p) : path(std::move(p))
  {
    std::filesystem::create_directories(path);
  }
  ~TempDir()
  {
    std::error_code ec;
    std::filesystem::remove_all(path, ec);
  }
  TempDir(const TempDir &) = delete;
  TempDir & operator=(const TempDir &) = delete;
};

std::filesystem::path unique_temp_path(const std::string & tag)
{
  const auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
  return std::filesystem::temp_directory_path() / ("asdl_" + tag + "_" + std::to_string(stamp));
}

void write_file(const std::filesystem::path & p, const std::string & text)
{
  std::ofstream out(p);
  out << text;
}

}  // namespace

TEST(ProjectSchemaConfig, ParsesAllSections)
{
  const auto r = parse_schema_config(
    "primitives:\n"
    "  aliases:\n"
    "    id: int\n"
    "    name: string\n"
    "printer:\n"
    "  max_depth: 16\n"
    "  multiline: true\n"
    "  indent: 4\n"
    "diagnostics:\n"
    "  color: false\n");
  ASSERT_TRUE(r.success) << r.error;

  const SchemaConfig & cfg = r.config;
  ASSERT_EQ(cfg.primitives.aliases.size(), 2U);
  EXPECT_EQ(cfg.primitives.aliases[0].first, "id");
  EXPECT_EQ(cfg.primitives.aliases[0].second, PrimitiveKind::Integer);
  EXPECT_EQ(cfg.primitives.aliases[1].second, PrimitiveKind::String);
  EXPECT_EQ(cfg.printer.max_depth, 16U);
  EXPECT_TRUE(cfg.printer.multiline);
  EXPECT_EQ(cfg.printer.indent, 4U);
  EXPECT_FALSE(cfg.diagnostics.color);
  EXPECT_TRUE(cfg.config_root.empty());
}

TEST(ProjectSchemaConfig, EmptyDocumentGivesDefaults)
{
  const auto r = parse_schema_config("");
  ASSERT_TRUE(r.success) << r.error;
  EXPECT_TRUE(r.config.primitives.aliases.empty());
  EXPECT_EQ(r.config.printer.max_depth, 64U);
  EXPECT_FALSE(r.config.printer.multiline);
  EXPECT_EQ(r.config.printer.indent, 2U);
  EXPECT_TRUE(r.config.diagnostics.color);
}

TEST(ProjectSchemaConfig, InvalidAliasKind)
{
  const auto r = parse_schema_config("primitives:\n  aliases:\n    id: float\n");
  ASSERT_FALSE(r.success);
  EXPECT_EQ(
    r.error, "invalid primitive kind for alias 'id': 'float' (must be 'string', 'int' or 'bool')");
}

TEST(ProjectSchemaConfig, AliasesMustBeAMap)
{
  const auto r = parse_schema_config("primitives:\n  aliases: [id, int]\n");
  ASSERT_FALSE(r.success);
  EXPECT_EQ(r.error, "primitives.aliases must be a map");
}

TEST(ProjectSchemaConfig, InvalidPrinterSettings)
{
  const auto depth = parse_schema_config("printer:\n  max_depth: 0\n");
  ASSERT_FALSE(depth.success);
  EXPECT_EQ(depth.error, "printer.max_depth must be a positive integer");

  const auto indent = parse_schema_config("printer:\n  indent: -1\n");
  ASSERT_FALSE(indent.success);
  EXPECT_EQ(indent.error, "printer.indent must not be negative");
}

TEST(ProjectSchemaConfig, RootMustBeAMap)
{
  const auto r = parse_schema_config("- a\n- b\n");
  ASSERT_FALSE(r.success);
  EXPECT_EQ(r.error, "configuration root must be a map");
}

TEST(ProjectSchemaConfig, MalformedYaml)
{
  const auto r = parse_schema_config("printer: [unclosed\n");
  ASSERT_FALSE(r.success);
  EXPECT_EQ(r.error.rfind("failed to parse YAML: ", 0), 0U) << r.error;
}

TEST(ProjectSchemaConfig, WrongScalarType)
{
  const auto r = parse_schema_config("printer:\n  multiline: maybe\n");
  ASSERT_FALSE(r.success);
  EXPECT_EQ(r.error.rfind("failed to parse YAML: ", 0), 0U) << r.error;
}

TEST(ProjectSchemaConfig, OptionsFeedLoaderAndPrinter)
{
  const auto r = parse_schema_config(
    "primitives:\n  aliases:\n    id: int\n"
    "printer:\n  max_depth: 8\n  multiline: true\n  indent: 3\n");
  ASSERT_TRUE(r.success) << r.error;

  const PrintOptions print_options = r.config.print_options();
  EXPECT_EQ(print_options.max_depth, 8U);
  EXPECT_TRUE(print_options.multiline);
  EXPECT_EQ(print_options.indent, 3U);

  const auto loaded = test_support::load("module m { node = (id key) }", r.config.load_options());
  ASSERT_TRUE(loaded.success) << test_support::rendered(loaded);
  EXPECT_EQ(
    loaded.model->find_type("node")->constructors[0].fields[0].type,
    TypeRef::primitive(PrimitiveKind::Integer));
}

TEST(ProjectSchemaConfig, LoadFromFileSetsRoot)
{
  const TempDir dir(unique_temp_path("load"));
  const auto path = dir.path / k_schema_config_file_name;
  write_file(path, "printer:\n  indent: 6\n");

  const auto r = load_schema_config(path);
  ASSERT_TRUE(r.success) << r.error;
  EXPECT_EQ(r.config.printer.indent, 6U);
  EXPECT_EQ(r.config.config_root, std::filesystem::absolute(dir.path));
}

TEST(ProjectSchemaConfig, MissingFile)
{
  const auto r = load_schema_config(unique_temp_path("missing") / "asdl.yaml");
  ASSERT_FALSE(r.success);
  EXPECT_EQ(r.error.rfind("configuration file not found: ", 0), 0U) << r.error;
}

TEST(ProjectSchemaConfig, FindSearchesUpward)
{
  const TempDir dir(unique_temp_path("find"));
  const auto nested = dir.path / "schemas" / "lang";
  std::filesystem::create_directories(nested);
  write_file(dir.path / k_schema_config_file_name, "");
  write_file(nested / "lang.asdl", "module lang {}");

  const auto from_dir = find_schema_config(nested);
  ASSERT_TRUE(from_dir.has_value());
  EXPECT_EQ(*from_dir, std::filesystem::absolute(dir.path) / k_schema_config_file_name);

  const auto from_file = find_schema_config(nested / "lang.asdl");
  ASSERT_TRUE(from_file.has_value());
  EXPECT_EQ(*from_file, *from_dir);
}
