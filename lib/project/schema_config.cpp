// asdl/project/schema_config.cpp - Schema configuration implementation
//
#include "asdl/project/schema_config.hpp"

#include <yaml-cpp/yaml.h>

namespace asdl
{

namespace
{

/// Parse the `primitives.aliases` map
bool parse_aliases(const YAML::Node & node, PrimitivesConfig & out, std::string & error)
{
  if (!node.IsMap()) {
    error = "primitives.aliases must be a map";
    return false;
  }

  for (const auto & entry : node) {
    const auto alias = entry.first.as<std::string>();
    const auto target = entry.second.as<std::string>();
    const auto kind = parse_primitive_kind(target);
    if (!kind) {
      error = "invalid primitive kind for alias '" + alias + "': '" + target +
              "' (must be 'string', 'int' or 'bool')";
      return false;
    }
    out.aliases.emplace_back(alias, *kind);
  }
  return true;
}

/// Parse a positive integer setting
bool parse_positive(const YAML::Node & node, std::string_view key, size_t & out, std::string & error)
{
  const auto v = node.as<long long>();
  if (v <= 0) {
    error = std::string(key) + " must be a positive integer";
    return false;
  }
  out = static_cast<size_t>(v);
  return true;
}

ConfigLoadResult parse_root(const YAML::Node & root)
{
  SchemaConfig config;

  if (!root || root.IsNull()) {
    return ConfigLoadResult::ok(std::move(config));
  }
  if (!root.IsMap()) {
    return ConfigLoadResult::fail("configuration root must be a map");
  }

  std::string error;

  // Parse 'primitives' section
  if (root["primitives"]) {
    const auto & prims = root["primitives"];
    if (prims["aliases"] && !parse_aliases(prims["aliases"], config.primitives, error)) {
      return ConfigLoadResult::fail(error);
    }
  }

  // Parse 'printer' section
  if (root["printer"]) {
    const auto & printer = root["printer"];
    if (printer["max_depth"] &&
        !parse_positive(printer["max_depth"], "printer.max_depth", config.printer.max_depth, error)) {
      return ConfigLoadResult::fail(error);
    }
    if (printer["multiline"]) {
      config.printer.multiline = printer["multiline"].as<bool>();
    }
    if (printer["indent"]) {
      const auto indent = printer["indent"].as<long long>();
      if (indent < 0) {
        return ConfigLoadResult::fail("printer.indent must not be negative");
      }
      config.printer.indent = static_cast<size_t>(indent);
    }
  }

  // Parse 'diagnostics' section
  if (root["diagnostics"]) {
    const auto & diags = root["diagnostics"];
    if (diags["color"]) {
      config.diagnostics.color = diags["color"].as<bool>();
    }
  }

  return ConfigLoadResult::ok(std::move(config));
}

}  // namespace

LoadOptions SchemaConfig::load_options() const
{
  LoadOptions options;
  options.primitive_aliases = primitives.aliases;
  return options;
}

PrintOptions SchemaConfig::print_options() const
{
  PrintOptions options;
  options.max_depth = printer.max_depth;
  options.multiline = printer.multiline;
  options.indent = printer.indent;
  return options;
}

ConfigLoadResult parse_schema_config(std::string_view yaml_text)
{
  try {
    return parse_root(YAML::Load(std::string(yaml_text)));
  } catch (const YAML::Exception & e) {
    return ConfigLoadResult::fail("failed to parse YAML: " + std::string(e.what()));
  }
}

ConfigLoadResult load_schema_config(const std::filesystem::path & config_path)
{
  namespace fs = std::filesystem;

  // Check if file exists
  if (!fs::exists(config_path)) {
    return ConfigLoadResult::fail("configuration file not found: " + config_path.string());
  }

  ConfigLoadResult result;
  try {
    result = parse_root(YAML::LoadFile(config_path.string()));
  } catch (const YAML::Exception & e) {
    return ConfigLoadResult::fail("failed to parse YAML: " + std::string(e.what()));
  }

  if (result.success) {
    result.config.config_root = fs::absolute(config_path).parent_path();
  }
  return result;
}

std::optional<std::filesystem::path> find_schema_config(const std::filesystem::path & start_dir)
{
  namespace fs = std::filesystem;

  fs::path current = fs::absolute(start_dir);

  // If start_dir is a file, start from its parent
  if (fs::is_regular_file(current)) {
    current = current.parent_path();
  }

  while (true) {
    fs::path candidate = current / k_schema_config_file_name;
    if (fs::exists(candidate)) {
      return candidate;
    }

    const fs::path parent = current.parent_path();
    if (parent == current) {
      // Reached filesystem root
      break;
    }
    current = parent;
  }

  return std::nullopt;
}

}  // namespace asdl
