// asdl/project/schema_config.hpp - Schema configuration (asdl.yaml)
//
// Parses and validates asdl.yaml files: primitive aliases for the loader,
// printer defaults and diagnostics rendering.
//
#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "asdl/driver/schema_loader.hpp"
#include "asdl/runtime/printer.hpp"
#include "asdl/sema/primitive_table.hpp"

namespace asdl
{

// ============================================================================
// Configuration Structures
// ============================================================================

/**
 * `primitives` section.
 */
struct PrimitivesConfig
{
  /// Extra names for primitive kinds, in file order
  std::vector<std::pair<std::string, PrimitiveKind>> aliases;
};

/**
 * `printer` section.
 */
struct PrinterConfig
{
  size_t max_depth = 64;
  bool multiline = false;
  size_t indent = 2;
};

/**
 * `diagnostics` section.
 */
struct DiagnosticsConfig
{
  bool color = true;
};

/**
 * Complete schema configuration (asdl.yaml).
 */
struct SchemaConfig
{
  PrimitivesConfig primitives;
  PrinterConfig printer;
  DiagnosticsConfig diagnostics;

  /// Directory containing asdl.yaml (empty when parsed from text)
  std::filesystem::path config_root;

  [[nodiscard]] LoadOptions load_options() const;
  [[nodiscard]] PrintOptions print_options() const;
};

// ============================================================================
// Configuration Loading Result
// ============================================================================

/**
 * Result of loading a schema configuration.
 */
struct ConfigLoadResult
{
  /// Loaded configuration (only valid if success == true)
  SchemaConfig config;

  /// Whether loading succeeded
  bool success = false;

  /// Error message if loading failed
  std::string error;

  /// Create a successful result
  static ConfigLoadResult ok(SchemaConfig cfg)
  {
    ConfigLoadResult r;
    r.config = std::move(cfg);
    r.success = true;
    return r;
  }

  /// Create a failed result
  static ConfigLoadResult fail(std::string msg)
  {
    ConfigLoadResult r;
    r.error = std::move(msg);
    r.success = false;
    return r;
  }
};

// ============================================================================
// Configuration Loading API
// ============================================================================

/**
 * Load a schema configuration from an asdl.yaml file.
 *
 * @param config_path Path to asdl.yaml
 * @return ConfigLoadResult with the loaded config or error message
 */
[[nodiscard]] ConfigLoadResult load_schema_config(const std::filesystem::path & config_path);

/**
 * Parse a schema configuration from YAML text.
 */
[[nodiscard]] ConfigLoadResult parse_schema_config(std::string_view yaml_text);

/**
 * Find a schema configuration file by searching upward from a directory.
 *
 * @param start_dir Directory to start searching from
 * @return Path to asdl.yaml if found, std::nullopt otherwise
 */
[[nodiscard]] std::optional<std::filesystem::path> find_schema_config(
  const std::filesystem::path & start_dir);

/**
 * Default name of the schema configuration file.
 */
inline constexpr const char * k_schema_config_file_name = "asdl.yaml";

}  // namespace asdl
