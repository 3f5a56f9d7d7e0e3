// asdl/sema/primitive_table.hpp - Primitive type namespace
//
// Manages the built-in primitive kinds and their aliases.
//
#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace asdl
{

// ============================================================================
// Primitive Kind
// ============================================================================

enum class PrimitiveKind : uint8_t {
  String,
  Integer,
  Bool,
};

/// Canonical schema spelling of a primitive kind.
[[nodiscard]] constexpr std::string_view to_string(PrimitiveKind k) noexcept
{
  switch (k) {
    case PrimitiveKind::String:
      return "string";
    case PrimitiveKind::Integer:
      return "int";
    case PrimitiveKind::Bool:
      return "bool";
  }
  return "";
}

/// Parse a canonical primitive name (`string`, `int`, `bool`).
[[nodiscard]] std::optional<PrimitiveKind> parse_primitive_kind(std::string_view name) noexcept;

// ============================================================================
// Primitive Table
// ============================================================================

/**
 * Names that resolve to primitive kinds.
 *
 * Manages:
 * - Canonical primitives (string, int, bool)
 * - Built-in aliases (identifier -> string)
 * - Aliases supplied by configuration
 *
 * Declared types may not reuse any of these names.
 */
class PrimitiveTable
{
public:
  PrimitiveTable() = default;

  /// Register the canonical primitives and the built-in aliases.
  void register_builtins();

  /**
   * Define an alias for a primitive kind.
   *
   * @return false if the name is already taken
   */
  bool define_alias(std::string_view alias_name, PrimitiveKind kind);

  [[nodiscard]] std::optional<PrimitiveKind> lookup(std::string_view name) const;

  [[nodiscard]] bool contains(std::string_view name) const { return lookup(name).has_value(); }

  /// True for aliases, false for canonical names and unknown names.
  [[nodiscard]] bool is_alias(std::string_view name) const;

  [[nodiscard]] size_t size() const noexcept { return names_.size(); }

  /// All names in lexicographic order.
  [[nodiscard]] const std::map<std::string, PrimitiveKind, std::less<>> & names() const noexcept
  {
    return names_;
  }

private:
  std::map<std::string, PrimitiveKind, std::less<>> names_;
};

}  // namespace asdl
