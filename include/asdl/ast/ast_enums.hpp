// asdl/ast/ast_enums.hpp - Enumerations shared by the declaration tree and the type model
#pragma once

#include <cstdint>
#include <string_view>

namespace asdl
{

// ============================================================================
// NodeKind - Identifies all declaration node types
// ============================================================================

enum class NodeKind : uint8_t {
  // Declarations
  SumTypeDecl,
  ProductTypeDecl,

  // Supporting nodes
  ConstructorDecl,
  FieldDecl,

  // Top-level
  ModuleDecl,
  SchemaFile,
};

[[nodiscard]] constexpr bool is_type_decl_kind(NodeKind k) noexcept
{
  return k == NodeKind::SumTypeDecl || k == NodeKind::ProductTypeDecl;
}

// ============================================================================
// Multiplicity - How many values a field holds
// ============================================================================

enum class Multiplicity : uint8_t {
  Single,    ///< exactly one value
  Optional,  ///< zero or one value (`?`)
  Repeated,  ///< zero or more values (`*`)
};

[[nodiscard]] constexpr std::string_view to_string(Multiplicity m) noexcept
{
  switch (m) {
    case Multiplicity::Single:
      return "single";
    case Multiplicity::Optional:
      return "optional";
    case Multiplicity::Repeated:
      return "repeated";
  }
  return "";
}

/// Suffix used in schema text (`*`, `?` or nothing).
[[nodiscard]] constexpr std::string_view multiplicity_suffix(Multiplicity m) noexcept
{
  switch (m) {
    case Multiplicity::Single:
      return "";
    case Multiplicity::Optional:
      return "?";
    case Multiplicity::Repeated:
      return "*";
  }
  return "";
}

}  // namespace asdl
