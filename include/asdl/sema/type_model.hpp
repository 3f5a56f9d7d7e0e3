// asdl/sema/type_model.hpp - Resolved, immutable registry of schema types
//
// Built once by the TypeResolver and shared read-only afterwards
// (std::shared_ptr<const TypeModel>). Values co-own the model they were
// constructed against.
//
#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "asdl/ast/ast_enums.hpp"
#include "asdl/basic/source_manager.hpp"
#include "asdl/sema/primitive_table.hpp"

namespace asdl
{

struct TypeInfo;
struct ModuleInfo;
class TypeModel;

// ============================================================================
// Type Kind
// ============================================================================

enum class TypeKind : uint8_t {
  Sum,      ///< `T = A(...) | B | ...`
  Product,  ///< `T = (...)`
};

[[nodiscard]] constexpr std::string_view to_string(TypeKind k) noexcept
{
  return k == TypeKind::Sum ? "sum" : "product";
}

// ============================================================================
// TypeRef - Resolved identity of a field type
// ============================================================================

/**
 * Either a primitive kind or a declared type of the model.
 *
 * Declared types are compared by identity (pointer equality).
 */
class TypeRef
{
public:
  /// Invalid reference (unresolved)
  constexpr TypeRef() noexcept = default;

  [[nodiscard]] static constexpr TypeRef primitive(PrimitiveKind k) noexcept
  {
    return TypeRef(k, nullptr);
  }
  [[nodiscard]] static constexpr TypeRef declared(const TypeInfo * type) noexcept
  {
    return TypeRef(PrimitiveKind::String, type);
  }

  [[nodiscard]] constexpr bool is_valid() const noexcept { return valid_; }
  [[nodiscard]] constexpr bool is_primitive() const noexcept { return valid_ && type_ == nullptr; }
  [[nodiscard]] constexpr bool is_declared() const noexcept { return type_ != nullptr; }

  /// Only meaningful when is_primitive()
  [[nodiscard]] constexpr PrimitiveKind primitive_kind() const noexcept { return primitive_; }

  /// nullptr unless is_declared()
  [[nodiscard]] constexpr const TypeInfo * type_info() const noexcept { return type_; }

  /// `int`, `string`, `bool` or the declared type's name.
  [[nodiscard]] std::string name() const;

  [[nodiscard]] constexpr bool operator==(const TypeRef & other) const noexcept
  {
    return valid_ == other.valid_ && type_ == other.type_ &&
           (type_ != nullptr || primitive_ == other.primitive_);
  }
  [[nodiscard]] constexpr bool operator!=(const TypeRef & other) const noexcept
  {
    return !(*this == other);
  }

private:
  constexpr TypeRef(PrimitiveKind k, const TypeInfo * type) noexcept
  : primitive_(k), type_(type), valid_(true)
  {
  }

  PrimitiveKind primitive_ = PrimitiveKind::String;
  const TypeInfo * type_ = nullptr;
  bool valid_ = false;
};

// ============================================================================
// Field / Constructor / Type / Module
// ============================================================================

struct FieldInfo
{
  std::string name;
  TypeRef type;
  Multiplicity multiplicity = Multiplicity::Single;
  uint32_t index = 0;         ///< 0-based position in the constructor
  bool is_attribute = false;  ///< declared by `attributes (...)`
  SourceRange range;

  /// Schema spelling, e.g. `arith_expr*`.
  [[nodiscard]] std::string type_spelling() const;
};

struct ConstructorInfo
{
  std::string name;
  uint32_t tag = 0;  ///< 0-based declaration order within the owning type
  std::vector<FieldInfo> fields;
  const TypeInfo * owner = nullptr;
  SourceRange range;

  [[nodiscard]] size_t arity() const noexcept { return fields.size(); }
  [[nodiscard]] const FieldInfo * find_field(std::string_view field_name) const noexcept;
};

struct TypeInfo
{
  std::string name;
  const ModuleInfo * module = nullptr;
  TypeKind kind = TypeKind::Sum;
  /// Products hold exactly one constructor, named after the type.
  std::vector<ConstructorInfo> constructors;
  uint32_t index = 0;  ///< position in TypeModel::types()
  SourceRange range;

  [[nodiscard]] bool is_sum() const noexcept { return kind == TypeKind::Sum; }
  [[nodiscard]] bool is_product() const noexcept { return kind == TypeKind::Product; }

  /// A sum type whose constructors carry no fields (an enumeration).
  [[nodiscard]] bool is_simple() const noexcept;

  [[nodiscard]] const ConstructorInfo * find_constructor(std::string_view ctor_name) const noexcept;

  /// `module.Type`
  [[nodiscard]] std::string qualified_name() const;
};

struct ModuleInfo
{
  std::string name;
  FileId file_id = FileId::invalid();
  SourceRange range;
  std::vector<const TypeInfo *> types;  ///< declaration order
  const TypeModel * model = nullptr;    ///< owning model

  [[nodiscard]] const TypeInfo * find_type(std::string_view type_name) const noexcept;
};

// ============================================================================
// Type Model
// ============================================================================

class TypeResolver;

/**
 * All modules and types of one successful load.
 *
 * Lookup:
 * - `find_type("mod.T")` looks only in module `mod`
 * - `find_type("T")` returns the single type of that name across all
 *   modules, or nullptr if none or several modules declare it
 *
 * Always held by std::shared_ptr (see TypeResolver::resolve); its modules
 * point back to it, so it is neither copyable nor movable.
 */
class TypeModel : public std::enable_shared_from_this<TypeModel>
{
public:
  TypeModel() = default;

  TypeModel(const TypeModel &) = delete;
  TypeModel & operator=(const TypeModel &) = delete;
  TypeModel(TypeModel &&) = delete;
  TypeModel & operator=(TypeModel &&) = delete;

  [[nodiscard]] const TypeInfo * find_type(std::string_view name) const noexcept;
  [[nodiscard]] const ModuleInfo * find_module(std::string_view name) const noexcept;

  /// Modules in load order.
  [[nodiscard]] const std::vector<const ModuleInfo *> & modules() const noexcept
  {
    return module_views_;
  }

  /// Types in load order (module by module, declaration order within).
  [[nodiscard]] const std::vector<const TypeInfo *> & types() const noexcept
  {
    return type_views_;
  }

  [[nodiscard]] const PrimitiveTable & primitives() const noexcept { return primitives_; }

  [[nodiscard]] size_t constructor_count() const noexcept;

private:
  friend class TypeResolver;

  ModuleInfo * add_module(std::string name, FileId file_id, SourceRange range);
  TypeInfo * add_type(ModuleInfo & module, std::string name, TypeKind kind, SourceRange range);

  std::vector<std::unique_ptr<ModuleInfo>> modules_;
  std::vector<std::unique_ptr<TypeInfo>> types_;
  std::vector<const ModuleInfo *> module_views_;
  std::vector<const TypeInfo *> type_views_;
  PrimitiveTable primitives_;
};

}  // namespace asdl
