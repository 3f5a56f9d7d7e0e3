// asdl/runtime/value.hpp - Immutable values conforming to a TypeModel
//
// A Value is {type, constructor (tag), ordered field values}. Values are
// shared through ValuePtr (std::shared_ptr<const Value>) and never mutated.
// Each value keeps its TypeModel alive.
//
#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "asdl/basic/result.hpp"
#include "asdl/sema/type_model.hpp"

namespace asdl
{

class Value;
using ValuePtr = std::shared_ptr<const Value>;

// ============================================================================
// Field Value Kind
// ============================================================================

enum class FieldValueKind : uint8_t {
  Absent,   ///< no value (optional fields only)
  Integer,  ///< 64-bit signed integer
  String,   ///< UTF-8 string
  Bool,     ///< Boolean
  Node,     ///< nested Value
  List,     ///< ordered elements (repeated fields only)
};

[[nodiscard]] constexpr std::string_view to_string(FieldValueKind k) noexcept
{
  switch (k) {
    case FieldValueKind::Absent:
      return "absent";
    case FieldValueKind::Integer:
      return "int";
    case FieldValueKind::String:
      return "string";
    case FieldValueKind::Bool:
      return "bool";
    case FieldValueKind::Node:
      return "node";
    case FieldValueKind::List:
      return "list";
  }
  return "";
}

// ============================================================================
// Field Value
// ============================================================================

/**
 * The value held by one field of a Value.
 *
 * "Absent" and "empty list" are distinct: the former fills an optional
 * field, the latter a repeated one.
 */
class FieldValue
{
public:
  // ===========================================================================
  // Factory Methods
  // ===========================================================================

  static FieldValue make_absent() { return FieldValue(); }

  static FieldValue make_integer(int64_t value)
  {
    FieldValue v;
    v.kind_ = FieldValueKind::Integer;
    v.intValue_ = value;
    return v;
  }

  static FieldValue make_string(std::string value)
  {
    FieldValue v;
    v.kind_ = FieldValueKind::String;
    v.stringValue_ = std::move(value);
    return v;
  }

  static FieldValue make_bool(bool value)
  {
    FieldValue v;
    v.kind_ = FieldValueKind::Bool;
    v.boolValue_ = value;
    return v;
  }

  static FieldValue make_node(ValuePtr node)
  {
    FieldValue v;
    v.kind_ = FieldValueKind::Node;
    v.node_ = std::move(node);
    return v;
  }

  static FieldValue make_list(std::vector<FieldValue> elements)
  {
    FieldValue v;
    v.kind_ = FieldValueKind::List;
    v.elements_ = std::move(elements);
    return v;
  }

  // ===========================================================================
  // Kind Queries
  // ===========================================================================

  [[nodiscard]] FieldValueKind kind() const noexcept { return kind_; }

  [[nodiscard]] bool is_absent() const noexcept { return kind_ == FieldValueKind::Absent; }
  [[nodiscard]] bool is_integer() const noexcept { return kind_ == FieldValueKind::Integer; }
  [[nodiscard]] bool is_string() const noexcept { return kind_ == FieldValueKind::String; }
  [[nodiscard]] bool is_bool() const noexcept { return kind_ == FieldValueKind::Bool; }
  [[nodiscard]] bool is_node() const noexcept { return kind_ == FieldValueKind::Node; }
  [[nodiscard]] bool is_list() const noexcept { return kind_ == FieldValueKind::List; }

  // ===========================================================================
  // Value Accessors
  // ===========================================================================

  /// Only valid if is_integer()
  [[nodiscard]] int64_t as_integer() const noexcept { return intValue_; }

  /// Only valid if is_string()
  [[nodiscard]] const std::string & as_string() const noexcept { return stringValue_; }

  /// Only valid if is_bool()
  [[nodiscard]] bool as_bool() const noexcept { return boolValue_; }

  /// Only valid if is_node(); may still be null
  [[nodiscard]] const ValuePtr & as_node() const noexcept { return node_; }

  /// Only valid if is_list()
  [[nodiscard]] const std::vector<FieldValue> & as_list() const noexcept { return elements_; }

  /// Default constructor creates an absent value
  FieldValue() = default;

private:
  friend class Value;

  FieldValueKind kind_ = FieldValueKind::Absent;
  int64_t intValue_ = 0;
  bool boolValue_ = false;
  std::string stringValue_;
  ValuePtr node_;
  std::vector<FieldValue> elements_;
};

// ============================================================================
// Value
// ============================================================================

namespace detail
{
class ValueFactory;
}  // namespace detail

class Value
{
public:
  Value(const Value &) = delete;
  Value & operator=(const Value &) = delete;

  /// Releases nested values iteratively, so arbitrarily long chains can be dropped.
  ~Value();

  [[nodiscard]] const TypeInfo & type() const noexcept { return *ctor_->owner; }
  [[nodiscard]] const ConstructorInfo & constructor() const noexcept { return *ctor_; }
  [[nodiscard]] uint32_t tag() const noexcept { return ctor_->tag; }

  [[nodiscard]] const std::vector<FieldValue> & fields() const noexcept { return fields_; }
  [[nodiscard]] size_t field_count() const noexcept { return fields_.size(); }

  /// True when the value was verified against its constructor on creation.
  [[nodiscard]] bool is_checked() const noexcept { return checked_; }

  /**
   * Build a value without any check, for decoders of foreign formats.
   *
   * The result is verified when it is embedded into a constructed value or
   * passed to validate(); print() refuses a field count mismatch.
   */
  [[nodiscard]] static ValuePtr assemble(
    const ConstructorInfo & ctor, std::vector<FieldValue> fields);

private:
  friend class detail::ValueFactory;

  Value(const ConstructorInfo & ctor, std::vector<FieldValue> fields, bool checked);

  /// Move every nested value out of `fields` into `out`.
  static void detach_children(std::vector<FieldValue> & fields, std::vector<ValuePtr> & out);

  /// Shares ownership of the model that declares the constructor.
  std::shared_ptr<const ConstructorInfo> ctor_;
  std::vector<FieldValue> fields_;
  bool checked_ = false;
};

// ============================================================================
// Accessors
// ============================================================================

/**
 * Field of a value by name.
 *
 * Fails with FieldAccessError if the value's constructor declares no such
 * field. There is no setter.
 */
[[nodiscard]] Result<const FieldValue *> get(const Value & value, std::string_view field_name);

/// Field of a value by 0-based index; FieldAccessError when out of range.
[[nodiscard]] Result<const FieldValue *> get(const Value & value, size_t index);

}  // namespace asdl
