// asdl/runtime/validator.hpp - Structural check of values against types
#pragma once

#include <cstddef>
#include <string>
#include <string_view>

#include "asdl/basic/result.hpp"
#include "asdl/runtime/value.hpp"
#include "asdl/sema/type_model.hpp"

namespace asdl
{

/// Nesting limit for walking unchecked values (see Value::assemble).
inline constexpr size_t kMaxValidationDepth = 1000;

/**
 * Check that `value` conforms to `type`.
 *
 * Identity first (for sum types: the value's constructor belongs to the
 * sum), then every field recursively: primitive kinds, nested values,
 * lists element-wise, absent only for optional fields. Nested values that
 * were checked on construction are not walked again.
 *
 * Fails fast with TypeMismatchError and the field path, e.g.
 * `FuncCall.args[1]`. Unchecked values nested kMaxValidationDepth levels or
 * deeper fail with RecursionLimitError.
 */
[[nodiscard]] Status validate(const Value & value, const TypeRef & type);

/// validate() against a type looked up by name (`T` or `mod.T`).
[[nodiscard]] Status validate(const TypeModel & model, const Value & value, std::string_view type_name);

/**
 * Check one field value against its declaration.
 *
 * @param path Path of the field, used in error reports
 */
[[nodiscard]] Status validate_field(
  const FieldInfo & field, const FieldValue & value, const std::string & path);

/// Check the fields of `value` against its own constructor.
[[nodiscard]] Status validate_fields(const Value & value, const std::string & path);

}  // namespace asdl
