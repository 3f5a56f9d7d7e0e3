// asdl/runtime/construct.hpp - Typed construction of values
#pragma once

#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "asdl/basic/result.hpp"
#include "asdl/runtime/value.hpp"
#include "asdl/sema/type_model.hpp"

namespace asdl
{

/// A field value supplied by name.
using NamedField = std::pair<std::string, FieldValue>;

/**
 * Construct a value of `type_name` with positional field values.
 *
 * `ctor_name` is required for sum types; for product types it may be empty
 * or the type name. Errors:
 * - unknown type or constructor: TypeMismatchError
 * - field count other than the constructor's (attributes included): ArityError
 * - a field value that does not conform: TypeMismatchError with its path
 *
 * Example:
 * @code
 *   auto ret = construct(model, "cflow", "Return", {FieldValue::make_integer(2)});
 * @endcode
 */
[[nodiscard]] Result<ValuePtr> construct(
  const TypeModel & model, std::string_view type_name, std::string_view ctor_name,
  std::vector<FieldValue> fields);

/// Construct from a constructor of the model directly.
[[nodiscard]] Result<ValuePtr> construct(
  const ConstructorInfo & ctor, std::vector<FieldValue> fields);

/**
 * Construct with field values supplied by name, in any order.
 *
 * Omitted optional fields are absent, omitted repeated fields are empty
 * lists. A missing single field or a name given twice is an ArityError; a
 * name the constructor does not declare is a FieldAccessError.
 */
[[nodiscard]] Result<ValuePtr> construct_named(
  const TypeModel & model, std::string_view type_name, std::string_view ctor_name,
  std::vector<NamedField> fields);

/// Find the constructor `ctor_name` of `type_name`; TypeMismatchError if none.
[[nodiscard]] Result<const ConstructorInfo *> find_constructor(
  const TypeModel & model, std::string_view type_name, std::string_view ctor_name);

}  // namespace asdl
