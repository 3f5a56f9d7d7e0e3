// asdl/runtime/construct.cpp - Typed construction of values
#include "asdl/runtime/construct.hpp"

#include <fmt/core.h>

#include <optional>

#include "asdl/runtime/validator.hpp"

namespace asdl
{

namespace detail
{

class ValueFactory
{
public:
  static ValuePtr make_checked(const ConstructorInfo & ctor, std::vector<FieldValue> fields)
  {
    return ValuePtr(new Value(ctor, std::move(fields), true));
  }
};

}  // namespace detail

Result<const ConstructorInfo *> find_constructor(
  const TypeModel & model, std::string_view type_name, std::string_view ctor_name)
{
  using R = Result<const ConstructorInfo *>;

  const TypeInfo * type = model.find_type(type_name);
  if (type == nullptr) {
    return R::fail(
      ErrorCode::TypeMismatchError, std::string(type_name),
      fmt::format("unknown type `{}`", type_name));
  }

  if (type->is_product()) {
    if (!ctor_name.empty() && ctor_name != type->name) {
      return R::fail(
        ErrorCode::TypeMismatchError, std::string(type_name),
        fmt::format("product type `{}` has no constructor `{}`", type->name, ctor_name));
    }
    return R::ok(&type->constructors.front());
  }

  if (ctor_name.empty()) {
    return R::fail(
      ErrorCode::TypeMismatchError, std::string(type_name),
      fmt::format("sum type `{}` requires a constructor name", type->name));
  }

  const ConstructorInfo * ctor = type->find_constructor(ctor_name);
  if (ctor == nullptr) {
    return R::fail(
      ErrorCode::TypeMismatchError, std::string(type_name),
      fmt::format("type `{}` has no constructor `{}`", type->name, ctor_name));
  }
  return R::ok(ctor);
}

Result<ValuePtr> construct(const ConstructorInfo & ctor, std::vector<FieldValue> fields)
{
  if (fields.size() != ctor.arity()) {
    return Result<ValuePtr>::fail(
      ErrorCode::ArityError, ctor.name,
      fmt::format("`{}` takes {} field(s), got {}", ctor.name, ctor.arity(), fields.size()));
  }

  for (const auto & field : ctor.fields) {
    const Status s = validate_field(field, fields[field.index], ctor.name + "." + field.name);
    if (!s.success) {
      return Result<ValuePtr>::fail(s.error);
    }
  }

  return Result<ValuePtr>::ok(detail::ValueFactory::make_checked(ctor, std::move(fields)));
}

Result<ValuePtr> construct(
  const TypeModel & model, std::string_view type_name, std::string_view ctor_name,
  std::vector<FieldValue> fields)
{
  const auto found = find_constructor(model, type_name, ctor_name);
  if (!found.success) {
    return Result<ValuePtr>::fail(found.error);
  }
  return construct(*found.value, std::move(fields));
}

Result<ValuePtr> construct_named(
  const TypeModel & model, std::string_view type_name, std::string_view ctor_name,
  std::vector<NamedField> fields)
{
  const auto found = find_constructor(model, type_name, ctor_name);
  if (!found.success) {
    return Result<ValuePtr>::fail(found.error);
  }
  const ConstructorInfo & ctor = *found.value;

  std::vector<std::optional<FieldValue>> slots(ctor.arity());
  for (auto & [name, value] : fields) {
    const FieldInfo * field = ctor.find_field(name);
    if (field == nullptr) {
      return Result<ValuePtr>::fail(
        ErrorCode::FieldAccessError, ctor.name + "." + name,
        fmt::format("constructor `{}` has no field `{}`", ctor.name, name));
    }
    if (slots[field->index]) {
      return Result<ValuePtr>::fail(
        ErrorCode::ArityError, ctor.name + "." + name,
        fmt::format("field `{}` is supplied more than once", name));
    }
    slots[field->index] = std::move(value);
  }

  std::vector<FieldValue> positional;
  positional.reserve(ctor.arity());
  for (const auto & field : ctor.fields) {
    auto & slot = slots[field.index];
    if (slot) {
      positional.push_back(std::move(*slot));
      continue;
    }
    switch (field.multiplicity) {
      case Multiplicity::Optional:
        positional.push_back(FieldValue::make_absent());
        break;
      case Multiplicity::Repeated:
        positional.push_back(FieldValue::make_list({}));
        break;
      case Multiplicity::Single:
        return Result<ValuePtr>::fail(
          ErrorCode::ArityError, ctor.name + "." + field.name,
          fmt::format("missing value for field `{}` of `{}`", field.name, ctor.name));
    }
  }

  return construct(ctor, std::move(positional));
}

}  // namespace asdl
