// asdl/runtime/validator.cpp - Structural check of values against types
#include "asdl/runtime/validator.hpp"

#include <fmt/core.h>

namespace asdl
{

namespace
{

std::string describe(const FieldValue & v)
{
  if (v.is_node()) {
    if (!v.as_node()) {
      return "a null node";
    }
    return fmt::format("`{}` value `{}`", v.as_node()->type().name, v.as_node()->constructor().name);
  }
  if (v.is_absent()) {
    return "an absent value";
  }
  if (v.is_list()) {
    return fmt::format("a list of {} element(s)", v.as_list().size());
  }
  return fmt::format("a value of type `{}`", to_string(v.kind()));
}

bool primitive_matches(PrimitiveKind kind, const FieldValue & v)
{
  switch (kind) {
    case PrimitiveKind::String:
      return v.is_string();
    case PrimitiveKind::Integer:
      return v.is_integer();
    case PrimitiveKind::Bool:
      return v.is_bool();
  }
  return false;
}

Status mismatch(const std::string & path, const TypeRef & expected, const FieldValue & got)
{
  return Status::fail(
    ErrorCode::TypeMismatchError, path,
    fmt::format("expected `{}`, got {}", expected.name(), describe(got)));
}

Status check_fields(const Value & value, const std::string & path, size_t depth);

// One element of a field: never absent, never a list.
Status check_element(
  const TypeRef & type, const FieldValue & v, const std::string & path, size_t depth)
{
  if (type.is_primitive()) {
    if (!primitive_matches(type.primitive_kind(), v)) {
      return mismatch(path, type, v);
    }
    return Status::ok();
  }

  if (!type.is_declared()) {
    return Status::fail(
      ErrorCode::TypeMismatchError, path, "field type is unresolved");
  }

  if (!v.is_node() || !v.as_node()) {
    return mismatch(path, type, v);
  }

  const Value & node = *v.as_node();
  if (&node.type() != type.type_info()) {
    return mismatch(path, type, v);
  }

  if (node.is_checked()) {
    return Status::ok();
  }
  if (depth + 1 >= kMaxValidationDepth) {
    return Status::fail(
      ErrorCode::RecursionLimitError, path,
      fmt::format("unchecked value nests deeper than {} levels", kMaxValidationDepth));
  }
  return check_fields(node, path, depth + 1);
}

Status check_field(
  const FieldInfo & field, const FieldValue & value, const std::string & path, size_t depth)
{
  switch (field.multiplicity) {
    case Multiplicity::Single:
      if (value.is_absent()) {
        return Status::fail(
          ErrorCode::TypeMismatchError, path,
          fmt::format("single field of type `{}` cannot be absent", field.type.name()));
      }
      if (value.is_list()) {
        return mismatch(path, field.type, value);
      }
      return check_element(field.type, value, path, depth);

    case Multiplicity::Optional:
      if (value.is_absent()) {
        return Status::ok();
      }
      if (value.is_list()) {
        return mismatch(path, field.type, value);
      }
      return check_element(field.type, value, path, depth);

    case Multiplicity::Repeated: {
      if (!value.is_list()) {
        return Status::fail(
          ErrorCode::TypeMismatchError, path,
          fmt::format("expected a list of `{}`, got {}", field.type.name(), describe(value)));
      }
      const auto & elements = value.as_list();
      for (size_t i = 0; i < elements.size(); ++i) {
        const std::string elem_path = fmt::format("{}[{}]", path, i);
        if (elements[i].is_absent() || elements[i].is_list()) {
          return mismatch(elem_path, field.type, elements[i]);
        }
        Status s = check_element(field.type, elements[i], elem_path, depth);
        if (!s.success) {
          return s;
        }
      }
      return Status::ok();
    }
  }
  return Status::ok();
}

Status check_fields(const Value & value, const std::string & path, size_t depth)
{
  const ConstructorInfo & ctor = value.constructor();
  if (value.field_count() != ctor.arity()) {
    return Status::fail(
      ErrorCode::TypeMismatchError, path,
      fmt::format(
        "`{}` declares {} field(s), value has {}", ctor.name, ctor.arity(), value.field_count()));
  }

  for (const auto & field : ctor.fields) {
    Status s = check_field(field, value.fields()[field.index], path + "." + field.name, depth);
    if (!s.success) {
      return s;
    }
  }
  return Status::ok();
}

}  // namespace

Status validate_field(const FieldInfo & field, const FieldValue & value, const std::string & path)
{
  return check_field(field, value, path, 0);
}

Status validate_fields(const Value & value, const std::string & path)
{
  return check_fields(value, path, 0);
}

Status validate(const Value & value, const TypeRef & type)
{
  const std::string path = value.constructor().name;

  if (!type.is_declared()) {
    return Status::fail(
      ErrorCode::TypeMismatchError, path,
      fmt::format("expected `{}`, got `{}` value", type.name(), value.type().name));
  }

  const TypeInfo * expected = type.type_info();
  if (value.constructor().owner != expected) {
    return Status::fail(
      ErrorCode::TypeMismatchError, path,
      fmt::format(
        "constructor `{}` does not belong to type `{}`", value.constructor().name,
        expected->name));
  }

  return validate_fields(value, path);
}

Status validate(const TypeModel & model, const Value & value, std::string_view type_name)
{
  const TypeInfo * type = model.find_type(type_name);
  if (type == nullptr) {
    return Status::fail(
      ErrorCode::TypeMismatchError, std::string(type_name),
      fmt::format("unknown type `{}`", type_name));
  }
  return validate(value, TypeRef::declared(type));
}

}  // namespace asdl
