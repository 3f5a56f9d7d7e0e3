// asdl/runtime/value.cpp - Immutable values and their accessors
#include "asdl/runtime/value.hpp"

#include <fmt/core.h>

namespace asdl
{

Value::Value(const ConstructorInfo & ctor, std::vector<FieldValue> fields, bool checked)
: ctor_(ctor.owner->module->model->shared_from_this(), &ctor),
  fields_(std::move(fields)),
  checked_(checked)
{
}

Value::~Value()
{
  std::vector<ValuePtr> pending;
  detach_children(fields_, pending);
  while (!pending.empty()) {
    ValuePtr next = std::move(pending.back());
    pending.pop_back();
    if (next.use_count() == 1) {
      // Last owner: empty it before it is destroyed at the end of this scope.
      detach_children(const_cast<Value &>(*next).fields_, pending);
    }
  }
}

ValuePtr Value::assemble(const ConstructorInfo & ctor, std::vector<FieldValue> fields)
{
  return ValuePtr(new Value(ctor, std::move(fields), false));
}

Result<const FieldValue *> get(const Value & value, std::string_view field_name)
{
  const ConstructorInfo & ctor = value.constructor();
  const FieldInfo * field = ctor.find_field(field_name);
  if (field == nullptr) {
    return Result<const FieldValue *>::fail(
      ErrorCode::FieldAccessError, ctor.name,
      fmt::format("constructor `{}` has no field `{}`", ctor.name, field_name));
  }
  return get(value, static_cast<size_t>(field->index));
}

Result<const FieldValue *> get(const Value & value, size_t index)
{
  const ConstructorInfo & ctor = value.constructor();
  if (index >= value.field_count()) {
    return Result<const FieldValue *>::fail(
      ErrorCode::FieldAccessError, ctor.name,
      fmt::format(
        "field index {} is out of range for `{}` ({} field(s))", index, ctor.name,
        value.field_count()));
  }
  return Result<const FieldValue *>::ok(&value.fields()[index]);
}

void Value::detach_children(std::vector<FieldValue> & fields, std::vector<ValuePtr> & out)
{
  for (auto & field : fields) {
    if (field.node_) {
      out.push_back(std::move(field.node_));
    }
    if (!field.elements_.empty()) {
      detach_children(field.elements_, out);
    }
  }
}

}  // namespace asdl
