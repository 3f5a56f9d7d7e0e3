// asdl/sema/type_model.cpp - Resolved, immutable registry of schema types
#include "asdl/sema/type_model.hpp"

#include <algorithm>
#include <utility>

namespace asdl
{

std::string TypeRef::name() const
{
  if (type_ != nullptr) {
    return type_->name;
  }
  if (!valid_) {
    return "<unresolved>";
  }
  return std::string(to_string(primitive_));
}

std::string FieldInfo::type_spelling() const
{
  return type.name() + std::string(multiplicity_suffix(multiplicity));
}

const FieldInfo * ConstructorInfo::find_field(std::string_view field_name) const noexcept
{
  auto it = std::find_if(
    fields.begin(), fields.end(), [&](const FieldInfo & f) { return f.name == field_name; });
  return it != fields.end() ? &*it : nullptr;
}

bool TypeInfo::is_simple() const noexcept
{
  return is_sum() && std::all_of(constructors.begin(), constructors.end(), [](const auto & c) {
           return c.fields.empty();
         });
}

const ConstructorInfo * TypeInfo::find_constructor(std::string_view ctor_name) const noexcept
{
  auto it = std::find_if(constructors.begin(), constructors.end(), [&](const ConstructorInfo & c) {
    return c.name == ctor_name;
  });
  return it != constructors.end() ? &*it : nullptr;
}

std::string TypeInfo::qualified_name() const
{
  if (module == nullptr) {
    return name;
  }
  return module->name + "." + name;
}

const TypeInfo * ModuleInfo::find_type(std::string_view type_name) const noexcept
{
  auto it = std::find_if(
    types.begin(), types.end(), [&](const TypeInfo * t) { return t->name == type_name; });
  return it != types.end() ? *it : nullptr;
}

// ============================================================================
// TypeModel
// ============================================================================

const TypeInfo * TypeModel::find_type(std::string_view name) const noexcept
{
  const size_t dot = name.find('.');
  if (dot != std::string_view::npos) {
    const ModuleInfo * mod = find_module(name.substr(0, dot));
    return mod != nullptr ? mod->find_type(name.substr(dot + 1)) : nullptr;
  }

  const TypeInfo * found = nullptr;
  for (const auto * mod : module_views_) {
    if (const TypeInfo * t = mod->find_type(name)) {
      if (found != nullptr) {
        return nullptr;  // ambiguous
      }
      found = t;
    }
  }
  return found;
}

const ModuleInfo * TypeModel::find_module(std::string_view name) const noexcept
{
  auto it = std::find_if(module_views_.begin(), module_views_.end(), [&](const ModuleInfo * m) {
    return m->name == name;
  });
  return it != module_views_.end() ? *it : nullptr;
}

size_t TypeModel::constructor_count() const noexcept
{
  size_t n = 0;
  for (const auto * t : type_views_) {
    n += t->constructors.size();
  }
  return n;
}

ModuleInfo * TypeModel::add_module(std::string name, FileId file_id, SourceRange range)
{
  auto mod = std::make_unique<ModuleInfo>();
  mod->name = std::move(name);
  mod->file_id = file_id;
  mod->range = range;
  mod->model = this;
  ModuleInfo * raw = mod.get();
  modules_.push_back(std::move(mod));
  module_views_.push_back(raw);
  return raw;
}

TypeInfo * TypeModel::add_type(
  ModuleInfo & module, std::string name, TypeKind kind, SourceRange range)
{
  auto type = std::make_unique<TypeInfo>();
  type->name = std::move(name);
  type->module = &module;
  type->kind = kind;
  type->index = static_cast<uint32_t>(types_.size());
  type->range = range;
  TypeInfo * raw = type.get();
  types_.push_back(std::move(type));
  type_views_.push_back(raw);
  module.types.push_back(raw);
  return raw;
}

}  // namespace asdl
