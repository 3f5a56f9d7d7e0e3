// asdl/sema/type_model_json.cpp - JSON dump of a resolved TypeModel
#include "asdl/sema/type_model_json.hpp"

#include <string>
#include <utility>

namespace asdl
{
namespace
{

using nlohmann::json;

json j_type_ref(const TypeRef & ref)
{
  if (ref.is_declared()) {
    return json{{"kind", "declared"}, {"name", ref.type_info()->qualified_name()}};
  }
  if (ref.is_primitive()) {
    return json{{"kind", "primitive"}, {"name", std::string(to_string(ref.primitive_kind()))}};
  }
  return json{{"kind", "unresolved"}};
}

json j_field(const FieldInfo & f)
{
  return json{
    {"name", f.name},
    {"index", f.index},
    {"type", j_type_ref(f.type)},
    {"multiplicity", std::string(to_string(f.multiplicity))},
    {"attribute", f.is_attribute}};
}

json j_constructor(const ConstructorInfo & c)
{
  json fields = json::array();
  for (const auto & f : c.fields) {
    fields.push_back(j_field(f));
  }
  return json{{"name", c.name}, {"tag", c.tag}, {"fields", std::move(fields)}};
}

}  // namespace

json to_json(const TypeInfo & type)
{
  json ctors = json::array();
  for (const auto & c : type.constructors) {
    ctors.push_back(j_constructor(c));
  }
  return json{
    {"name", type.name},
    {"qualifiedName", type.qualified_name()},
    {"kind", std::string(to_string(type.kind))},
    {"index", type.index},
    {"simple", type.is_simple()},
    {"constructors", std::move(ctors)}};
}

json to_json(const TypeModel & model)
{
  json modules = json::array();
  for (const auto * m : model.modules()) {
    json types = json::array();
    for (const auto * t : m->types) {
      types.push_back(to_json(*t));
    }
    modules.push_back(json{{"name", m->name}, {"types", std::move(types)}});
  }

  json primitives = json::object();
  for (const auto & [name, kind] : model.primitives().names()) {
    primitives[name] = std::string(to_string(kind));
  }

  return json{{"primitives", std::move(primitives)}, {"modules", std::move(modules)}};
}

}  // namespace asdl
