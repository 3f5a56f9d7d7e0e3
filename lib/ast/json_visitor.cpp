// asdl/ast/json_visitor.cpp - JSON serialization for declaration trees
//
#include "asdl/ast/json_visitor.hpp"

#include <cstdint>
#include <string>
#include <utility>

#include "asdl/ast/ast_enums.hpp"
#include "asdl/basic/casting.hpp"
#include "asdl/basic/source_manager.hpp"

namespace asdl
{
namespace
{

using nlohmann::json;

// ============================================================================
// Helper functions
// ============================================================================

json j_range(SourceRange r)
{
  if (r.is_invalid()) {
    return json{{"start", nullptr}, {"end", nullptr}};
  }
  return json{{"start", r.get_begin().offset()}, {"end", r.get_end().offset()}};
}

json j_field(const FieldDecl * f)
{
  json j{
    {"type", "Field"},
    {"range", j_range(f->get_range())},
    {"name", std::string(f->name)},
    {"typeName", std::string(f->type_name)},
    {"multiplicity", std::string(to_string(f->multiplicity))}};
  if (f->is_qualified()) {
    j["typeModule"] = std::string(f->type_module);
  }
  return j;
}

json j_fields(gsl::span<FieldDecl *> fields)
{
  json arr = json::array();
  for (const auto * f : fields) {
    arr.push_back(j_field(f));
  }
  return arr;
}

json j_constructor(const ConstructorDecl * c)
{
  return json{
    {"type", "Constructor"},
    {"range", j_range(c->get_range())},
    {"name", std::string(c->name)},
    {"fields", j_fields(c->fields)}};
}

json j_type_decl(const TypeDecl * d)
{
  json j{{"range", j_range(d->get_range())}, {"name", std::string(d->name)}};

  if (const auto * sum = dyn_cast<SumTypeDecl>(d)) {
    j["type"] = "SumType";
    json ctors = json::array();
    for (const auto * c : sum->constructors) {
      ctors.push_back(j_constructor(c));
    }
    j["constructors"] = std::move(ctors);
  } else {
    j["type"] = "ProductType";
    j["fields"] = j_fields(cast<ProductTypeDecl>(d)->fields);
  }

  if (!d->attributes.empty()) {
    j["attributes"] = j_fields(d->attributes);
  }
  return j;
}

json j_module(const ModuleDecl * m)
{
  json types = json::array();
  for (const auto * t : m->types) {
    types.push_back(j_type_decl(t));
  }
  return json{
    {"type", "Module"},
    {"range", j_range(m->get_range())},
    {"name", std::string(m->name)},
    {"types", std::move(types)}};
}

}  // namespace

json to_json(const AstNode * node)
{
  if (node == nullptr) {
    return nullptr;
  }

  switch (node->get_kind()) {
    case NodeKind::SumTypeDecl:
    case NodeKind::ProductTypeDecl:
      return j_type_decl(cast<TypeDecl>(node));
    case NodeKind::ConstructorDecl:
      return j_constructor(cast<ConstructorDecl>(node));
    case NodeKind::FieldDecl:
      return j_field(cast<FieldDecl>(node));
    case NodeKind::ModuleDecl:
      return j_module(cast<ModuleDecl>(node));
    case NodeKind::SchemaFile:
      return to_json(cast<SchemaFile>(node));
  }
  return nullptr;
}

json to_json(const SchemaFile * file)
{
  if (file == nullptr) {
    return nullptr;
  }

  json modules = json::array();
  for (const auto * m : file->modules) {
    modules.push_back(j_module(m));
  }
  return json{
    {"type", "SchemaFile"},
    {"range", j_range(file->get_range())},
    {"fileId", file->file_id.value()},
    {"modules", std::move(modules)}};
}

}  // namespace asdl
