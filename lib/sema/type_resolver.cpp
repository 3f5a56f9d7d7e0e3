// asdl/sema/type_resolver.cpp - Declaration trees to TypeModel
#include "asdl/sema/type_resolver.hpp"

#include <spdlog/spdlog.h>

#include <string>

#include "asdl/basic/casting.hpp"
#include "asdl/sema/embedding_cycle_checker.hpp"

namespace asdl
{

std::shared_ptr<TypeModel> TypeResolver::resolve(const std::vector<const SchemaFile *> & files)
{
  const size_t errors_before = diags_.size();

  auto model = std::make_shared<TypeModel>();
  model->primitives_ = primitives_;
  pending_.clear();

  // Pass 1: declare modules, types and constructors (tags).
  for (const auto * file : files) {
    if (file == nullptr) continue;
    for (const auto * mod : file->modules) {
      declare_module(*model, *mod, file->file_id);
    }
  }

  // Pass 2: bind field types and assign field indices.
  for (const auto & pending : pending_) {
    resolve_fields(*model, pending);
  }
  pending_.clear();

  if (diags_.size() > errors_before) {
    spdlog::debug("type resolution failed with {} error(s)", diags_.size() - errors_before);
    return nullptr;
  }

  // Pass 3: every type needs a finite inhabitant.
  EmbeddingCycleChecker cycles(&diags_);
  if (!cycles.check(*model)) {
    spdlog::debug("embedding cycle check reported {} cycle(s)", cycles.error_count());
    return nullptr;
  }

  spdlog::debug(
    "resolved {} module(s), {} type(s), {} constructor(s)", model->modules().size(),
    model->types().size(), model->constructor_count());
  return model;
}

void TypeResolver::declare_module(TypeModel & model, const ModuleDecl & decl, FileId file_id)
{
  if (const ModuleInfo * prev = model.find_module(decl.name)) {
    diags_
      .report(
        ErrorCode::ResolutionError, decl.name_range,
        "duplicate module `" + std::string(decl.name) + "`", "redefined here")
      .with_secondary_label(prev->range, "first defined here");
    return;
  }

  ModuleInfo * mod = model.add_module(std::string(decl.name), file_id, decl.name_range);
  spdlog::trace("declaring module `{}` ({} type declarations)", mod->name, decl.types.size());

  for (const auto * type : decl.types) {
    declare_type(model, *mod, *type);
  }
}

void TypeResolver::declare_type(TypeModel & model, ModuleInfo & module, const TypeDecl & decl)
{
  if (primitives_.contains(decl.name)) {
    const char * what = primitives_.is_alias(decl.name) ? "primitive alias" : "primitive type";
    diags_.report(
      ErrorCode::ResolutionError, decl.name_range,
      "type `" + std::string(decl.name) + "` shadows the " + what + " of the same name",
      "declared here");
    return;
  }

  if (const TypeInfo * prev = module.find_type(decl.name)) {
    diags_
      .report(
        ErrorCode::ResolutionError, decl.name_range,
        "duplicate type `" + std::string(decl.name) + "` in module `" + module.name + "`",
        "redefined here")
      .with_secondary_label(prev->range, "first defined here");
    return;
  }

  const TypeKind kind = isa<SumTypeDecl>(&decl) ? TypeKind::Sum : TypeKind::Product;
  TypeInfo * info = model.add_type(module, std::string(decl.name), kind, decl.name_range);

  if (const auto * sum = dyn_cast<SumTypeDecl>(&decl)) {
    info->constructors.reserve(sum->constructors.size());
    uint32_t tag = 0;
    for (const auto * c : sum->constructors) {
      ConstructorInfo ctor;
      ctor.name = std::string(c->name);
      ctor.tag = tag++;
      ctor.owner = info;
      ctor.range = c->name_range;
      info->constructors.push_back(std::move(ctor));
    }
  } else {
    ConstructorInfo ctor;
    ctor.name = info->name;
    ctor.tag = 0;
    ctor.owner = info;
    ctor.range = decl.name_range;
    info->constructors.push_back(std::move(ctor));
  }

  spdlog::trace(
    "declared {} type `{}` with {} constructor(s)", to_string(kind), info->qualified_name(),
    info->constructors.size());

  pending_.push_back({info, &decl, model.modules().size() - 1});
}

void TypeResolver::resolve_fields(const TypeModel & model, const PendingType & pending)
{
  if (const auto * sum = dyn_cast<SumTypeDecl>(pending.decl)) {
    for (size_t i = 0; i < sum->constructors.size(); ++i) {
      resolve_constructor(
        model, pending, pending.info->constructors[i], sum->constructors[i]->fields,
        sum->attributes);
    }
    return;
  }

  const auto * product = cast<ProductTypeDecl>(pending.decl);
  resolve_constructor(
    model, pending, pending.info->constructors.front(), product->fields, product->attributes);
}

void TypeResolver::resolve_constructor(
  const TypeModel & model, const PendingType & pending, ConstructorInfo & ctor,
  gsl::span<FieldDecl *> fields, gsl::span<FieldDecl *> attributes)
{
  ctor.fields.reserve(fields.size() + attributes.size());

  uint32_t index = 0;
  auto add = [&](const FieldDecl & decl, bool is_attribute) {
    FieldInfo field;
    field.name = std::string(decl.name);
    field.type = lookup(model, decl, pending.module_pos);
    field.multiplicity = decl.multiplicity;
    field.index = index++;
    field.is_attribute = is_attribute;
    field.range = decl.get_range();
    ctor.fields.push_back(std::move(field));
  };

  for (const auto * f : fields) {
    add(*f, false);
  }
  for (const auto * a : attributes) {
    add(*a, true);
  }
}

TypeRef TypeResolver::lookup(
  const TypeModel & model, const FieldDecl & field, size_t module_pos) const
{
  if (field.is_qualified()) {
    return lookup_qualified(model, field, module_pos);
  }

  if (const auto kind = primitives_.lookup(field.type_name)) {
    return TypeRef::primitive(*kind);
  }

  const auto & modules = model.modules();
  if (const TypeInfo * local = modules[module_pos]->find_type(field.type_name)) {
    return TypeRef::declared(local);
  }

  std::vector<const TypeInfo *> matches;
  for (size_t i = 0; i < module_pos; ++i) {
    if (const TypeInfo * t = modules[i]->find_type(field.type_name)) {
      matches.push_back(t);
    }
  }

  if (matches.size() == 1) {
    return TypeRef::declared(matches.front());
  }

  if (matches.size() > 1) {
    auto builder = diags_.report(
      ErrorCode::ResolutionError, field.type_range,
      "ambiguous type reference `" + std::string(field.type_name) + "`",
      "declared by several earlier modules");
    for (const auto * m : matches) {
      builder.with_secondary_label(m->range, "candidate `" + m->qualified_name() + "`");
    }
    builder.with_help("qualify the name, e.g. `" + matches.front()->qualified_name() + "`");
    return {};
  }

  diags_.report(
    ErrorCode::ResolutionError, field.type_range,
    "unknown type `" + std::string(field.type_name) + "`",
    "not a primitive and not declared in this or an earlier module");
  return {};
}

TypeRef TypeResolver::lookup_qualified(
  const TypeModel & model, const FieldDecl & field, size_t module_pos) const
{
  const std::string spelled = std::string(field.type_module) + "." + std::string(field.type_name);
  const auto & modules = model.modules();

  size_t target_pos = modules.size();
  for (size_t i = 0; i < modules.size(); ++i) {
    if (modules[i]->name == field.type_module) {
      target_pos = i;
      break;
    }
  }

  if (target_pos == modules.size()) {
    diags_.report(
      ErrorCode::ResolutionError, field.type_range,
      "unknown module `" + std::string(field.type_module) + "` in type reference `" + spelled +
        "`",
      "no such module");
    return {};
  }

  const ModuleInfo * target = modules[target_pos];
  if (target_pos > module_pos) {
    diags_
      .report(
        ErrorCode::ResolutionError, field.type_range,
        "module `" + target->name + "` is loaded after module `" + modules[module_pos]->name +
          "`",
        "referenced here")
      .with_help("only the current module and modules loaded before it can be referenced");
    return {};
  }

  if (const TypeInfo * t = target->find_type(field.type_name)) {
    return TypeRef::declared(t);
  }

  diags_.report(
    ErrorCode::ResolutionError, field.type_range, "unknown type `" + spelled + "`",
    "module `" + target->name + "` declares no type `" + std::string(field.type_name) + "`");
  return {};
}

}  // namespace asdl
