// asdl/sema/type_resolver.hpp - Declaration trees to TypeModel
//
// Runs after parsing. Binds every field type name to a primitive or a
// declared type, assigns constructor tags and field indices, then checks
// that every type has a finite inhabitant (EmbeddingCycleChecker).
//
#pragma once

#include <memory>
#include <string_view>
#include <utility>
#include <vector>

#include "asdl/ast/ast.hpp"
#include "asdl/basic/diagnostic.hpp"
#include "asdl/sema/primitive_table.hpp"
#include "asdl/sema/type_model.hpp"

namespace asdl
{

/**
 * Resolves the modules of one load into a TypeModel.
 *
 * Lookup for a field type:
 * - `mod.T` looks only in module `mod`, which must be the current module or
 *   one loaded before it
 * - `T` looks up primitives (and aliases), then the current module, then
 *   the modules loaded before it; a name declared by several earlier modules
 *   is ambiguous
 *
 * All problems are reported as ResolutionError, except cycles (CycleError).
 */
class TypeResolver
{
public:
  TypeResolver(DiagnosticBag & diags, PrimitiveTable primitives)
  : diags_(diags), primitives_(std::move(primitives))
  {
  }

  /**
   * Resolve all modules of the given files, in order.
   *
   * @return The model, or nullptr if any error was reported
   */
  [[nodiscard]] std::shared_ptr<TypeModel> resolve(const std::vector<const SchemaFile *> & files);

private:
  struct PendingType
  {
    TypeInfo * info = nullptr;
    const TypeDecl * decl = nullptr;
    size_t module_pos = 0;  ///< position of the owning module in load order
  };

  void declare_module(TypeModel & model, const ModuleDecl & decl, FileId file_id);
  void declare_type(TypeModel & model, ModuleInfo & module, const TypeDecl & decl);
  void resolve_fields(const TypeModel & model, const PendingType & pending);
  void resolve_constructor(
    const TypeModel & model, const PendingType & pending, ConstructorInfo & ctor,
    gsl::span<FieldDecl *> fields, gsl::span<FieldDecl *> attributes);

  [[nodiscard]] TypeRef lookup(
    const TypeModel & model, const FieldDecl & field, size_t module_pos) const;
  [[nodiscard]] TypeRef lookup_qualified(
    const TypeModel & model, const FieldDecl & field, size_t module_pos) const;

  DiagnosticBag & diags_;
  PrimitiveTable primitives_;
  std::vector<PendingType> pending_;
};

}  // namespace asdl
