// asdl/ast/ast.hpp - Unresolved declaration tree produced by the parser
//
// Nodes follow the LLVM/Clang style with classof() for RTTI support and are
// owned by an AstContext. Type references are still plain names here; the
// TypeResolver turns them into TypeRefs of the TypeModel.
//
#pragma once

#include <gsl/span>
#include <string_view>

#include "asdl/ast/ast_enums.hpp"
#include "asdl/basic/casting.hpp"
#include "asdl/basic/source_manager.hpp"

namespace asdl
{

// ============================================================================
// Base Classes
// ============================================================================

/**
 * Base class for all declaration nodes.
 *
 * Nodes are non-copyable and managed by AstContext.
 */
class AstNode
{
public:
  const NodeKind kind;
  SourceRange range_;

  AstNode(const AstNode &) = delete;
  AstNode & operator=(const AstNode &) = delete;
  AstNode(AstNode &&) = delete;
  AstNode & operator=(AstNode &&) = delete;

  [[nodiscard]] NodeKind get_kind() const noexcept { return kind; }
  [[nodiscard]] SourceRange get_range() const noexcept { return range_; }

protected:
  explicit AstNode(NodeKind k, SourceRange r = {}) : kind(k), range_(r) {}
  ~AstNode() = default;  // Non-virtual, protected: prevents polymorphic delete
};

/**
 * CRTP base class that implements classof() for a concrete node kind.
 */
template <typename Derived, typename Base, NodeKind K>
class NodeBase : public Base
{
public:
  static constexpr NodeKind kind = K;

  static bool classof(const AstNode * node) { return node->get_kind() == K; }

protected:
  explicit NodeBase(SourceRange r = {}) : Base(K, r) {}
};

// ============================================================================
// Supporting Nodes
// ============================================================================

/// `typename ['*'|'?'] name`, e.g. `arith_expr* args` or `core.token? tok`.
class FieldDecl : public NodeBase<FieldDecl, AstNode, NodeKind::FieldDecl>
{
public:
  std::string_view type_module;  ///< Module qualifier; empty when unqualified
  std::string_view type_name;
  Multiplicity multiplicity = Multiplicity::Single;
  std::string_view name;
  SourceRange type_range;
  SourceRange name_range;

  FieldDecl(
    std::string_view module, std::string_view type, Multiplicity mult, std::string_view n,
    SourceRange r = {})
  : NodeBase(r), type_module(module), type_name(type), multiplicity(mult), name(n)
  {
  }

  [[nodiscard]] bool is_qualified() const noexcept { return !type_module.empty(); }
};

/// One alternative of a sum type: `Name` or `Name(fields)`.
class ConstructorDecl : public NodeBase<ConstructorDecl, AstNode, NodeKind::ConstructorDecl>
{
public:
  std::string_view name;
  SourceRange name_range;
  gsl::span<FieldDecl *> fields;

  explicit ConstructorDecl(std::string_view n, SourceRange r = {}) : NodeBase(r), name(n) {}
};

// ============================================================================
// Type Declarations
// ============================================================================

/**
 * Base class for `name = ...` declarations.
 *
 * `attributes` holds the trailing shared fields of
 * `name = ... attributes (fields)`, appended to every constructor.
 */
class TypeDecl : public AstNode
{
public:
  std::string_view name;
  SourceRange name_range;
  gsl::span<FieldDecl *> attributes;

  static bool classof(const AstNode * node) { return is_type_decl_kind(node->get_kind()); }

protected:
  TypeDecl(NodeKind k, SourceRange r) : AstNode(k, r) {}
};

/// `name = Ctor1(...) | Ctor2 | ...`
class SumTypeDecl : public NodeBase<SumTypeDecl, TypeDecl, NodeKind::SumTypeDecl>
{
public:
  gsl::span<ConstructorDecl *> constructors;

  explicit SumTypeDecl(std::string_view n, SourceRange r = {}) : NodeBase(r) { name = n; }
};

/// `name = (fields)`
class ProductTypeDecl : public NodeBase<ProductTypeDecl, TypeDecl, NodeKind::ProductTypeDecl>
{
public:
  gsl::span<FieldDecl *> fields;

  explicit ProductTypeDecl(std::string_view n, SourceRange r = {}) : NodeBase(r) { name = n; }
};

// ============================================================================
// Top-level
// ============================================================================

/// `module name { typedecl* }`
class ModuleDecl : public NodeBase<ModuleDecl, AstNode, NodeKind::ModuleDecl>
{
public:
  std::string_view name;
  SourceRange name_range;
  gsl::span<TypeDecl *> types;

  explicit ModuleDecl(std::string_view n, SourceRange r = {}) : NodeBase(r), name(n) {}
};

/// Root of one parsed source: its modules in textual order.
class SchemaFile : public NodeBase<SchemaFile, AstNode, NodeKind::SchemaFile>
{
public:
  FileId file_id;
  gsl::span<ModuleDecl *> modules;

  explicit SchemaFile(FileId id, SourceRange r = {}) : NodeBase(r), file_id(id) {}
};

}  // namespace asdl
