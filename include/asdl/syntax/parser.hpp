// asdl/syntax/parser.hpp - Recursive-descent parser for schema text
#pragma once

#include <string_view>
#include <vector>

#include "asdl/ast/ast.hpp"
#include "asdl/ast/ast_context.hpp"
#include "asdl/basic/diagnostic.hpp"
#include "asdl/basic/source_manager.hpp"
#include "asdl/syntax/token.hpp"

namespace asdl::syntax
{

/**
 * Builds the unresolved declaration tree of one source.
 *
 * Grammar:
 * @code
 *   file      := module*
 *   module    := 'module' NAME '{' typedecl* '}'
 *   typedecl  := NAME '=' (product | sum) [ 'attributes' '(' fields ')' ]
 *   product   := '(' fields ')'
 *   sum       := ctor ('|' ctor)*
 *   ctor      := NAME [ '(' fields ')' ]
 *   fields    := [ field (',' field)* ]
 *   field     := typename ['*' | '?'] NAME
 *   typename  := NAME [ '.' NAME ]
 * @endcode
 *
 * Errors are reported as ParseError; the parser then resynchronises at the
 * next `NAME '='` or `}` and keeps going. Comment tokens are dropped.
 */
class Parser
{
public:
  Parser(
    AstContext & ast, FileId file_id, const SourceFile & source, DiagnosticBag & diags,
    std::vector<Token> tokens);

  [[nodiscard]] SchemaFile * parse_schema_file();

private:
  // Token helpers
  [[nodiscard]] const Token & cur(size_t lookahead = 0) const;
  [[nodiscard]] bool at(TokenKind k) const;
  [[nodiscard]] bool at_eof() const;

  const Token & advance();
  bool match(TokenKind k);
  bool expect(TokenKind k, std::string_view what);

  void error_at(const Token & t, std::string_view msg);
  void synchronize_to_decl();
  void synchronize_to_module();

  [[nodiscard]] static bool is_kw(std::string_view kw, const Token & t);
  [[nodiscard]] bool at_type_decl_start() const;
  [[nodiscard]] bool at_module_start() const;
  [[nodiscard]] const Token * expect_name(std::string_view what);

  [[nodiscard]] SourceRange range_from(const Token & first) const;

  // Declarations
  [[nodiscard]] ModuleDecl * parse_module();
  [[nodiscard]] TypeDecl * parse_type_decl();
  [[nodiscard]] SumTypeDecl * parse_sum(const Token & name_tok);
  [[nodiscard]] ProductTypeDecl * parse_product(const Token & name_tok);
  [[nodiscard]] ConstructorDecl * parse_constructor();
  [[nodiscard]] bool parse_fields(std::vector<FieldDecl *> & out);
  [[nodiscard]] FieldDecl * parse_field();

  // Duplicate checks
  void check_duplicate_fields(std::string_view owner, gsl::span<FieldDecl *> fields);
  void check_attribute_clashes(
    std::string_view owner, gsl::span<FieldDecl *> fields, gsl::span<FieldDecl *> attributes);

  AstContext & ast_;
  FileId file_id_;
  const SourceFile & source_;
  DiagnosticBag & diags_;
  std::vector<Token> tokens_;
  size_t idx_ = 0;
};

}  // namespace asdl::syntax
