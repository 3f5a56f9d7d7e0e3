// asdl/syntax/frontend.hpp - High-level parse pipeline entry point
#pragma once

#include <string>

#include "asdl/ast/ast.hpp"
#include "asdl/ast/ast_context.hpp"
#include "asdl/basic/diagnostic.hpp"
#include "asdl/basic/source_manager.hpp"

namespace asdl
{

struct ParseOutput
{
  FileId file_id = FileId::invalid();
  SchemaFile * file = nullptr;  ///< nullptr when lexing failed
};

// Parse pipeline:
// source -> lexer (token stream) -> recursive-descent parser (tree) -> diagnostics
//
// Invalid characters and unterminated block comments are reported as
// LexError; a source with lex errors is not parsed.
[[nodiscard]] ParseOutput parse_source(
  SourceRegistry & sources, std::string name, std::string source_text, AstContext & ast,
  DiagnosticBag & diags);

/// Same pipeline for a source that is already registered.
[[nodiscard]] ParseOutput parse_registered(
  const SourceRegistry & sources, FileId file_id, AstContext & ast, DiagnosticBag & diags);

}  // namespace asdl
