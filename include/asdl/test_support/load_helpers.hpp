// asdl/test_support/load_helpers.hpp - helpers for unit/integration tests
//
// Lightweight wrappers around the parse and load pipelines that keep the
// owning objects (SourceRegistry, AstContext) alive next to the results.
//
#pragma once

#include <memory>
#include <string>
#include <utility>

#include "asdl/ast/ast_context.hpp"
#include "asdl/basic/diagnostic.hpp"
#include "asdl/basic/diagnostic_printer.hpp"
#include "asdl/basic/source_manager.hpp"
#include "asdl/driver/schema_loader.hpp"
#include "asdl/syntax/frontend.hpp"

namespace asdl::test_support
{

struct TestParseUnit
{
  SourceRegistry sources;
  FileId file_id = FileId::invalid();
  std::unique_ptr<AstContext> ast;
  DiagnosticBag diags;
  SchemaFile * file = nullptr;

  [[nodiscard]] std::string_view slice(SourceRange r) const noexcept
  {
    return sources.get_slice(r);
  }

  [[nodiscard]] FullSourceRange full_range(SourceRange r) const noexcept
  {
    return sources.get_full_range(r);
  }

  [[nodiscard]] std::string rendered() const { return format_diagnostics(diags, sources); }
};

[[nodiscard]] inline TestParseUnit parse(std::string src, std::string name = "<test>.asdl")
{
  TestParseUnit out;
  out.ast = std::make_unique<AstContext>();

  const ParseOutput parsed =
    parse_source(out.sources, std::move(name), std::move(src), *out.ast, out.diags);
  out.file_id = parsed.file_id;
  out.file = parsed.file;
  return out;
}

/// Load a single schema text; the result keeps its sources for rendering.
[[nodiscard]] inline LoadResult load(std::string src, const LoadOptions & options = {})
{
  return SchemaLoader::load(std::move(src), options);
}

/// Diagnostics of a load, rendered without color (for failure messages).
[[nodiscard]] inline std::string rendered(const LoadResult & result)
{
  return format_diagnostics(result.diagnostics, result.sources);
}

/// First diagnostic message, or "" when there is none.
[[nodiscard]] inline std::string first_message(const DiagnosticBag & diags)
{
  return diags.empty() ? std::string() : diags.all().front().message;
}

}  // namespace asdl::test_support
