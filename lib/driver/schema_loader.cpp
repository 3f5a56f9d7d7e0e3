// asdl/driver/schema_loader.cpp - Schema loading driver
//
#include "asdl/driver/schema_loader.hpp"

#include <spdlog/spdlog.h>

#include "asdl/ast/ast_context.hpp"
#include "asdl/sema/type_resolver.hpp"
#include "asdl/syntax/frontend.hpp"

namespace asdl
{

LoadResult SchemaLoader::load(std::string text, const LoadOptions & options)
{
  std::vector<SchemaSource> sources;
  sources.push_back({k_default_source_name, std::move(text)});
  return load(std::move(sources), options);
}

LoadResult SchemaLoader::load(std::vector<SchemaSource> sources, const LoadOptions & options)
{
  LoadResult result;

  PrimitiveTable primitives;
  primitives.register_builtins();
  for (const auto & [alias, kind] : options.primitive_aliases) {
    if (!primitives.define_alias(alias, kind)) {
      result.diagnostics.report(
        ErrorCode::ResolutionError, SourceRange{},
        "primitive alias `" + alias + "` is already defined");
    }
  }

  // Declaration trees live as long as this call; the model owns its strings.
  std::vector<std::unique_ptr<AstContext>> contexts;
  std::vector<const SchemaFile *> files;
  contexts.reserve(sources.size());
  files.reserve(sources.size());

  for (auto & src : sources) {
    auto ast = std::make_unique<AstContext>();
    std::string name = std::move(src.name);
    const ParseOutput parsed =
      parse_source(result.sources, name, std::move(src.text), *ast, result.diagnostics);
    spdlog::debug(
      "parsed `{}` (file {}): {} module(s)", name, parsed.file_id.value(),
      parsed.file != nullptr ? static_cast<size_t>(parsed.file->modules.size()) : size_t{0});
    files.push_back(parsed.file);
    contexts.push_back(std::move(ast));
  }

  if (result.diagnostics.has_errors()) {
    spdlog::debug("schema load failed: {} diagnostic(s)", result.diagnostics.size());
    return result;
  }

  TypeResolver resolver(result.diagnostics, std::move(primitives));
  std::shared_ptr<TypeModel> model = resolver.resolve(files);
  if (!model) {
    spdlog::debug("schema load failed: {} diagnostic(s)", result.diagnostics.size());
    return result;
  }

  result.model = std::move(model);
  result.success = true;
  return result;
}

}  // namespace asdl
