// asdl/driver/schema_loader.hpp - Schema loading driver
//
// Single entry point for the load pipeline:
// text -> tokens -> declaration trees -> resolved TypeModel.
//
#pragma once

#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "asdl/basic/diagnostic.hpp"
#include "asdl/basic/source_manager.hpp"
#include "asdl/sema/primitive_table.hpp"
#include "asdl/sema/type_model.hpp"

namespace asdl
{

// ============================================================================
// Load Options
// ============================================================================

struct LoadOptions
{
  /// Extra names for primitive kinds, e.g. {"id", PrimitiveKind::Integer}.
  std::vector<std::pair<std::string, PrimitiveKind>> primitive_aliases;
};

// ============================================================================
// Load Input / Result
// ============================================================================

/// One schema text and the name it is reported under.
struct SchemaSource
{
  std::string name;
  std::string text;
};

struct LoadResult
{
  /// Whether loading succeeded (no errors)
  bool success = false;

  /// Collected diagnostics; empty on success
  DiagnosticBag diagnostics;

  /// Registered schema texts, for rendering diagnostics
  SourceRegistry sources;

  /// The resolved model; only set on success
  std::shared_ptr<const TypeModel> model;
};

// ============================================================================
// SchemaLoader
// ============================================================================

/**
 * Loads schema texts into an immutable TypeModel.
 *
 * Loading is all-or-nothing: any LexError, ParseError, ResolutionError or
 * CycleError leaves LoadResult::model empty. Modules of later sources may
 * reference modules of earlier ones.
 */
class SchemaLoader
{
public:
  /// Default name for a source loaded from a bare string.
  static constexpr const char * k_default_source_name = "<schema>";

  [[nodiscard]] static LoadResult load(std::string text, const LoadOptions & options = {});

  [[nodiscard]] static LoadResult load(
    std::vector<SchemaSource> sources, const LoadOptions & options = {});
};

}  // namespace asdl
