// asdl/runtime/printer.hpp - Canonical text rendering of values
#pragma once

#include <cstddef>
#include <string>

#include "asdl/basic/result.hpp"
#include "asdl/runtime/value.hpp"

namespace asdl
{

struct PrintOptions
{
  /// Nesting depth of values beyond which printing fails with RecursionLimitError
  size_t max_depth = 64;

  /// One field per line, indented by `indent` spaces per level
  bool multiline = false;
  size_t indent = 2;
};

/**
 * Render a value deterministically.
 *
 * - sum-type values: `Ctor(f1=v1, f2=v2)`, or the bare `Ctor` without fields
 * - product-type values: `(v1, v2)`
 * - strings quoted with C-style escapes, booleans `true`/`false`, integers
 *   in decimal, lists `[e1, e2]`, absent optional fields `null`
 *
 * Fails with RecursionLimitError past `max_depth`, and with
 * TypeMismatchError for a value whose field count disagrees with its
 * constructor.
 */
[[nodiscard]] Result<std::string> print(const Value & value, const PrintOptions & options = {});

/// Render a single field value with the same rules.
[[nodiscard]] Result<std::string> print(
  const FieldValue & value, const PrintOptions & options = {});

/// Quote a string with C-style escapes (`\" \\ \n \t \r`, `\xNN`).
[[nodiscard]] std::string quote_string(const std::string & s);

}  // namespace asdl
