// asdl/basic/diagnostic_printer.hpp
//
// Prints load diagnostics with source context, line/column information,
// and position markers in Rust-style format.
//
#pragma once

#include <iosfwd>
#include <string>
#include <string_view>

#include "asdl/basic/diagnostic.hpp"
#include "asdl/basic/source_manager.hpp"

namespace asdl
{

/**
 * Prints diagnostics in Rust-style format.
 *
 * Produces output like:
 *   error[E0004]: type 'expr' cannot be constructed: expr -> expr
 *     --> arith.asdl:3:3
 *      |
 *    3 |   expr = (expr inner)
 *      |   ^^^^ embeds itself through single fields
 *      |
 *      = help: make one of the fields optional ('?') or repeated ('*')
 */
class DiagnosticPrinter
{
public:
  /**
   * @param os Output stream (typically std::cerr)
   * @param use_color Whether to use terminal colors
   */
  explicit DiagnosticPrinter(std::ostream & os, bool use_color = true);

  void print(const Diagnostic & diag, const SourceRegistry & sources);

  /// Print all diagnostics, ordered by file and start offset.
  void print_all(const DiagnosticBag & diags, const SourceRegistry & sources);

private:
  void print_header(const Diagnostic & diag);

  void print_label_context(const Label & label, const SourceRegistry & sources);

  void print_source_line(
    const SourceFile & source, uint32_t line_index, uint32_t start_col, uint32_t end_col,
    LabelStyle style, std::string_view label_message);

  void print_help(std::string_view message);
  void print_note(std::string_view message);

  [[nodiscard]] std::string gutter_arrow() const;
  [[nodiscard]] std::string gutter_pipe() const;
  [[nodiscard]] std::string gutter_pipe_only() const;

  std::ostream & os_;
  bool use_color_;
};

/// Render diagnostics without color into a string (tests, logs).
[[nodiscard]] std::string format_diagnostics(
  const DiagnosticBag & diags, const SourceRegistry & sources);

}  // namespace asdl
