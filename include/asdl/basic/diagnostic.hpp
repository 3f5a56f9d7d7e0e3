// asdl/basic/diagnostic.hpp - Diagnostic types for schema loading
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "asdl/basic/error.hpp"
#include "asdl/basic/source_manager.hpp"

namespace asdl
{

// ============================================================================
// Core Structures
// ============================================================================

enum class LabelStyle : uint8_t {
  Primary,    // where the problem is
  Secondary,  // related location (earlier definition, cycle member)
};

struct Label
{
  SourceRange range;
  std::string message;
  LabelStyle style = LabelStyle::Primary;
};

/// A load error. Every diagnostic aborts the load it belongs to.
struct Diagnostic
{
  ErrorCode kind = ErrorCode::ParseError;
  std::string code;  // e.g., "E0004"
  std::string message;

  std::vector<Label> labels;
  std::optional<std::string> help_message;

  [[nodiscard]] const Label * primary_label() const noexcept;
  [[nodiscard]] SourceRange primary_range() const noexcept;
};

class DiagnosticBag;

// ============================================================================
// DiagnosticBuilder
// ============================================================================

/**
 * Fluent builder for a single diagnostic. The diagnostic is added to its bag
 * when the builder goes out of scope (RAII).
 */
class DiagnosticBuilder
{
public:
  DiagnosticBuilder(DiagnosticBag & bag, Diagnostic diag);

  DiagnosticBuilder(const DiagnosticBuilder &) = delete;
  DiagnosticBuilder & operator=(const DiagnosticBuilder &) = delete;

  DiagnosticBuilder(DiagnosticBuilder && other) noexcept;

  ~DiagnosticBuilder();

  DiagnosticBuilder & with_label(
    SourceRange range, std::string msg, LabelStyle style = LabelStyle::Primary);

  DiagnosticBuilder & with_secondary_label(SourceRange range, std::string msg);

  DiagnosticBuilder & with_help(std::string help_msg);

private:
  DiagnosticBag & bag_;
  Diagnostic diagnostic_;
  bool active_ = true;
};

// ============================================================================
// DiagnosticBag
// ============================================================================

class DiagnosticBag
{
public:
  DiagnosticBag() = default;

  /// Report an error of a known kind; code and kind are filled in.
  DiagnosticBuilder report(
    ErrorCode kind, SourceRange range, std::string message, std::string label_message = "");

  void add(Diagnostic && diag);
  void add(const Diagnostic & diag);

  [[nodiscard]] const std::vector<Diagnostic> & all() const { return diagnostics_; }
  [[nodiscard]] bool empty() const { return diagnostics_.empty(); }
  [[nodiscard]] size_t size() const { return diagnostics_.size(); }

  [[nodiscard]] bool has_errors() const { return !diagnostics_.empty(); }
  [[nodiscard]] bool has_error(ErrorCode kind) const;
  [[nodiscard]] size_t count(ErrorCode kind) const;

  void merge(DiagnosticBag && other);

  [[nodiscard]] auto begin() const { return diagnostics_.begin(); }
  [[nodiscard]] auto end() const { return diagnostics_.end(); }

private:
  std::vector<Diagnostic> diagnostics_;
};

}  // namespace asdl
