// asdl/sema/embedding_cycle_checker.hpp - Types without a finite inhabitant
//
// A type embeds another through each single-multiplicity field. Optional and
// repeated fields can always be left empty, so they never trap a value.
//
#pragma once

#include <cstddef>
#include <string_view>

#include "asdl/basic/diagnostic.hpp"
#include "asdl/sema/type_model.hpp"

namespace asdl
{

/**
 * Reject types that no finite value can inhabit.
 *
 * A primitive is inhabited. A sum type is inhabited when one of its
 * constructors has only single fields of inhabited types; a product when
 * all of its single fields are. The inhabited set is computed as a
 * fixpoint; each remaining type lies on (or leads to) a cycle of single
 * fields, which is reported as CycleError with its path `a -> b -> a`.
 *
 * `expr = Num(int n) | Add(expr l, expr r)` is accepted, `t = (t inner)` is not.
 */
class EmbeddingCycleChecker
{
public:
  explicit EmbeddingCycleChecker(DiagnosticBag * diags = nullptr) : diags_(diags) {}

  bool check(const TypeModel & model);

  [[nodiscard]] bool has_errors() const noexcept { return hasErrors_; }
  [[nodiscard]] size_t error_count() const noexcept { return errorCount_; }

  // Internal (exposed for helper routines in the implementation unit).
  void report_error(SourceRange range, std::string_view message);

private:
  DiagnosticBag * diags_ = nullptr;
  bool hasErrors_ = false;
  size_t errorCount_ = 0;
};

}  // namespace asdl
