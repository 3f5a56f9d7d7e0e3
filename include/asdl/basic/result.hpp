// asdl/basic/result.hpp - Per-call results of the value runtime
//
// Construction, access, validation and printing never throw; they return a
// Result<T> (or Status) carrying either the value or a ValueError.
//
#pragma once

#include <string>
#include <utility>

#include "asdl/basic/error.hpp"

namespace asdl
{

/**
 * A runtime failure, with the field path it was detected at
 * (e.g. `FuncCall.args[1]`).
 */
struct ValueError
{
  ErrorCode code = ErrorCode::TypeMismatchError;
  std::string path;
  std::string message;

  /// `TypeMismatchError at FuncCall.args[1]: expected ...`
  [[nodiscard]] std::string to_string() const
  {
    std::string out(asdl::to_string(code));
    if (!path.empty()) {
      out += " at ";
      out += path;
    }
    out += ": ";
    out += message;
    return out;
  }
};

// ============================================================================
// Result<T>
// ============================================================================

template <typename T>
struct Result
{
  /// Result value (only valid if success == true)
  T value{};

  /// Whether the call succeeded
  bool success = false;

  /// Error (only valid if success == false)
  ValueError error;

  explicit operator bool() const noexcept { return success; }

  /// Create a successful result
  static Result ok(T v)
  {
    Result r;
    r.value = std::move(v);
    r.success = true;
    return r;
  }

  /// Create a failed result
  static Result fail(ValueError err)
  {
    Result r;
    r.error = std::move(err);
    r.success = false;
    return r;
  }

  static Result fail(ErrorCode code, std::string path, std::string message)
  {
    return fail(ValueError{code, std::move(path), std::move(message)});
  }
};

// ============================================================================
// Status
// ============================================================================

struct Status
{
  bool success = false;
  ValueError error;

  explicit operator bool() const noexcept { return success; }

  static Status ok()
  {
    Status s;
    s.success = true;
    return s;
  }

  static Status fail(ValueError err)
  {
    Status s;
    s.error = std::move(err);
    s.success = false;
    return s;
  }

  static Status fail(ErrorCode code, std::string path, std::string message)
  {
    return fail(ValueError{code, std::move(path), std::move(message)});
  }
};

}  // namespace asdl
