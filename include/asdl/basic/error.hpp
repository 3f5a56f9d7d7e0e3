// asdl/basic/error.hpp - Error taxonomy shared by loading and the value runtime
#pragma once

#include <cstdint>
#include <string_view>

namespace asdl
{

/**
 * Every failure the library reports belongs to exactly one of these kinds.
 *
 * The first four abort a schema load and surface as Diagnostics; the rest
 * are per-call results of the value runtime.
 */
enum class ErrorCode : uint8_t {
  LexError,
  ParseError,
  ResolutionError,
  CycleError,
  ArityError,
  TypeMismatchError,
  FieldAccessError,
  RecursionLimitError,
};

[[nodiscard]] constexpr std::string_view to_string(ErrorCode code) noexcept
{
  switch (code) {
    case ErrorCode::LexError:
      return "LexError";
    case ErrorCode::ParseError:
      return "ParseError";
    case ErrorCode::ResolutionError:
      return "ResolutionError";
    case ErrorCode::CycleError:
      return "CycleError";
    case ErrorCode::ArityError:
      return "ArityError";
    case ErrorCode::TypeMismatchError:
      return "TypeMismatchError";
    case ErrorCode::FieldAccessError:
      return "FieldAccessError";
    case ErrorCode::RecursionLimitError:
      return "RecursionLimitError";
  }
  return "";
}

/// Stable diagnostic code for load errors (e.g. "E0004" for CycleError).
[[nodiscard]] constexpr std::string_view diagnostic_code(ErrorCode code) noexcept
{
  switch (code) {
    case ErrorCode::LexError:
      return "E0001";
    case ErrorCode::ParseError:
      return "E0002";
    case ErrorCode::ResolutionError:
      return "E0003";
    case ErrorCode::CycleError:
      return "E0004";
    case ErrorCode::ArityError:
      return "E0101";
    case ErrorCode::TypeMismatchError:
      return "E0102";
    case ErrorCode::FieldAccessError:
      return "E0103";
    case ErrorCode::RecursionLimitError:
      return "E0104";
  }
  return "";
}

}  // namespace asdl
