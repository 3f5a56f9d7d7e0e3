// asdl/basic/casting.hpp - classof-based RTTI for the declaration tree
//
//   if (isa<SumTypeDecl>(decl)) { ... }
//   const auto * sum = cast<SumTypeDecl>(decl);         // asserts on failure
//   if (const auto * p = dyn_cast<ProductTypeDecl>(decl)) { ... }
//
#pragma once

#include <cassert>
#include <type_traits>

namespace asdl
{

namespace detail
{

template <typename T, typename From, typename = void>
struct HasClassof : std::false_type
{
};

template <typename T, typename From>
struct HasClassof<T, From, std::void_t<decltype(T::classof(std::declval<const From *>()))>>
: std::true_type
{
};

}  // namespace detail

/// True if node is non-null and of type T.
template <typename T, typename From>
[[nodiscard]] inline bool isa(const From * node) noexcept
{
  static_assert(
    detail::HasClassof<T, From>::value, "Target type must have a classof() static method");
  return node != nullptr && T::classof(node);
}

/// Unchecked downcast; node must be non-null and of type T.
template <typename T, typename From>
[[nodiscard]] inline T * cast(From * node) noexcept
{
  assert(isa<T>(node) && "Invalid cast");
  return static_cast<T *>(node);
}

template <typename T, typename From>
[[nodiscard]] inline const T * cast(const From * node) noexcept
{
  assert(isa<T>(node) && "Invalid cast");
  return static_cast<const T *>(node);
}

/// Downcast returning nullptr when node is null or not a T.
template <typename T, typename From>
[[nodiscard]] inline T * dyn_cast(From * node) noexcept
{
  return isa<T>(node) ? static_cast<T *>(node) : nullptr;
}

template <typename T, typename From>
[[nodiscard]] inline const T * dyn_cast(const From * node) noexcept
{
  return isa<T>(node) ? static_cast<const T *>(node) : nullptr;
}

}  // namespace asdl
