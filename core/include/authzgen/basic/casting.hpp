// authzgen/basic/casting.hpp - LLVM-style RTTI casting utilities
//
// Works with any hierarchy whose classes provide a static `classof`.
//
//   if (isa<SingleRelation>(expr)) { ... }
//   auto * op = cast<BinaryOpExpr>(expr);           // asserts on mismatch
//   if (auto * id = dyn_cast<IdentifierExpr>(expr)) // nullptr on mismatch
//
#pragma once

#include <cassert>
#include <type_traits>

namespace authzgen
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

template <typename T, typename From>
inline constexpr bool has_classof_v = HasClassof<T, From>::value;

}  // namespace detail

template <typename T, typename From>
[[nodiscard]] inline bool isa(const From * node) noexcept
{
  static_assert(detail::has_classof_v<T, From>, "Target type must have a classof() static method");
  return node != nullptr && T::classof(node);
}

template <typename T, typename From>
[[nodiscard]] inline const T * cast(const From * node) noexcept
{
  assert(isa<T>(node) && "Invalid cast");
  return static_cast<const T *>(node);
}

template <typename T, typename From>
[[nodiscard]] inline T * cast(From * node) noexcept
{
  assert(isa<T>(static_cast<const From *>(node)) && "Invalid cast");
  return static_cast<T *>(node);
}

template <typename T, typename From>
[[nodiscard]] inline const T * dyn_cast(const From * node) noexcept
{
  return isa<T>(node) ? static_cast<const T *>(node) : nullptr;
}

template <typename T, typename From>
[[nodiscard]] inline T * dyn_cast(From * node) noexcept
{
  return isa<T>(static_cast<const From *>(node)) ? static_cast<T *>(node) : nullptr;
}

}  // namespace authzgen
