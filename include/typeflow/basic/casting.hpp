// typeflow/basic/casting.hpp - Kind-based downcasts for IR values
//
// Every concrete Value class provides `static bool classof(const Value *)`,
// keyed on its ValueKind. The helpers below keep the constness of the
// argument:
//
//   const Instruction * instr = ...;
//   const Store * s = cast<Store>(instr);
//   if (const auto * call = dyn_cast<CallInstruction>(instr)) { ... }
//
#pragma once

#include <cassert>
#include <type_traits>

namespace typeflow
{

namespace detail
{

/// `To`, const-qualified when `From` is
template <typename To, typename From>
using same_const_t = std::conditional_t<std::is_const_v<From>, const To, To>;

}  // namespace detail

/// Non-null and of kind `To`
template <typename To, typename From>
[[nodiscard]] inline bool isa(From * v) noexcept
{
  return v != nullptr && To::classof(v);
}

/// Downcast of a value known to be of kind `To`
template <typename To, typename From>
[[nodiscard]] inline detail::same_const_t<To, From> * cast(From * v) noexcept
{
  assert(isa<To>(v) && "cast<To>() on a value of another kind");
  return static_cast<detail::same_const_t<To, From> *>(v);
}

/// Downcast, or nullptr when `v` is null or of another kind
template <typename To, typename From>
[[nodiscard]] inline detail::same_const_t<To, From> * dyn_cast(From * v) noexcept
{
  return isa<To>(v) ? static_cast<detail::same_const_t<To, From> *>(v) : nullptr;
}

}  // namespace typeflow
