// typeflow/ir/type_utils.hpp - Type queries shared by call-graph builders
//
// Method-set lookup, interface satisfaction and the structural queries the
// flow-graph builder needs (element types, pointer nesting).
//
#pragma once

#include <string_view>

#include "typeflow/ir/type.hpp"

namespace typeflow
{

class Function;

/// Underlying type, or nullptr for nullptr
[[nodiscard]] const Type * underlying_of(const Type * t) noexcept;

/// Core type: the underlying type, or the core type of a type parameter
[[nodiscard]] const Type * core_type(const Type * t) noexcept;

/// True for interface types and type parameters
[[nodiscard]] bool is_interface(const Type * t) noexcept;

/// True for types whose underlying type is a function signature
[[nodiscard]] bool is_function(const Type * t) noexcept;

/**
 * If `t` is a (possibly nested) pointer to an interface, return the interface.
 *
 * `**I` and `*I` both yield `I`. Returns nullptr otherwise.
 */
[[nodiscard]] const Type * interface_under_ptr(const Type * t) noexcept;

/// As interface_under_ptr, for function signatures
[[nodiscard]] const Type * function_under_ptr(const Type * t) noexcept;

/**
 * Element type of an indexable operand, as used by Index/IndexAddr.
 *
 * Accepts slices, arrays, pointers to arrays and strings (yielding byte).
 * Returns nullptr for any other shape.
 */
[[nodiscard]] const Type * slice_array_elem(const Type * t, const TypeContext & types) noexcept;

/// Element type of a channel-typed operand, or nullptr
[[nodiscard]] const Type * chan_elem(const Type * t) noexcept;

/// The map type behind `t`, or nullptr when `t` is not a map
[[nodiscard]] const Type * map_of(const Type * t) noexcept;

/// Field `index` of the struct underlying `aggregate`, or nullptr
[[nodiscard]] const StructField * struct_field(const Type * aggregate, size_t index) noexcept;

/// Named types and interfaces, signatures and structs may carry methods
[[nodiscard]] bool can_have_methods(const Type * t) noexcept;

/**
 * Find the concrete method `name` in the method set of `t`.
 *
 * For a named type T the set holds the value-receiver methods; for *T it
 * holds both value- and pointer-receiver methods. Returns nullptr when the
 * method is absent or `t` has no concrete methods.
 */
[[nodiscard]] const Function * lookup_method(const Type * t, std::string_view name) noexcept;

/**
 * Check whether `t` satisfies the interface `iface`.
 *
 * `iface` may be an interface type, a named interface or a type parameter
 * (checked against its constraint). Interfaces are checked by method-set
 * inclusion; concrete types through lookup_method and signature identity.
 */
[[nodiscard]] bool implements(const Type * t, const Type * iface) noexcept;

/// implements() for `*named`, without requiring the pointer type to exist
[[nodiscard]] bool pointer_implements(const Type * named, const Type * iface) noexcept;

}  // namespace typeflow
