// typeflow/ir/type_utils.cpp - Type query implementation
//
#include "typeflow/ir/type_utils.hpp"

#include <algorithm>
#include <vector>

#include "typeflow/ir/function.hpp"

namespace typeflow
{

namespace
{

/// Walk pointer chains starting at `t` until `pred` matches an element.
/// Cycles through recursive named pointer types terminate.
template <typename Pred>
const Type * find_under_ptr(const Type * t, Pred pred) noexcept
{
  std::vector<const Type *> seen;
  while (t != nullptr) {
    if (std::find(seen.begin(), seen.end(), t) != seen.end()) {
      return nullptr;
    }
    seen.push_back(t);

    const Type * u = t->underlying();
    if (u->kind != TypeKind::Pointer) {
      return nullptr;
    }
    if (pred(u->elem)) {
      return u->elem;
    }
    t = u->elem;
  }
  return nullptr;
}

const Type * interface_of(const Type * t) noexcept
{
  if (t == nullptr) return nullptr;
  if (t->kind == TypeKind::TypeParam) {
    return t->constraint != nullptr ? interface_of(t->constraint) : nullptr;
  }
  const Type * u = t->underlying();
  return u->kind == TypeKind::Interface ? u : nullptr;
}

}  // namespace

const Type * underlying_of(const Type * t) noexcept
{
  return t != nullptr ? t->underlying() : nullptr;
}

const Type * core_type(const Type * t) noexcept
{
  if (t == nullptr) return nullptr;
  if (t->kind == TypeKind::TypeParam) {
    return t->core != nullptr ? t->core->underlying() : nullptr;
  }
  return t->underlying();
}

bool is_interface(const Type * t) noexcept { return t != nullptr && t->is_interface(); }

bool is_function(const Type * t) noexcept { return t != nullptr && t->is_signature(); }

const Type * interface_under_ptr(const Type * t) noexcept
{
  return find_under_ptr(t, [](const Type * e) { return is_interface(e); });
}

const Type * function_under_ptr(const Type * t) noexcept
{
  return find_under_ptr(t, [](const Type * e) { return is_function(e); });
}

const Type * slice_array_elem(const Type * t, const TypeContext & types) noexcept
{
  const Type * u = core_type(t);
  if (u == nullptr) return nullptr;

  switch (u->kind) {
    case TypeKind::Pointer: {
      const Type * e = core_type(u->elem);
      return (e != nullptr && e->kind == TypeKind::Array) ? e->elem : nullptr;
    }
    case TypeKind::Array:
    case TypeKind::Slice:
      return u->elem;
    case TypeKind::Basic:
      return u->basic == BasicKind::String ? types.byte_type() : nullptr;
    default:
      return nullptr;
  }
}

const Type * chan_elem(const Type * t) noexcept
{
  const Type * u = core_type(t);
  return (u != nullptr && u->kind == TypeKind::Chan) ? u->elem : nullptr;
}

const Type * map_of(const Type * t) noexcept
{
  const Type * u = core_type(t);
  return (u != nullptr && u->kind == TypeKind::Map) ? u : nullptr;
}

const StructField * struct_field(const Type * aggregate, size_t index) noexcept
{
  const Type * u = core_type(aggregate);
  if (u == nullptr || u->kind != TypeKind::Struct || index >= u->fields.size()) {
    return nullptr;
  }
  return &u->fields[index];
}

bool can_have_methods(const Type * t) noexcept
{
  if (t == nullptr) return false;
  if (t->is_named()) return true;
  switch (t->underlying()->kind) {
    case TypeKind::Interface:
    case TypeKind::Signature:
    case TypeKind::Struct:
      return true;
    default:
      return false;
  }
}

namespace
{

/// Method `name` of the named type `named`, as seen from T or from *T
const Function * method_of(const Type * named, std::string_view name, bool via_pointer) noexcept
{
  if (named == nullptr || !named->is_named() || named->is_interface()) {
    return nullptr;
  }
  for (const auto & m : named->declared_methods) {
    if (m.name != name) continue;
    if (m.pointer_receiver && !via_pointer) {
      // *T methods are not in the method set of T
      return nullptr;
    }
    return m.function;
  }
  return nullptr;
}

bool method_set_implements(const Type * named, bool via_pointer, const Type * i) noexcept
{
  return std::all_of(i->methods.begin(), i->methods.end(), [&](const InterfaceMethod & m) {
    const Function * fn = method_of(named, m.name, via_pointer);
    return fn != nullptr && fn->get_signature() == m.signature;
  });
}

}  // namespace

const Function * lookup_method(const Type * t, std::string_view name) noexcept
{
  if (t == nullptr) return nullptr;
  if (t->kind == TypeKind::Pointer) {
    return method_of(t->elem, name, true);
  }
  return method_of(t, name, false);
}

bool implements(const Type * t, const Type * iface) noexcept
{
  const Type * i = interface_of(iface);
  if (t == nullptr || i == nullptr) {
    return false;
  }

  if (const Type * ti = interface_of(t)) {
    // Interface-to-interface: method set inclusion
    return std::all_of(i->methods.begin(), i->methods.end(), [&](const InterfaceMethod & m) {
      return std::find(ti->methods.begin(), ti->methods.end(), m) != ti->methods.end();
    });
  }

  if (t->kind == TypeKind::Pointer) {
    return method_set_implements(t->elem, true, i);
  }
  return method_set_implements(t, false, i);
}

bool pointer_implements(const Type * named, const Type * iface) noexcept
{
  const Type * i = interface_of(iface);
  if (named == nullptr || i == nullptr || interface_of(named) != nullptr) {
    return false;
  }
  return method_set_implements(named, true, i);
}

}  // namespace typeflow
