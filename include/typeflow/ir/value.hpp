// typeflow/ir/value.hpp - Values of the program representation
//
// Values follow the LLVM/Clang style: a ValueKind tag plus classof() on every
// class, so isa<>/cast<>/dyn_cast<> from typeflow/basic/casting.hpp work on
// the whole hierarchy. Instructions are values too (see instruction.hpp).
//
#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <utility>

#include "typeflow/basic/casting.hpp"
#include "typeflow/ir/type.hpp"

namespace typeflow
{

class Function;

// ============================================================================
// ValueKind
// ============================================================================

/**
 * Kind tag of every value and instruction.
 *
 * Kinds are grouped so that category checks are range comparisons.
 */
enum class ValueKind : uint8_t {
  // === Non-instruction values ===
  Const,
  Global,
  Function,
  Parameter,
  FreeVar,
  Builtin,

  // === Value-producing instructions ===
  Alloc,
  BinOp,
  UnOp,
  Call,
  ChangeInterface,
  ChangeType,
  Convert,
  SliceToArrayPointer,
  MakeInterface,
  MakeClosure,
  MakeMap,
  MakeChan,
  MakeSlice,
  Slice,
  Field,
  FieldAddr,
  Index,
  IndexAddr,
  Lookup,
  Select,
  Range,
  Next,
  TypeAssert,
  Extract,
  Phi,

  // === Non-value instructions ===
  Store,
  MapUpdate,
  Send,
  Go,
  Defer,
  Panic,
  Return,
  RunDefers,
  Jump,
  If,
  DebugRef,
};

namespace detail
{
inline constexpr ValueKind k_first_instruction_kind = ValueKind::Alloc;
inline constexpr ValueKind k_first_non_value_instruction_kind = ValueKind::Store;
inline constexpr ValueKind k_last_instruction_kind = ValueKind::DebugRef;
}  // namespace detail

[[nodiscard]] constexpr bool is_instruction_kind(ValueKind kind) noexcept
{
  return kind >= detail::k_first_instruction_kind && kind <= detail::k_last_instruction_kind;
}

/// Instructions that define an SSA register
[[nodiscard]] constexpr bool is_value_instruction_kind(ValueKind kind) noexcept
{
  return kind >= detail::k_first_instruction_kind &&
         kind < detail::k_first_non_value_instruction_kind;
}

/// Lower-case mnemonic of a kind (e.g. "make_interface"), used in diagnostics
[[nodiscard]] std::string_view to_string(ValueKind kind) noexcept;

// ============================================================================
// Value
// ============================================================================

/**
 * Base class of everything that can appear as an operand.
 *
 * A value has a kind, a static type and a name. Instructions that do not
 * define a register have no type and an empty name. Values are owned by
 * their Program or Function and are never copied.
 */
class Value
{
public:
  const ValueKind kind;

  Value(const Value &) = delete;
  Value & operator=(const Value &) = delete;
  Value(Value &&) = delete;
  Value & operator=(Value &&) = delete;

  virtual ~Value() = default;

  [[nodiscard]] ValueKind get_kind() const noexcept { return kind; }

  /// Static type; nullptr for instructions that define no register
  [[nodiscard]] const Type * get_type() const noexcept { return type_; }

  /// Register or declared name ("t3", "x", "gl", "f$1")
  [[nodiscard]] const std::string & get_name() const noexcept { return name_; }

  void set_name(std::string name) { name_ = std::move(name); }

protected:
  Value(ValueKind k, const Type * t, std::string name = {})
  : kind(k), type_(t), name_(std::move(name))
  {
  }

  void set_type(const Type * t) noexcept { type_ = t; }

private:
  const Type * type_;
  std::string name_;
};

// ============================================================================
// CRTP Base for Automatic classof()
// ============================================================================

/**
 * CRTP base class that implements classof() for a single kind.
 *
 * @tparam Derived The concrete value class
 * @tparam Base The base class to inherit from
 * @tparam K The ValueKind for this class
 */
template <typename Derived, typename Base, ValueKind K>
class ValueBase : public Base
{
public:
  static constexpr ValueKind value_kind = K;

  static bool classof(const Value * v) { return v->get_kind() == K; }

protected:
  template <typename... Args>
  explicit ValueBase(Args &&... args) : Base(K, std::forward<Args>(args)...)
  {
  }
};

// ============================================================================
// Non-instruction Values
// ============================================================================

/// Compile-time constant, including typed nil.
class Const : public ValueBase<Const, Value, ValueKind::Const>
{
public:
  Const(const Type * t, std::string literal)
  : ValueBase(t, literal), literal_(std::move(literal))
  {
  }

  /// Source rendering of the constant ("1", "\"s\"", "nil")
  [[nodiscard]] const std::string & get_literal() const noexcept { return literal_; }

private:
  std::string literal_;
};

/**
 * Package-level variable.
 *
 * Like every addressable location, a global's value is its address: the
 * type of the value is a pointer to the declared type.
 */
class Global : public ValueBase<Global, Value, ValueKind::Global>
{
public:
  Global(const Type * pointer_type, std::string name) : ValueBase(pointer_type, std::move(name)) {}

  [[nodiscard]] const Type * get_declared_type() const noexcept { return get_type()->elem; }
};

/// Formal parameter of a function (the receiver is parameter 0 of a method).
class Parameter : public ValueBase<Parameter, Value, ValueKind::Parameter>
{
public:
  Parameter(const Type * t, std::string name, Function * parent)
  : ValueBase(t, std::move(name)), parent_(parent)
  {
  }

  [[nodiscard]] Function * get_parent() const noexcept { return parent_; }

private:
  Function * parent_;
};

/// Variable captured by an anonymous function, bound by MakeClosure.
class FreeVar : public ValueBase<FreeVar, Value, ValueKind::FreeVar>
{
public:
  FreeVar(const Type * t, std::string name, Function * parent)
  : ValueBase(t, std::move(name)), parent_(parent)
  {
  }

  [[nodiscard]] Function * get_parent() const noexcept { return parent_; }

private:
  Function * parent_;
};

/// Built-in function (append, recover, len, ...). Only valid as a callee.
class Builtin : public ValueBase<Builtin, Value, ValueKind::Builtin>
{
public:
  explicit Builtin(std::string name) : ValueBase(nullptr, std::move(name)) {}
};

/**
 * Render a value as an operand: register and declared names as-is,
 * constants as `literal:type`.
 */
[[nodiscard]] std::string operand_to_string(const Value * v);

}  // namespace typeflow
