// typeflow/ir/instruction.hpp - Instructions of the program representation
//
// One class per instruction kind, each with classof() through ValueBase.
// Value-producing instructions define a register named by FunctionBuilder
// ("t0", "t1", ...); the rest have no type and no name.
//
#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "typeflow/basic/source_pos.hpp"
#include "typeflow/ir/value.hpp"

namespace typeflow
{

class BasicBlock;

// ============================================================================
// Instruction Base
// ============================================================================

/**
 * Base class for all instructions.
 *
 * An instruction belongs to exactly one basic block and carries the source
 * position it was lowered from.
 */
class Instruction : public Value
{
public:
  static bool classof(const Value * v) { return is_instruction_kind(v->get_kind()); }

  [[nodiscard]] BasicBlock * get_block() const noexcept { return block_; }

  /// Enclosing function (via the owning block)
  [[nodiscard]] Function * get_parent() const noexcept;

  [[nodiscard]] SourcePos get_pos() const noexcept { return pos_; }
  void set_pos(SourcePos pos) noexcept { pos_ = pos; }

  /// Operands in source order; null optional operands are skipped
  [[nodiscard]] std::vector<Value *> operands() const;

  /// Textual form, e.g. `t2 = make_interface t1` or `store t0 t1`
  [[nodiscard]] std::string to_string() const;

protected:
  explicit Instruction(ValueKind k, const Type * t = nullptr) : Value(k, t) {}

private:
  friend class BasicBlock;

  BasicBlock * block_ = nullptr;
  SourcePos pos_;
};

// ============================================================================
// Call Operands
// ============================================================================

/**
 * Operands shared by Call, Go and Defer.
 *
 * In "call" mode `value` is the callee: a Function, a Builtin, a MakeClosure
 * or any function-typed value. In "invoke" mode `method` is set and `value`
 * is the interface-typed receiver.
 */
struct CallCommon
{
  Value * value = nullptr;
  std::string method;
  std::vector<Value *> args;

  /// Signature of the call, without receiver
  const Type * signature = nullptr;

  [[nodiscard]] bool is_invoke() const noexcept { return !method.empty(); }

  /// The Function called directly or through an immediate MakeClosure
  [[nodiscard]] Function * static_callee() const noexcept;

  /// The builtin called, if any
  [[nodiscard]] const Builtin * builtin() const noexcept;
};

/// Common base of Call, Go and Defer.
class CallInstruction : public Instruction
{
public:
  CallCommon common;

  static bool classof(const Value * v)
  {
    const ValueKind k = v->get_kind();
    return k == ValueKind::Call || k == ValueKind::Go || k == ValueKind::Defer;
  }

  [[nodiscard]] const CallCommon & get_common() const noexcept { return common; }

protected:
  CallInstruction(ValueKind k, const Type * t, CallCommon c)
  : Instruction(k, t), common(std::move(c))
  {
  }
};

// ============================================================================
// Value-producing Instructions
// ============================================================================

/// Allocation of a local or heap variable; the value is its address.
class Alloc : public ValueBase<Alloc, Instruction, ValueKind::Alloc>
{
public:
  bool heap;

  Alloc(const Type * pointer_type, bool is_heap) : ValueBase(pointer_type), heap(is_heap) {}
};

class BinOp : public ValueBase<BinOp, Instruction, ValueKind::BinOp>
{
public:
  std::string op;
  Value * x;
  Value * y;

  BinOp(const Type * t, std::string o, Value * lhs, Value * rhs)
  : ValueBase(t), op(std::move(o)), x(lhs), y(rhs)
  {
  }
};

enum class UnOpKind : uint8_t {
  Deref,  ///< *x
  Recv,   ///< <-x
  Neg,    ///< -x
  Not,    ///< !x
  Xor,    ///< ^x
};

class UnOp : public ValueBase<UnOp, Instruction, ValueKind::UnOp>
{
public:
  UnOpKind op;
  Value * x;
  /// For Recv: result is (value, ok)
  bool comma_ok;

  UnOp(const Type * t, UnOpKind o, Value * operand, bool ok = false)
  : ValueBase(t), op(o), x(operand), comma_ok(ok)
  {
  }
};

class Call : public ValueBase<Call, CallInstruction, ValueKind::Call>
{
public:
  Call(const Type * t, CallCommon c) : ValueBase(t, std::move(c)) {}
};

/// Conversion between interface types.
class ChangeInterface : public ValueBase<ChangeInterface, Instruction, ValueKind::ChangeInterface>
{
public:
  Value * x;

  ChangeInterface(const Type * t, Value * operand) : ValueBase(t), x(operand) {}
};

/// Conversion between types with identical underlying types.
class ChangeType : public ValueBase<ChangeType, Instruction, ValueKind::ChangeType>
{
public:
  Value * x;

  ChangeType(const Type * t, Value * operand) : ValueBase(t), x(operand) {}
};

/// Value-changing conversion (numeric, string, unsafe.Pointer).
class Convert : public ValueBase<Convert, Instruction, ValueKind::Convert>
{
public:
  Value * x;

  Convert(const Type * t, Value * operand) : ValueBase(t), x(operand) {}
};

class SliceToArrayPointer
: public ValueBase<SliceToArrayPointer, Instruction, ValueKind::SliceToArrayPointer>
{
public:
  Value * x;

  SliceToArrayPointer(const Type * t, Value * operand) : ValueBase(t), x(operand) {}
};

/// Boxing of a concrete value into an interface.
class MakeInterface : public ValueBase<MakeInterface, Instruction, ValueKind::MakeInterface>
{
public:
  Value * x;

  MakeInterface(const Type * t, Value * operand) : ValueBase(t), x(operand) {}
};

/// Closure creation: `fn` with its free variables bound to `bindings`.
class MakeClosure : public ValueBase<MakeClosure, Instruction, ValueKind::MakeClosure>
{
public:
  Function * fn;
  std::vector<Value *> bindings;

  MakeClosure(const Type * t, Function * f, std::vector<Value *> b)
  : ValueBase(t), fn(f), bindings(std::move(b))
  {
  }
};

class MakeMap : public ValueBase<MakeMap, Instruction, ValueKind::MakeMap>
{
public:
  Value * reserve;

  MakeMap(const Type * t, Value * r) : ValueBase(t), reserve(r) {}
};

class MakeChan : public ValueBase<MakeChan, Instruction, ValueKind::MakeChan>
{
public:
  Value * size;

  MakeChan(const Type * t, Value * s) : ValueBase(t), size(s) {}
};

class MakeSlice : public ValueBase<MakeSlice, Instruction, ValueKind::MakeSlice>
{
public:
  Value * len;
  Value * cap;

  MakeSlice(const Type * t, Value * l, Value * c) : ValueBase(t), len(l), cap(c) {}
};

/// Slicing operation `x[low:high:max]`; bounds may be null.
class Slice : public ValueBase<Slice, Instruction, ValueKind::Slice>
{
public:
  Value * x;
  Value * low;
  Value * high;
  Value * max;

  Slice(const Type * t, Value * operand, Value * lo, Value * hi, Value * mx)
  : ValueBase(t), x(operand), low(lo), high(hi), max(mx)
  {
  }
};

/// Read of field `index` of struct value `x`.
class Field : public ValueBase<Field, Instruction, ValueKind::Field>
{
public:
  Value * x;
  size_t index;

  Field(const Type * t, Value * operand, size_t i) : ValueBase(t), x(operand), index(i) {}
};

/// Address of field `index` of the struct pointed to by `x`.
class FieldAddr : public ValueBase<FieldAddr, Instruction, ValueKind::FieldAddr>
{
public:
  Value * x;
  size_t index;

  FieldAddr(const Type * t, Value * operand, size_t i) : ValueBase(t), x(operand), index(i) {}
};

/// Element read `x[index]` of an array, slice or string.
class Index : public ValueBase<Index, Instruction, ValueKind::Index>
{
public:
  Value * x;
  Value * index;

  Index(const Type * t, Value * operand, Value * i) : ValueBase(t), x(operand), index(i) {}
};

/// Element address `&x[index]` of a slice or pointer to array.
class IndexAddr : public ValueBase<IndexAddr, Instruction, ValueKind::IndexAddr>
{
public:
  Value * x;
  Value * index;

  IndexAddr(const Type * t, Value * operand, Value * i) : ValueBase(t), x(operand), index(i) {}
};

/// Map (or string) lookup `x[index]`, optionally with comma-ok.
class Lookup : public ValueBase<Lookup, Instruction, ValueKind::Lookup>
{
public:
  Value * x;
  Value * index;
  bool comma_ok;

  Lookup(const Type * t, Value * operand, Value * i, bool ok)
  : ValueBase(t), x(operand), index(i), comma_ok(ok)
  {
  }
};

/// One case of a select statement.
struct SelectState
{
  ChanDir dir = ChanDir::RecvOnly;  ///< SendOnly or RecvOnly
  Value * chan = nullptr;
  Value * send = nullptr;  ///< Sent value (SendOnly only)
};

/**
 * Select statement.
 *
 * The result is a tuple `(index int, recv_ok bool, r_0, ..., r_n)` with one
 * component per receive state, in order.
 */
class Select : public ValueBase<Select, Instruction, ValueKind::Select>
{
public:
  std::vector<SelectState> states;
  bool blocking;

  Select(const Type * t, std::vector<SelectState> s, bool b)
  : ValueBase(t), states(std::move(s)), blocking(b)
  {
  }
};

/// Start of a range loop over a map or string. The iterator has no type.
class Range : public ValueBase<Range, Instruction, ValueKind::Range>
{
public:
  Value * x;

  explicit Range(Value * operand) : ValueBase(nullptr), x(operand) {}
};

/// Next step of a range iterator: `(ok, key, value)`.
class Next : public ValueBase<Next, Instruction, ValueKind::Next>
{
public:
  Value * iter;
  bool is_string;

  Next(const Type * t, Value * it, bool str) : ValueBase(t), iter(it), is_string(str) {}
};

/// `x.(T)`, optionally with comma-ok (result is then `(T, bool)`).
class TypeAssert : public ValueBase<TypeAssert, Instruction, ValueKind::TypeAssert>
{
public:
  Value * x;
  const Type * asserted_type;
  bool comma_ok;

  TypeAssert(const Type * t, Value * operand, const Type * asserted, bool ok)
  : ValueBase(t), x(operand), asserted_type(asserted), comma_ok(ok)
  {
  }
};

/// Projection of component `index` of a tuple-typed value.
class Extract : public ValueBase<Extract, Instruction, ValueKind::Extract>
{
public:
  Value * tuple;
  size_t index;

  Extract(const Type * t, Value * tup, size_t i) : ValueBase(t), tuple(tup), index(i) {}
};

/// SSA phi; `edges[i]` flows in from the i-th predecessor block.
class Phi : public ValueBase<Phi, Instruction, ValueKind::Phi>
{
public:
  std::vector<Value *> edges;

  Phi(const Type * t, std::vector<Value *> e) : ValueBase(t), edges(std::move(e)) {}
};

// ============================================================================
// Non-value Instructions
// ============================================================================

/// `*addr = val`
class Store : public ValueBase<Store, Instruction, ValueKind::Store>
{
public:
  Value * addr;
  Value * val;

  Store(Value * a, Value * v) : ValueBase(nullptr), addr(a), val(v) {}
};

/// `map[key] = value`
class MapUpdate : public ValueBase<MapUpdate, Instruction, ValueKind::MapUpdate>
{
public:
  Value * map;
  Value * key;
  Value * value;

  MapUpdate(Value * m, Value * k, Value * v) : ValueBase(nullptr), map(m), key(k), value(v) {}
};

/// `chan <- x`
class Send : public ValueBase<Send, Instruction, ValueKind::Send>
{
public:
  Value * chan;
  Value * x;

  Send(Value * c, Value * v) : ValueBase(nullptr), chan(c), x(v) {}
};

class Go : public ValueBase<Go, CallInstruction, ValueKind::Go>
{
public:
  explicit Go(CallCommon c) : ValueBase(nullptr, std::move(c)) {}
};

class Defer : public ValueBase<Defer, CallInstruction, ValueKind::Defer>
{
public:
  explicit Defer(CallCommon c) : ValueBase(nullptr, std::move(c)) {}
};

class Panic : public ValueBase<Panic, Instruction, ValueKind::Panic>
{
public:
  Value * x;

  explicit Panic(Value * v) : ValueBase(nullptr), x(v) {}
};

class Return : public ValueBase<Return, Instruction, ValueKind::Return>
{
public:
  std::vector<Value *> results;

  explicit Return(std::vector<Value *> r) : ValueBase(nullptr), results(std::move(r)) {}
};

class RunDefers : public ValueBase<RunDefers, Instruction, ValueKind::RunDefers>
{
public:
  RunDefers() : ValueBase(nullptr) {}
};

/// Unconditional jump to the single successor of the block.
class Jump : public ValueBase<Jump, Instruction, ValueKind::Jump>
{
public:
  Jump() : ValueBase(nullptr) {}
};

/// Conditional branch to successor 0 (true) or 1 (false).
class If : public ValueBase<If, Instruction, ValueKind::If>
{
public:
  Value * cond;

  explicit If(Value * c) : ValueBase(nullptr), cond(c) {}
};

/// Source-level reference to a value, kept for debuggers.
class DebugRef : public ValueBase<DebugRef, Instruction, ValueKind::DebugRef>
{
public:
  Value * x;

  explicit DebugRef(Value * v) : ValueBase(nullptr), x(v) {}
};

}  // namespace typeflow
