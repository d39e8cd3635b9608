// typeflow/ir/function_builder.hpp - Construction API for function bodies
//
// FunctionBuilder appends instructions to the current block of a function,
// names registers and computes result types from operand types. When an
// operand has the wrong shape for an instruction (e.g. a field of a
// non-struct) the result type is left null; the flow-graph builder reports
// such instructions as malformed.
//
#pragma once

#include <string_view>
#include <vector>

#include "typeflow/basic/source_pos.hpp"
#include "typeflow/ir/function.hpp"
#include "typeflow/ir/instruction.hpp"
#include "typeflow/ir/program.hpp"

namespace typeflow
{

/**
 * Emits instructions into a Function.
 *
 * ## Usage
 * ```cpp
 * FunctionBuilder b(program, fn);
 * b.set_block(fn->add_block("entry"));
 * auto * box = b.make_interface(iface, b.alloc(c_type));
 * b.invoke(box, "f", {});
 * b.ret({});
 * ```
 */
class FunctionBuilder
{
public:
  FunctionBuilder(Program & program, Function * fn);

  /// Create a block in the function and make it current
  BasicBlock * create_block(std::string comment = {});

  void set_block(BasicBlock * block) noexcept { block_ = block; }
  [[nodiscard]] BasicBlock * get_block() const noexcept { return block_; }

  /// Position attached to subsequently emitted instructions
  void set_pos(SourcePos pos) noexcept { pos_ = pos; }

  /// Position `line:col` in `file` with the file name interned by the program
  void set_pos(std::string_view file, uint32_t line, uint32_t column);

  [[nodiscard]] Function * get_function() const noexcept { return fn_; }
  [[nodiscard]] TypeContext & types() noexcept { return program_.types(); }

  // ===========================================================================
  // Memory
  // ===========================================================================

  Alloc * alloc(const Type * elem, bool heap = false);
  Store * store(Value * addr, Value * val);
  UnOp * deref(Value * x);

  // ===========================================================================
  // Arithmetic
  // ===========================================================================

  /// Comparisons yield bool; other operators yield the type of `x`
  BinOp * binop(std::string_view op, Value * x, Value * y);
  UnOp * unop(UnOpKind op, Value * x);

  // ===========================================================================
  // Conversions
  // ===========================================================================

  MakeInterface * make_interface(const Type * iface, Value * x);
  ChangeInterface * change_interface(const Type * iface, Value * x);
  ChangeType * change_type(const Type * t, Value * x);
  Convert * convert(const Type * t, Value * x);
  SliceToArrayPointer * slice_to_array_pointer(const Type * t, Value * x);
  TypeAssert * type_assert(Value * x, const Type * asserted, bool comma_ok = false);

  // ===========================================================================
  // Aggregates
  // ===========================================================================

  MakeClosure * make_closure(Function * fn, std::vector<Value *> bindings);
  MakeMap * make_map(const Type * map_type, Value * reserve = nullptr);
  MakeChan * make_chan(const Type * chan_type, Value * size = nullptr);
  MakeSlice * make_slice(const Type * slice_type, Value * len, Value * cap = nullptr);
  Slice * slice(Value * x, Value * low = nullptr, Value * high = nullptr, Value * max = nullptr);

  Field * field(Value * x, size_t index);
  FieldAddr * field_addr(Value * x, size_t index);
  Index * index(Value * x, Value * idx);
  IndexAddr * index_addr(Value * x, Value * idx);
  Lookup * lookup(Value * x, Value * key, bool comma_ok = false);
  MapUpdate * map_update(Value * map, Value * key, Value * value);
  Extract * extract(Value * tuple, size_t index);
  Phi * phi(const Type * t, std::vector<Value *> edges);

  // ===========================================================================
  // Channels and Iteration
  // ===========================================================================

  UnOp * recv(Value * chan, bool comma_ok = false);
  Send * send(Value * chan, Value * x);
  Select * select(std::vector<SelectState> states, bool blocking = true);
  Range * range(Value * x);
  Next * next(Range * iter);

  // ===========================================================================
  // Calls
  // ===========================================================================

  /// Static or dynamic call through a function-typed value
  Call * call(Value * callee, std::vector<Value *> args);

  /// Interface method invocation `recv.method(args...)`
  Call * invoke(Value * recv, std::string_view method, std::vector<Value *> args);

  /// Call of a builtin; the result type is supplied by the caller
  Call * call_builtin(std::string_view name, std::vector<Value *> args, const Type * result);

  Go * go(Value * callee, std::vector<Value *> args);
  Defer * defer(Value * callee, std::vector<Value *> args);

  // ===========================================================================
  // Control Flow
  // ===========================================================================

  Panic * panic(Value * x);
  Return * ret(std::vector<Value *> results);
  RunDefers * run_defers();
  Jump * jump(BasicBlock * target);
  If * if_then(Value * cond, BasicBlock * then_block, BasicBlock * else_block);
  DebugRef * debug_ref(Value * x);

private:
  /// Append to the current block, naming value-producing instructions
  template <typename T>
  T * emit(std::unique_ptr<T> instr);

  /// Call operands for a static or dynamic call; signature from the callee type
  [[nodiscard]] CallCommon make_call(Value * callee, std::vector<Value *> args) const;

  /// Result type of a call with the given signature: T, (T1, ..., Tn) or ()
  [[nodiscard]] const Type * call_result_type(const Type * signature);

  Program & program_;
  Function * fn_;
  BasicBlock * block_ = nullptr;
  SourcePos pos_;
};

}  // namespace typeflow
