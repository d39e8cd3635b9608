// typeflow/ir/value.cpp - Value and instruction rendering
//
#include <algorithm>
#include <sstream>

#include "typeflow/ir/function.hpp"
#include "typeflow/ir/instruction.hpp"
#include "typeflow/ir/value.hpp"

namespace typeflow
{

std::string_view to_string(ValueKind kind) noexcept
{
  switch (kind) {
    case ValueKind::Const:
      return "const";
    case ValueKind::Global:
      return "global";
    case ValueKind::Function:
      return "function";
    case ValueKind::Parameter:
      return "parameter";
    case ValueKind::FreeVar:
      return "free_var";
    case ValueKind::Builtin:
      return "builtin";
    case ValueKind::Alloc:
      return "alloc";
    case ValueKind::BinOp:
      return "binop";
    case ValueKind::UnOp:
      return "unop";
    case ValueKind::Call:
      return "call";
    case ValueKind::ChangeInterface:
      return "change_interface";
    case ValueKind::ChangeType:
      return "change_type";
    case ValueKind::Convert:
      return "convert";
    case ValueKind::SliceToArrayPointer:
      return "slice_to_array_pointer";
    case ValueKind::MakeInterface:
      return "make_interface";
    case ValueKind::MakeClosure:
      return "make_closure";
    case ValueKind::MakeMap:
      return "make_map";
    case ValueKind::MakeChan:
      return "make_chan";
    case ValueKind::MakeSlice:
      return "make_slice";
    case ValueKind::Slice:
      return "slice";
    case ValueKind::Field:
      return "field";
    case ValueKind::FieldAddr:
      return "field_addr";
    case ValueKind::Index:
      return "index";
    case ValueKind::IndexAddr:
      return "index_addr";
    case ValueKind::Lookup:
      return "lookup";
    case ValueKind::Select:
      return "select";
    case ValueKind::Range:
      return "range";
    case ValueKind::Next:
      return "next";
    case ValueKind::TypeAssert:
      return "type_assert";
    case ValueKind::Extract:
      return "extract";
    case ValueKind::Phi:
      return "phi";
    case ValueKind::Store:
      return "store";
    case ValueKind::MapUpdate:
      return "map_update";
    case ValueKind::Send:
      return "send";
    case ValueKind::Go:
      return "go";
    case ValueKind::Defer:
      return "defer";
    case ValueKind::Panic:
      return "panic";
    case ValueKind::Return:
      return "return";
    case ValueKind::RunDefers:
      return "run_defers";
    case ValueKind::Jump:
      return "jump";
    case ValueKind::If:
      return "if";
    case ValueKind::DebugRef:
      return "debug_ref";
  }
  return "unknown";
}

std::string operand_to_string(const Value * v)
{
  if (v == nullptr) {
    return "<null>";
  }
  if (const auto * c = dyn_cast<Const>(v)) {
    return c->get_literal() + ":" + (c->get_type() != nullptr ? c->get_type()->to_string() : "?");
  }
  if (const auto * f = dyn_cast<Function>(v)) {
    return f->rel_string();
  }
  return v->get_name();
}

// ============================================================================
// CallCommon
// ============================================================================

Function * CallCommon::static_callee() const noexcept
{
  if (is_invoke() || value == nullptr) {
    return nullptr;
  }
  if (auto * f = dyn_cast<Function>(value)) {
    return f;
  }
  if (auto * mc = dyn_cast<MakeClosure>(value)) {
    return mc->fn;
  }
  return nullptr;
}

const Builtin * CallCommon::builtin() const noexcept
{
  if (is_invoke() || value == nullptr) {
    return nullptr;
  }
  return dyn_cast<Builtin>(value);
}

// ============================================================================
// Instruction
// ============================================================================

Function * Instruction::get_parent() const noexcept
{
  return block_ != nullptr ? block_->get_parent() : nullptr;
}

namespace
{

void push_call_operands(std::vector<Value *> & out, const CallCommon & c)
{
  out.push_back(c.value);
  out.insert(out.end(), c.args.begin(), c.args.end());
}

}  // namespace

std::vector<Value *> Instruction::operands() const
{
  std::vector<Value *> ops;
  switch (get_kind()) {
    case ValueKind::BinOp: {
      const auto * i = cast<BinOp>(this);
      ops = {i->x, i->y};
      break;
    }
    case ValueKind::UnOp:
      ops = {cast<UnOp>(this)->x};
      break;
    case ValueKind::Call:
    case ValueKind::Go:
    case ValueKind::Defer:
      push_call_operands(ops, cast<CallInstruction>(this)->common);
      break;
    case ValueKind::ChangeInterface:
      ops = {cast<ChangeInterface>(this)->x};
      break;
    case ValueKind::ChangeType:
      ops = {cast<ChangeType>(this)->x};
      break;
    case ValueKind::Convert:
      ops = {cast<Convert>(this)->x};
      break;
    case ValueKind::SliceToArrayPointer:
      ops = {cast<SliceToArrayPointer>(this)->x};
      break;
    case ValueKind::MakeInterface:
      ops = {cast<MakeInterface>(this)->x};
      break;
    case ValueKind::MakeClosure: {
      const auto * i = cast<MakeClosure>(this);
      ops.push_back(i->fn);
      ops.insert(ops.end(), i->bindings.begin(), i->bindings.end());
      break;
    }
    case ValueKind::MakeMap:
      ops = {cast<MakeMap>(this)->reserve};
      break;
    case ValueKind::MakeChan:
      ops = {cast<MakeChan>(this)->size};
      break;
    case ValueKind::MakeSlice: {
      const auto * i = cast<MakeSlice>(this);
      ops = {i->len, i->cap};
      break;
    }
    case ValueKind::Slice: {
      const auto * i = cast<Slice>(this);
      ops = {i->x, i->low, i->high, i->max};
      break;
    }
    case ValueKind::Field:
      ops = {cast<Field>(this)->x};
      break;
    case ValueKind::FieldAddr:
      ops = {cast<FieldAddr>(this)->x};
      break;
    case ValueKind::Index: {
      const auto * i = cast<Index>(this);
      ops = {i->x, i->index};
      break;
    }
    case ValueKind::IndexAddr: {
      const auto * i = cast<IndexAddr>(this);
      ops = {i->x, i->index};
      break;
    }
    case ValueKind::Lookup: {
      const auto * i = cast<Lookup>(this);
      ops = {i->x, i->index};
      break;
    }
    case ValueKind::Select:
      for (const auto & st : cast<Select>(this)->states) {
        ops.push_back(st.chan);
        ops.push_back(st.send);
      }
      break;
    case ValueKind::Range:
      ops = {cast<Range>(this)->x};
      break;
    case ValueKind::Next:
      ops = {cast<Next>(this)->iter};
      break;
    case ValueKind::TypeAssert:
      ops = {cast<TypeAssert>(this)->x};
      break;
    case ValueKind::Extract:
      ops = {cast<Extract>(this)->tuple};
      break;
    case ValueKind::Phi:
      ops = cast<Phi>(this)->edges;
      break;
    case ValueKind::Store: {
      const auto * i = cast<Store>(this);
      ops = {i->addr, i->val};
      break;
    }
    case ValueKind::MapUpdate: {
      const auto * i = cast<MapUpdate>(this);
      ops = {i->map, i->key, i->value};
      break;
    }
    case ValueKind::Send: {
      const auto * i = cast<Send>(this);
      ops = {i->chan, i->x};
      break;
    }
    case ValueKind::Panic:
      ops = {cast<Panic>(this)->x};
      break;
    case ValueKind::Return:
      ops = cast<Return>(this)->results;
      break;
    case ValueKind::If:
      ops = {cast<If>(this)->cond};
      break;
    case ValueKind::DebugRef:
      ops = {cast<DebugRef>(this)->x};
      break;
    default:
      break;
  }

  ops.erase(std::remove(ops.begin(), ops.end(), nullptr), ops.end());
  return ops;
}

std::string Instruction::to_string() const
{
  std::ostringstream os;
  if (!get_name().empty()) {
    os << get_name() << " = ";
  }

  const auto * call = dyn_cast<CallInstruction>(this);
  if (call != nullptr && call->common.is_invoke()) {
    os << typeflow::to_string(get_kind()) << " invoke " << operand_to_string(call->common.value)
       << "." << call->common.method;
    for (const Value * a : call->common.args) {
      os << " " << operand_to_string(a);
    }
    return os.str();
  }

  os << typeflow::to_string(get_kind());
  switch (get_kind()) {
    case ValueKind::Field:
      os << " #" << cast<Field>(this)->index;
      break;
    case ValueKind::FieldAddr:
      os << " #" << cast<FieldAddr>(this)->index;
      break;
    case ValueKind::Extract:
      os << " #" << cast<Extract>(this)->index;
      break;
    case ValueKind::BinOp:
      os << " " << cast<BinOp>(this)->op;
      break;
    case ValueKind::TypeAssert: {
      const auto * ta = cast<TypeAssert>(this);
      os << " " << (ta->asserted_type != nullptr ? ta->asserted_type->to_string() : "?");
      if (ta->comma_ok) os << ",ok";
      break;
    }
    default:
      break;
  }
  for (const Value * op : operands()) {
    os << " " << operand_to_string(op);
  }
  return os.str();
}

}  // namespace typeflow
