// typeflow/ir/function_builder.cpp - FunctionBuilder implementation
//
#include "typeflow/ir/function_builder.hpp"

#include "typeflow/ir/type_utils.hpp"

namespace typeflow
{

namespace
{

bool is_comparison(std::string_view op)
{
  return op == "==" || op == "!=" || op == "<" || op == "<=" || op == ">" || op == ">=";
}

const Type * type_of(const Value * v) noexcept { return v != nullptr ? v->get_type() : nullptr; }

/// Signature of method `name` of the interface behind `t` (or its constraint)
const Type * interface_method_signature(const Type * t, std::string_view name) noexcept
{
  if (t == nullptr) return nullptr;
  if (t->is_type_param()) {
    return interface_method_signature(t->constraint, name);
  }
  const Type * u = t->underlying();
  if (u->kind != TypeKind::Interface) return nullptr;
  for (const auto & m : u->methods) {
    if (m.name == name) return m.signature;
  }
  return nullptr;
}

}  // namespace

FunctionBuilder::FunctionBuilder(Program & program, Function * fn) : program_(program), fn_(fn) {}

BasicBlock * FunctionBuilder::create_block(std::string comment)
{
  block_ = fn_->add_block(std::move(comment));
  return block_;
}

void FunctionBuilder::set_pos(std::string_view file, uint32_t line, uint32_t column)
{
  pos_ = SourcePos(program_.types().intern(file), line, column);
}

template <typename T>
T * FunctionBuilder::emit(std::unique_ptr<T> instr)
{
  if (block_ == nullptr) {
    create_block("entry");
  }
  instr->set_pos(pos_);
  if (is_value_instruction_kind(instr->get_kind()) && instr->get_type() != nullptr) {
    instr->set_name(fn_->next_register_name());
  }
  return block_->append(std::move(instr));
}

const Type * FunctionBuilder::call_result_type(const Type * signature)
{
  if (signature == nullptr) return nullptr;
  const Type * sig = signature->underlying();
  if (sig->results.size() == 1) {
    return sig->results[0];
  }
  return types().get_tuple(sig->results);
}

CallCommon FunctionBuilder::make_call(Value * callee, std::vector<Value *> args) const
{
  CallCommon c;
  c.value = callee;
  c.args = std::move(args);
  const Type * t = core_type(type_of(callee));
  c.signature = (t != nullptr && t->kind == TypeKind::Signature) ? t : nullptr;
  return c;
}

// ============================================================================
// Memory
// ============================================================================

Alloc * FunctionBuilder::alloc(const Type * elem, bool heap)
{
  return emit(std::make_unique<Alloc>(types().get_pointer(elem), heap));
}

Store * FunctionBuilder::store(Value * addr, Value * val)
{
  return emit(std::make_unique<Store>(addr, val));
}

UnOp * FunctionBuilder::deref(Value * x)
{
  const Type * p = core_type(type_of(x));
  const Type * t = (p != nullptr && p->kind == TypeKind::Pointer) ? p->elem : nullptr;
  return emit(std::make_unique<UnOp>(t, UnOpKind::Deref, x));
}

// ============================================================================
// Arithmetic
// ============================================================================

BinOp * FunctionBuilder::binop(std::string_view op, Value * x, Value * y)
{
  const Type * t = is_comparison(op) ? types().bool_type() : type_of(x);
  return emit(std::make_unique<BinOp>(t, std::string(op), x, y));
}

UnOp * FunctionBuilder::unop(UnOpKind op, Value * x)
{
  if (op == UnOpKind::Deref) return deref(x);
  if (op == UnOpKind::Recv) return recv(x);
  return emit(std::make_unique<UnOp>(type_of(x), op, x));
}

// ============================================================================
// Conversions
// ============================================================================

MakeInterface * FunctionBuilder::make_interface(const Type * iface, Value * x)
{
  return emit(std::make_unique<MakeInterface>(iface, x));
}

ChangeInterface * FunctionBuilder::change_interface(const Type * iface, Value * x)
{
  return emit(std::make_unique<ChangeInterface>(iface, x));
}

ChangeType * FunctionBuilder::change_type(const Type * t, Value * x)
{
  return emit(std::make_unique<ChangeType>(t, x));
}

Convert * FunctionBuilder::convert(const Type * t, Value * x)
{
  return emit(std::make_unique<Convert>(t, x));
}

SliceToArrayPointer * FunctionBuilder::slice_to_array_pointer(const Type * t, Value * x)
{
  return emit(std::make_unique<SliceToArrayPointer>(t, x));
}

TypeAssert * FunctionBuilder::type_assert(Value * x, const Type * asserted, bool comma_ok)
{
  const Type * t = comma_ok ? types().get_tuple({asserted, types().bool_type()}) : asserted;
  return emit(std::make_unique<TypeAssert>(t, x, asserted, comma_ok));
}

// ============================================================================
// Aggregates
// ============================================================================

MakeClosure * FunctionBuilder::make_closure(Function * fn, std::vector<Value *> bindings)
{
  return emit(std::make_unique<MakeClosure>(fn->get_signature(), fn, std::move(bindings)));
}

MakeMap * FunctionBuilder::make_map(const Type * map_type, Value * reserve)
{
  return emit(std::make_unique<MakeMap>(map_type, reserve));
}

MakeChan * FunctionBuilder::make_chan(const Type * chan_type, Value * size)
{
  return emit(std::make_unique<MakeChan>(chan_type, size));
}

MakeSlice * FunctionBuilder::make_slice(const Type * slice_type, Value * len, Value * cap)
{
  return emit(std::make_unique<MakeSlice>(slice_type, len, cap));
}

Slice * FunctionBuilder::slice(Value * x, Value * low, Value * high, Value * max)
{
  const Type * t = nullptr;
  const Type * u = core_type(type_of(x));
  if (u != nullptr) {
    switch (u->kind) {
      case TypeKind::Slice:
        t = type_of(x);
        break;
      case TypeKind::Basic:
        t = u->basic == BasicKind::String ? type_of(x) : nullptr;
        break;
      case TypeKind::Pointer:
      case TypeKind::Array: {
        const Type * elem = slice_array_elem(u, types());
        t = elem != nullptr ? types().get_slice(elem) : nullptr;
        break;
      }
      default:
        break;
    }
  }
  return emit(std::make_unique<Slice>(t, x, low, high, max));
}

Field * FunctionBuilder::field(Value * x, size_t index)
{
  const StructField * f = struct_field(type_of(x), index);
  return emit(std::make_unique<Field>(f != nullptr ? f->type : nullptr, x, index));
}

FieldAddr * FunctionBuilder::field_addr(Value * x, size_t index)
{
  const Type * t = nullptr;
  const Type * p = core_type(type_of(x));
  if (p != nullptr && p->kind == TypeKind::Pointer) {
    if (const StructField * f = struct_field(p->elem, index)) {
      t = types().get_pointer(f->type);
    }
  }
  return emit(std::make_unique<FieldAddr>(t, x, index));
}

Index * FunctionBuilder::index(Value * x, Value * idx)
{
  return emit(std::make_unique<Index>(slice_array_elem(type_of(x), types()), x, idx));
}

IndexAddr * FunctionBuilder::index_addr(Value * x, Value * idx)
{
  const Type * elem = slice_array_elem(type_of(x), types());
  const Type * t = elem != nullptr ? types().get_pointer(elem) : nullptr;
  return emit(std::make_unique<IndexAddr>(t, x, idx));
}

Lookup * FunctionBuilder::lookup(Value * x, Value * key, bool comma_ok)
{
  const Type * v = nullptr;
  if (const Type * m = map_of(type_of(x))) {
    v = m->elem;
  } else {
    v = slice_array_elem(type_of(x), types());
  }
  const Type * t = v;
  if (comma_ok && v != nullptr) {
    t = types().get_tuple({v, types().bool_type()});
  }
  return emit(std::make_unique<Lookup>(t, x, key, comma_ok));
}

MapUpdate * FunctionBuilder::map_update(Value * map, Value * key, Value * value)
{
  return emit(std::make_unique<MapUpdate>(map, key, value));
}

Extract * FunctionBuilder::extract(Value * tuple, size_t index)
{
  const Type * tt = type_of(tuple);
  const Type * t = (tt != nullptr && tt->is_tuple() && index < tt->elements.size())
                     ? tt->elements[index]
                     : nullptr;
  return emit(std::make_unique<Extract>(t, tuple, index));
}

Phi * FunctionBuilder::phi(const Type * t, std::vector<Value *> edges)
{
  return emit(std::make_unique<Phi>(t, std::move(edges)));
}

// ============================================================================
// Channels and Iteration
// ============================================================================

UnOp * FunctionBuilder::recv(Value * chan, bool comma_ok)
{
  const Type * elem = chan_elem(type_of(chan));
  const Type * t = elem;
  if (comma_ok && elem != nullptr) {
    t = types().get_tuple({elem, types().bool_type()});
  }
  return emit(std::make_unique<UnOp>(t, UnOpKind::Recv, chan, comma_ok));
}

Send * FunctionBuilder::send(Value * chan, Value * x)
{
  return emit(std::make_unique<Send>(chan, x));
}

Select * FunctionBuilder::select(std::vector<SelectState> states, bool blocking)
{
  std::vector<const Type *> elems{types().int_type(), types().bool_type()};
  for (const auto & st : states) {
    if (st.dir == ChanDir::RecvOnly) {
      elems.push_back(chan_elem(type_of(st.chan)));
    }
  }
  const Type * t = types().get_tuple(std::move(elems));
  return emit(std::make_unique<Select>(t, std::move(states), blocking));
}

Range * FunctionBuilder::range(Value * x)
{
  return emit(std::make_unique<Range>(x));
}

Next * FunctionBuilder::next(Range * iter)
{
  const Type * x = iter != nullptr ? type_of(iter->x) : nullptr;
  const Type * t = nullptr;
  bool is_string = false;
  if (const Type * m = map_of(x)) {
    t = types().get_tuple({types().bool_type(), m->key, m->elem});
  } else if (const Type * u = core_type(x); u != nullptr && u->kind == TypeKind::Basic &&
                                            u->basic == BasicKind::String) {
    is_string = true;
    t = types().get_tuple(
      {types().bool_type(), types().int_type(), types().basic(BasicKind::Int32)});
  }
  return emit(std::make_unique<Next>(t, iter, is_string));
}

// ============================================================================
// Calls
// ============================================================================

Call * FunctionBuilder::call(Value * callee, std::vector<Value *> args)
{
  CallCommon c = make_call(callee, std::move(args));
  const Type * t = call_result_type(c.signature);
  return emit(std::make_unique<Call>(t, std::move(c)));
}

Call * FunctionBuilder::invoke(Value * recv, std::string_view method, std::vector<Value *> args)
{
  CallCommon c;
  c.value = recv;
  c.method = std::string(method);
  c.args = std::move(args);
  c.signature = interface_method_signature(type_of(recv), method);
  const Type * t = call_result_type(c.signature);
  return emit(std::make_unique<Call>(t, std::move(c)));
}

Call * FunctionBuilder::call_builtin(
  std::string_view name, std::vector<Value *> args, const Type * result)
{
  CallCommon c;
  c.value = program_.builtin(name);
  c.args = std::move(args);
  const Type * t = result != nullptr ? result : types().get_tuple({});
  return emit(std::make_unique<Call>(t, std::move(c)));
}

Go * FunctionBuilder::go(Value * callee, std::vector<Value *> args)
{
  return emit(std::make_unique<Go>(make_call(callee, std::move(args))));
}

Defer * FunctionBuilder::defer(Value * callee, std::vector<Value *> args)
{
  return emit(std::make_unique<Defer>(make_call(callee, std::move(args))));
}

// ============================================================================
// Control Flow
// ============================================================================

Panic * FunctionBuilder::panic(Value * x) { return emit(std::make_unique<Panic>(x)); }

Return * FunctionBuilder::ret(std::vector<Value *> results)
{
  return emit(std::make_unique<Return>(std::move(results)));
}

RunDefers * FunctionBuilder::run_defers() { return emit(std::make_unique<RunDefers>()); }

Jump * FunctionBuilder::jump(BasicBlock * target)
{
  Jump * j = emit(std::make_unique<Jump>());
  block_->add_successor(target);
  return j;
}

If * FunctionBuilder::if_then(Value * cond, BasicBlock * then_block, BasicBlock * else_block)
{
  If * i = emit(std::make_unique<If>(cond));
  block_->add_successor(then_block);
  block_->add_successor(else_block);
  return i;
}

DebugRef * FunctionBuilder::debug_ref(Value * x) { return emit(std::make_unique<DebugRef>(x)); }

}  // namespace typeflow
