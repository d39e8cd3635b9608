// typeflow/vta/node.cpp - FlowNode typing, rendering and hashing
//
#include "typeflow/vta/node.hpp"

#include <functional>
#include <sstream>

#include "typeflow/ir/type_utils.hpp"

namespace typeflow
{

namespace
{

template <class... Ts>
struct Overloaded : Ts...
{
  using Ts::operator()...;
};
template <class... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

std::string type_string(const Type * t) { return t != nullptr ? t->to_string() : "?"; }

void hash_combine(size_t & seed, size_t v) noexcept
{
  seed ^= v + 0x9e3779b97f4a7c15ULL + (seed << 6) + (seed >> 2);
}

size_t ptr_hash(const void * p) noexcept { return std::hash<const void *>{}(p); }

}  // namespace

const Type * FlowNode::type() const noexcept
{
  return std::visit(
    Overloaded{
      [](const ConstantNode & n) { return n.type; },
      [](const PointerNode & n) { return n.type; },
      [](const MapKeyNode & n) { return n.type; },
      [](const MapValueNode & n) { return n.type; },
      [](const SliceElemNode & n) { return n.type; },
      [](const ChannelElemNode & n) { return n.type; },
      [](const FieldNode & n) -> const Type * {
        const StructField * f = struct_field(n.aggregate, n.index);
        return f != nullptr ? f->type : nullptr;
      },
      [](const GlobalNode & n) { return n.global->get_type(); },
      [](const LocalNode & n) { return n.value->get_type(); },
      [](const IndexedLocalNode & n) { return n.type; },
      [](const FunctionNode & n) { return n.function->get_signature(); },
      [](const ResultVarNode & n) { return n.function->result_type(n.index); },
      [](const NestedPtrInterfaceNode & n) { return n.type; },
      [](const NestedPtrFunctionNode & n) { return n.type; },
      [](const PanicArgNode &) -> const Type * { return nullptr; },
      [](const RecoverReturnNode &) -> const Type * { return nullptr; },
    },
    v_);
}

std::string FlowNode::to_string() const
{
  return std::visit(
    Overloaded{
      [](const ConstantNode & n) { return "Constant(" + type_string(n.type) + ")"; },
      [](const PointerNode & n) { return "Pointer(" + type_string(n.type) + ")"; },
      [](const MapKeyNode & n) { return "MapKey(" + type_string(n.type) + ")"; },
      [](const MapValueNode & n) { return "MapValue(" + type_string(n.type) + ")"; },
      [](const SliceElemNode & n) { return "Slice([]" + type_string(n.type) + ")"; },
      [](const ChannelElemNode & n) { return "Channel(chan " + type_string(n.type) + ")"; },
      [](const FieldNode & n) {
        const StructField * f = struct_field(n.aggregate, n.index);
        std::ostringstream os;
        os << "Field(" << type_string(n.aggregate) << ":";
        if (f != nullptr) {
          os << f->name;
        } else {
          os << n.index;
        }
        os << ")";
        return os.str();
      },
      [](const GlobalNode & n) { return "Global(" + n.global->get_name() + ")"; },
      [](const LocalNode & n) { return "Local(" + n.value->get_name() + ")"; },
      [](const IndexedLocalNode & n) {
        return "Local(" + n.value->get_name() + "[" + std::to_string(n.index) + "])";
      },
      [](const FunctionNode & n) { return "Function(" + n.function->get_name() + ")"; },
      [](const ResultVarNode & n) {
        return "Return(" + n.function->get_name() + "[" + std::to_string(n.index) + "])";
      },
      [](const NestedPtrInterfaceNode & n) { return "PtrInterface(" + type_string(n.type) + ")"; },
      [](const NestedPtrFunctionNode & n) { return "PtrFunction(" + type_string(n.type) + ")"; },
      [](const PanicArgNode &) { return std::string("Panic"); },
      [](const RecoverReturnNode &) { return std::string("Recover"); },
    },
    v_);
}

size_t FlowNode::hash() const noexcept
{
  size_t seed = v_.index();
  std::visit(
    Overloaded{
      [&](const FieldNode & n) {
        hash_combine(seed, ptr_hash(n.aggregate));
        hash_combine(seed, n.index);
      },
      [&](const GlobalNode & n) { hash_combine(seed, ptr_hash(n.global)); },
      [&](const LocalNode & n) { hash_combine(seed, ptr_hash(n.value)); },
      [&](const IndexedLocalNode & n) {
        hash_combine(seed, ptr_hash(n.value));
        hash_combine(seed, ptr_hash(n.type));
        hash_combine(seed, n.index);
      },
      [&](const FunctionNode & n) { hash_combine(seed, ptr_hash(n.function)); },
      [&](const ResultVarNode & n) {
        hash_combine(seed, ptr_hash(n.function));
        hash_combine(seed, n.index);
      },
      [&](const PanicArgNode &) {},
      [&](const RecoverReturnNode &) {},
      // Remaining variants are identified by a single type
      [&](const auto & n) { hash_combine(seed, ptr_hash(n.type)); },
    },
    v_);
  return seed;
}

}  // namespace typeflow
