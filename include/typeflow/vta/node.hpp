// typeflow/vta/node.hpp - Nodes of the type-propagation graph
//
// A FlowNode is a closed sum of sixteen variants, each standing for an
// abstract location through which values of some type can flow. Two nodes
// are equal iff they have the same variant and the same identity fields.
//
#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <variant>

#include "typeflow/ir/function.hpp"
#include "typeflow/ir/type.hpp"
#include "typeflow/ir/value.hpp"

namespace typeflow
{

// ============================================================================
// Node Variants
// ============================================================================

/// All constants of one type
struct ConstantNode
{
  const Type * type = nullptr;
  bool operator==(const ConstantNode & o) const noexcept { return type == o.type; }
};

/// Unique pointer-typed abstract location of one pointer type
struct PointerNode
{
  const Type * type = nullptr;
  bool operator==(const PointerNode & o) const noexcept { return type == o.type; }
};

/// Keys of every map with this key type
struct MapKeyNode
{
  const Type * type = nullptr;
  bool operator==(const MapKeyNode & o) const noexcept { return type == o.type; }
};

/// Values of every map with this value type
struct MapValueNode
{
  const Type * type = nullptr;
  bool operator==(const MapValueNode & o) const noexcept { return type == o.type; }
};

/// Elements of every slice/array with this element type
struct SliceElemNode
{
  const Type * type = nullptr;
  bool operator==(const SliceElemNode & o) const noexcept { return type == o.type; }
};

/// Elements of every channel with this element type
struct ChannelElemNode
{
  const Type * type = nullptr;
  bool operator==(const ChannelElemNode & o) const noexcept { return type == o.type; }
};

/// Field `index` of every value of the struct type `aggregate`
struct FieldNode
{
  const Type * aggregate = nullptr;
  size_t index = 0;
  bool operator==(const FieldNode & o) const noexcept
  {
    return aggregate == o.aggregate && index == o.index;
  }
};

struct GlobalNode
{
  const Global * global = nullptr;
  bool operator==(const GlobalNode & o) const noexcept { return global == o.global; }
};

/// A register, parameter or free variable
struct LocalNode
{
  const Value * value = nullptr;
  bool operator==(const LocalNode & o) const noexcept { return value == o.value; }
};

/// Component `index` of a tuple-typed register, with that component's type
struct IndexedLocalNode
{
  const Value * value = nullptr;
  const Type * type = nullptr;
  size_t index = 0;
  bool operator==(const IndexedLocalNode & o) const noexcept
  {
    return value == o.value && type == o.type && index == o.index;
  }
};

struct FunctionNode
{
  const Function * function = nullptr;
  bool operator==(const FunctionNode & o) const noexcept { return function == o.function; }
};

/// Result `index` of a function, shared by all its return instructions
struct ResultVarNode
{
  const Function * function = nullptr;
  size_t index = 0;
  bool operator==(const ResultVarNode & o) const noexcept
  {
    return function == o.function && index == o.index;
  }
};

/// All interface values of type `type` reachable behind two or more pointers
struct NestedPtrInterfaceNode
{
  const Type * type = nullptr;
  bool operator==(const NestedPtrInterfaceNode & o) const noexcept { return type == o.type; }
};

/// All function values of signature `type` reachable behind two or more pointers
struct NestedPtrFunctionNode
{
  const Type * type = nullptr;
  bool operator==(const NestedPtrFunctionNode & o) const noexcept { return type == o.type; }
};

/// Sink of every panic argument
struct PanicArgNode
{
  bool operator==(const PanicArgNode &) const noexcept { return true; }
};

/// Source of every recover() result
struct RecoverReturnNode
{
  bool operator==(const RecoverReturnNode &) const noexcept { return true; }
};

/// Variant tag, in the order of FlowNode::Variant
enum class FlowNodeKind : uint8_t {
  Constant,
  Pointer,
  MapKey,
  MapValue,
  SliceElem,
  ChannelElem,
  Field,
  Global,
  Local,
  IndexedLocal,
  Function,
  ResultVar,
  NestedPtrInterface,
  NestedPtrFunction,
  PanicArg,
  RecoverReturn,
};

// ============================================================================
// FlowNode
// ============================================================================

class FlowNode
{
public:
  using Variant = std::variant<
    ConstantNode, PointerNode, MapKeyNode, MapValueNode, SliceElemNode, ChannelElemNode,
    FieldNode, GlobalNode, LocalNode, IndexedLocalNode, FunctionNode, ResultVarNode,
    NestedPtrInterfaceNode, NestedPtrFunctionNode, PanicArgNode, RecoverReturnNode>;

  explicit FlowNode(Variant v) : v_(v) {}

  // ===========================================================================
  // Factories
  // ===========================================================================

  static FlowNode constant(const Type * t) { return FlowNode(ConstantNode{t}); }
  static FlowNode pointer(const Type * t) { return FlowNode(PointerNode{t}); }
  static FlowNode map_key(const Type * t) { return FlowNode(MapKeyNode{t}); }
  static FlowNode map_value(const Type * t) { return FlowNode(MapValueNode{t}); }
  static FlowNode slice_elem(const Type * t) { return FlowNode(SliceElemNode{t}); }
  static FlowNode channel_elem(const Type * t) { return FlowNode(ChannelElemNode{t}); }
  static FlowNode field(const Type * aggregate, size_t index)
  {
    return FlowNode(FieldNode{aggregate, index});
  }
  static FlowNode global(const Global * g) { return FlowNode(GlobalNode{g}); }
  static FlowNode local(const Value * v) { return FlowNode(LocalNode{v}); }
  static FlowNode indexed_local(const Value * v, const Type * t, size_t index)
  {
    return FlowNode(IndexedLocalNode{v, t, index});
  }
  static FlowNode function(const Function * f) { return FlowNode(FunctionNode{f}); }
  static FlowNode result_var(const Function * f, size_t index)
  {
    return FlowNode(ResultVarNode{f, index});
  }
  static FlowNode nested_ptr_interface(const Type * t)
  {
    return FlowNode(NestedPtrInterfaceNode{t});
  }
  static FlowNode nested_ptr_function(const Type * t)
  {
    return FlowNode(NestedPtrFunctionNode{t});
  }
  static FlowNode panic_arg() { return FlowNode(PanicArgNode{}); }
  static FlowNode recover_return() { return FlowNode(RecoverReturnNode{}); }

  // ===========================================================================
  // Queries
  // ===========================================================================

  [[nodiscard]] FlowNodeKind kind() const noexcept
  {
    return static_cast<FlowNodeKind>(v_.index());
  }

  [[nodiscard]] const Variant & variant() const noexcept { return v_; }

  template <typename T>
  [[nodiscard]] const T * get_if() const noexcept
  {
    return std::get_if<T>(&v_);
  }

  /// Static type of the location; nullptr only for PanicArg and RecoverReturn
  [[nodiscard]] const Type * type() const noexcept;

  /// Stable textual identity, e.g. `Local(t0)`, `Field(P.X:a)`
  [[nodiscard]] std::string to_string() const;

  [[nodiscard]] bool is_sentinel() const noexcept
  {
    return kind() == FlowNodeKind::PanicArg || kind() == FlowNodeKind::RecoverReturn;
  }

  [[nodiscard]] bool is_nested_ptr() const noexcept
  {
    return kind() == FlowNodeKind::NestedPtrInterface || kind() == FlowNodeKind::NestedPtrFunction;
  }

  [[nodiscard]] size_t hash() const noexcept;

  bool operator==(const FlowNode & o) const noexcept { return v_ == o.v_; }
  bool operator!=(const FlowNode & o) const noexcept { return !(v_ == o.v_); }

private:
  Variant v_;
};

struct FlowNodeHash
{
  size_t operator()(const FlowNode & n) const noexcept { return n.hash(); }
};

}  // namespace typeflow
