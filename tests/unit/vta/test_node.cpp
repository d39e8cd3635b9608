#include <gtest/gtest.h>

#include <unordered_set>

#include "typeflow/ir/function_builder.hpp"
#include "typeflow/ir/program.hpp"
#include "typeflow/vta/node.hpp"

using namespace typeflow;

namespace
{

struct NodeEnv
{
  Program prog;
  Package * pkg = prog.create_package("P");
  TypeContext & types = prog.types();
  const Type * i = types.int_type();
  const Type * iface =
    types.new_named("P", "I", types.get_interface({{"m", types.get_signature({}, {})}}));
  const Type * agg =
    types.new_named("P", "X", types.get_struct({{"a", types.int_type(), false}}));
};

}  // namespace

// ============================================================================
// Golden Strings
// ============================================================================

TEST(VtaNode, TypeIdentifiedNodeStrings)
{
  NodeEnv env;
  TypeContext & types = env.types;

  EXPECT_EQ(FlowNode::constant(env.i).to_string(), "Constant(int)");
  EXPECT_EQ(FlowNode::pointer(types.get_pointer(env.i)).to_string(), "Pointer(*int)");
  EXPECT_EQ(FlowNode::map_key(types.string_type()).to_string(), "MapKey(string)");
  EXPECT_EQ(FlowNode::map_value(env.iface).to_string(), "MapValue(P.I)");
  EXPECT_EQ(FlowNode::slice_elem(env.iface).to_string(), "Slice([]P.I)");
  EXPECT_EQ(FlowNode::channel_elem(env.i).to_string(), "Channel(chan int)");
  EXPECT_EQ(FlowNode::field(env.agg, 0).to_string(), "Field(P.X:a)");
  EXPECT_EQ(FlowNode::nested_ptr_interface(env.iface).to_string(), "PtrInterface(P.I)");
  EXPECT_EQ(FlowNode::panic_arg().to_string(), "Panic");
  EXPECT_EQ(FlowNode::recover_return().to_string(), "Recover");
}

TEST(VtaNode, ValueIdentifiedNodeStrings)
{
  NodeEnv env;
  const Type * sig = env.types.get_signature({}, {env.i, env.i});
  Function * fn = env.prog.create_function(env.pkg, "f", sig);
  Global * g = env.prog.create_global(env.pkg, "gv", env.iface);

  FunctionBuilder b(env.prog, fn);
  auto * call = b.call(fn, {});

  EXPECT_EQ(FlowNode::global(g).to_string(), "Global(gv)");
  EXPECT_EQ(FlowNode::local(call).to_string(), "Local(t0)");
  EXPECT_EQ(FlowNode::indexed_local(call, env.i, 1).to_string(), "Local(t0[1])");
  EXPECT_EQ(FlowNode::function(fn).to_string(), "Function(f)");
  EXPECT_EQ(FlowNode::result_var(fn, 0).to_string(), "Return(f[0])");
}

// ============================================================================
// Types
// ============================================================================

TEST(VtaNode, NodeTypes)
{
  NodeEnv env;
  const Type * sig = env.types.get_signature({}, {env.iface});
  Function * fn = env.prog.create_function(env.pkg, "f", sig);
  Global * g = env.prog.create_global(env.pkg, "gv", env.iface);

  EXPECT_EQ(FlowNode::field(env.agg, 0).type(), env.i);
  EXPECT_EQ(FlowNode::field(env.agg, 3).type(), nullptr);
  EXPECT_EQ(FlowNode::global(g).type(), env.types.get_pointer(env.iface));
  EXPECT_EQ(FlowNode::function(fn).type(), sig);
  EXPECT_EQ(FlowNode::result_var(fn, 0).type(), env.iface);
  EXPECT_EQ(FlowNode::panic_arg().type(), nullptr);

  EXPECT_TRUE(FlowNode::panic_arg().is_sentinel());
  EXPECT_TRUE(FlowNode::nested_ptr_function(sig).is_nested_ptr());
  EXPECT_FALSE(FlowNode::constant(env.i).is_nested_ptr());
}

// ============================================================================
// Equality and Hashing
// ============================================================================

TEST(VtaNode, EqualityFollowsIdentityFields)
{
  NodeEnv env;
  const Type * s = env.types.string_type();

  EXPECT_EQ(FlowNode::constant(env.i), FlowNode::constant(env.i));
  EXPECT_NE(FlowNode::constant(env.i), FlowNode::constant(s));
  // Same identity field, different variant
  EXPECT_NE(FlowNode::map_key(env.i), FlowNode::map_value(env.i));
  EXPECT_NE(FlowNode::field(env.agg, 0), FlowNode::field(env.agg, 1));
  EXPECT_EQ(FlowNode::panic_arg(), FlowNode::panic_arg());
  EXPECT_NE(FlowNode::panic_arg(), FlowNode::recover_return());
}

TEST(VtaNode, HashIsConsistentWithEquality)
{
  NodeEnv env;
  FlowNodeHash h;
  EXPECT_EQ(h(FlowNode::slice_elem(env.i)), h(FlowNode::slice_elem(env.i)));
  EXPECT_EQ(h(FlowNode::panic_arg()), h(FlowNode::panic_arg()));

  std::unordered_set<FlowNode, FlowNodeHash> set;
  set.insert(FlowNode::constant(env.i));
  set.insert(FlowNode::constant(env.i));
  set.insert(FlowNode::pointer(env.types.get_pointer(env.i)));
  set.insert(FlowNode::map_key(env.i));
  set.insert(FlowNode::map_value(env.i));
  EXPECT_EQ(set.size(), 4U);
}
