#include <gtest/gtest.h>

#include <algorithm>
#include <string>
#include <vector>

#include "typeflow/callgraph/cha.hpp"
#include "typeflow/ir/function_builder.hpp"
#include "typeflow/test_support/program_fixtures.hpp"
#include "typeflow/vta/graph_builder.hpp"

using namespace typeflow;

namespace
{

std::vector<const Function *> functions_of(const Program & prog)
{
  const auto fs = prog.all_functions();
  return {fs.begin(), fs.end()};
}

FlowGraphBuildResult build(const Program & prog, DiagnosticBag & diags, size_t threads = 1)
{
  const CallGraph initial = build_static_call_graph(prog);
  const auto fs = functions_of(prog);
  return build_flow_graph(prog, fs, initial, diags, threads);
}

/// Package P with `type I interface { m() }` and `type C int` implementing it
struct RuleEnv
{
  Program prog;
  Package * pkg = prog.create_package("P");
  TypeContext & types = prog.types();
  const Type * unit_sig = types.get_signature({}, {});
  const Type * iface = types.new_named("P", "I", types.get_interface({{"m", unit_sig}}));
  Type * c = types.new_named("P", "C", types.int_type());

  RuleEnv()
  {
    Function * m = prog.create_method(pkg, c, "m", unit_sig, false);
    FunctionBuilder(prog, m).ret({});
  }

  /// `t = make I <- C(0)` in the builder's current block
  MakeInterface * boxed_c(FunctionBuilder & b)
  {
    return b.make_interface(iface, prog.create_const(c, "0"));
  }
};

}  // namespace

// ============================================================================
// Basic Rules
// ============================================================================

TEST(VtaGraphBuilder, EmptyFunctionSetHasPanicRecoverEdge)
{
  Program prog;
  DiagnosticBag diags;
  auto built = build(prog, diags);

  ASSERT_TRUE(built.success);
  EXPECT_EQ(built.graph.node_count(), 2U);
  EXPECT_EQ(built.graph.edge_count(), 1U);
  EXPECT_TRUE(built.graph.has_edge(FlowNode::panic_arg(), FlowNode::recover_return()));
}

TEST(VtaGraphBuilder, MakeInterfaceAndDynamicSites)
{
  auto fx = test_support::make_dispatch_fixture();
  DiagnosticBag diags;
  auto built = build(*fx.program, diags);
  ASSERT_TRUE(built.success) << (diags.empty() ? "" : diags.all()[0].to_string());

  const auto & g_entry = fx.g->blocks()[0]->instructions();
  const Value * boxed = g_entry[0].get();
  EXPECT_TRUE(built.graph.has_edge(FlowNode::constant(fx.c), FlowNode::local(boxed)));

  // Phi edges of f: both functions flow into the phi
  const auto & done = fx.f->blocks()[2]->instructions();
  const Value * phi = done[0].get();
  EXPECT_TRUE(built.graph.has_edge(FlowNode::function(fx.f1), FlowNode::local(phi)));
  EXPECT_TRUE(built.graph.has_edge(FlowNode::function(fx.h), FlowNode::local(phi)));

  // The invoke in g and the call through the phi; the static call is not dynamic
  ASSERT_EQ(built.dynamic_sites.size(), 2U);
  EXPECT_EQ(built.dynamic_sites[0].site, fx.invoke_site);
  EXPECT_EQ(built.dynamic_sites[0].operand, FlowNode::local(boxed));
  EXPECT_EQ(built.dynamic_sites[1].site, fx.dynamic_site);
  EXPECT_EQ(built.dynamic_sites[1].caller, fx.f);
}

TEST(VtaGraphBuilder, StoreAndLoadThroughInterfacePointer)
{
  RuleEnv env;
  Function * fn = env.prog.create_function(env.pkg, "f", env.unit_sig);
  FunctionBuilder b(env.prog, fn);
  auto * slot = b.alloc(env.iface);
  auto * boxed = env.boxed_c(b);
  b.store(slot, boxed);
  auto * loaded = b.deref(slot);
  b.ret({});

  DiagnosticBag diags;
  auto built = build(env.prog, diags);
  ASSERT_TRUE(built.success);

  EXPECT_TRUE(built.graph.has_edge(FlowNode::local(boxed), FlowNode::local(slot)));
  EXPECT_TRUE(built.graph.has_edge(FlowNode::local(slot), FlowNode::local(loaded)));
  EXPECT_FALSE(built.graph.has_edge(FlowNode::local(loaded), FlowNode::local(slot)));
}

TEST(VtaGraphBuilder, NestedPointersCollapse)
{
  RuleEnv env;
  const Type * ptr_i = env.types.get_pointer(env.iface);
  Function * fn = env.prog.create_function(env.pkg, "f", env.unit_sig);
  FunctionBuilder b(env.prog, fn);
  auto * inner = b.alloc(env.iface);
  auto * outer = b.alloc(ptr_i);
  b.store(outer, inner);
  b.ret({});

  FlowGraph graph;
  DiagnosticBag diags;
  CallGraph initial;
  FlowGraphBuilder builder(env.prog, initial, graph, diags);
  auto node = builder.node_from_value(outer);
  ASSERT_TRUE(node.has_value());
  EXPECT_EQ(*node, FlowNode::nested_ptr_interface(env.iface));

  auto inner_node = builder.node_from_value(inner);
  ASSERT_TRUE(inner_node.has_value());
  EXPECT_EQ(*inner_node, FlowNode::local(inner));

  // Pointers to concrete types share one Pointer node per type
  auto * pi = b.alloc(env.types.int_type());
  auto pnode = builder.node_from_value(pi);
  ASSERT_TRUE(pnode.has_value());
  EXPECT_EQ(*pnode, FlowNode::pointer(env.types.get_pointer(env.types.int_type())));
}

TEST(VtaGraphBuilder, FieldMapAndChannelAccesses)
{
  RuleEnv env;
  TypeContext & types = env.types;
  const Type * agg = types.new_named("P", "X", types.get_struct({{"a", env.iface, false}}));
  const Type * m = types.get_map(types.string_type(), env.iface);
  const Type * ch = types.get_chan(env.iface);

  Function * fn = env.prog.create_function(env.pkg, "f", types.get_signature({agg, m, ch}, {}));
  Parameter * x = fn->add_param("x", agg);
  Parameter * mp = fn->add_param("m", m);
  Parameter * cp = fn->add_param("c", ch);

  FunctionBuilder b(env.prog, fn);
  auto * key = env.prog.create_const(types.string_type(), "\"k\"");
  auto * fld = b.field(x, 0);
  auto * boxed = env.boxed_c(b);
  b.map_update(mp, key, boxed);
  auto * looked = b.lookup(mp, key);
  b.send(cp, boxed);
  auto * received = b.recv(cp, true);
  b.ret({});

  DiagnosticBag diags;
  auto built = build(env.prog, diags);
  ASSERT_TRUE(built.success);
  const FlowGraph & g = built.graph;

  EXPECT_TRUE(g.has_edge(FlowNode::field(agg, 0), FlowNode::local(fld)));
  EXPECT_TRUE(g.has_edge(FlowNode::local(boxed), FlowNode::map_value(env.iface)));
  EXPECT_TRUE(g.has_edge(FlowNode::map_value(env.iface), FlowNode::local(looked)));
  EXPECT_TRUE(g.has_edge(FlowNode::local(boxed), FlowNode::channel_elem(env.iface)));
  EXPECT_TRUE(g.has_edge(
    FlowNode::channel_elem(env.iface), FlowNode::indexed_local(received, env.iface, 0)));
  // String keys have no in-flow
  EXPECT_FALSE(g.find(FlowNode::map_key(types.string_type())).has_value());
}

TEST(VtaGraphBuilder, SelectStatesAndExtract)
{
  RuleEnv env;
  TypeContext & types = env.types;
  const Type * ch = types.get_chan(env.iface);

  Function * fn = env.prog.create_function(env.pkg, "f", types.get_signature({ch}, {}));
  Parameter * cp = fn->add_param("c", ch);

  FunctionBuilder b(env.prog, fn);
  auto * boxed = env.boxed_c(b);
  auto * sel = b.select({
    SelectState{ChanDir::SendOnly, cp, boxed},
    SelectState{ChanDir::RecvOnly, cp, nullptr},
    SelectState{ChanDir::RecvOnly, cp, nullptr},
  });
  auto * first = b.extract(sel, 2);
  b.ret({});

  DiagnosticBag diags;
  auto built = build(env.prog, diags);
  ASSERT_TRUE(built.success);
  const FlowGraph & g = built.graph;

  const FlowNode elem = FlowNode::channel_elem(env.iface);
  EXPECT_TRUE(g.has_edge(FlowNode::local(boxed), elem));
  // Received values occupy tuple components 2 and 3
  EXPECT_TRUE(g.has_edge(elem, FlowNode::indexed_local(sel, env.iface, 2)));
  EXPECT_TRUE(g.has_edge(elem, FlowNode::indexed_local(sel, env.iface, 3)));
  EXPECT_FALSE(g.has_edge(FlowNode::indexed_local(sel, env.iface, 2), elem));
  EXPECT_TRUE(g.has_edge(FlowNode::indexed_local(sel, env.iface, 2), FlowNode::local(first)));
}

TEST(VtaGraphBuilder, MapRangeAndCommaOkLookup)
{
  RuleEnv env;
  TypeContext & types = env.types;
  const Type * m = types.get_map(env.iface, env.iface);

  Function * fn = env.prog.create_function(env.pkg, "f", types.get_signature({m}, {}));
  Parameter * mp = fn->add_param("m", m);

  FunctionBuilder b(env.prog, fn);
  auto * boxed = env.boxed_c(b);
  auto * it = b.range(mp);
  auto * next = b.next(it);
  auto * looked = b.lookup(mp, boxed, true);
  b.ret({});

  DiagnosticBag diags;
  auto built = build(env.prog, diags);
  ASSERT_TRUE(built.success);
  const FlowGraph & g = built.graph;

  const FlowNode key = FlowNode::map_key(env.iface);
  const FlowNode value = FlowNode::map_value(env.iface);
  EXPECT_TRUE(g.has_edge(key, FlowNode::indexed_local(next, env.iface, 1)));
  EXPECT_TRUE(g.has_edge(value, FlowNode::indexed_local(next, env.iface, 2)));
  EXPECT_FALSE(g.has_edge(FlowNode::indexed_local(next, env.iface, 2), value));
  EXPECT_TRUE(g.has_edge(value, FlowNode::indexed_local(looked, env.iface, 0)));
  EXPECT_FALSE(g.has_edge(FlowNode::indexed_local(looked, env.iface, 0), value));
}

TEST(VtaGraphBuilder, TypeAssertions)
{
  RuleEnv env;
  TypeContext & types = env.types;
  const Type * any = types.empty_interface();

  Function * fn = env.prog.create_function(env.pkg, "f", types.get_signature({any}, {}));
  Parameter * x = fn->add_param("x", any);

  FunctionBuilder b(env.prog, fn);
  auto * plain = b.type_assert(x, env.iface);
  auto * checked = b.type_assert(x, env.iface, true);
  auto * value = b.extract(checked, 0);
  auto * concrete = b.type_assert(x, env.c, true);
  b.ret({});

  DiagnosticBag diags;
  auto built = build(env.prog, diags);
  ASSERT_TRUE(built.success);
  const FlowGraph & g = built.graph;

  EXPECT_TRUE(g.has_edge(FlowNode::local(x), FlowNode::local(plain)));
  const FlowNode component = FlowNode::indexed_local(checked, env.iface, 0);
  EXPECT_TRUE(g.has_edge(FlowNode::local(x), component));
  EXPECT_TRUE(g.has_edge(component, FlowNode::local(value)));
  // Concrete targets have no in-flow
  EXPECT_FALSE(g.find(FlowNode::indexed_local(concrete, env.c, 0)).has_value());
}

TEST(VtaGraphBuilder, InterfaceAndTypeChanges)
{
  RuleEnv env;
  TypeContext & types = env.types;
  const Type * j = types.new_named("P", "J", types.get_interface({{"m", env.unit_sig}}));
  const Type * ptr_i = types.get_pointer(env.iface);

  Function * fn = env.prog.create_function(env.pkg, "f", types.get_signature({ptr_i}, {}));
  Parameter * q = fn->add_param("q", ptr_i);

  FunctionBuilder b(env.prog, fn);
  auto * boxed = env.boxed_c(b);
  auto * widened = b.change_interface(types.empty_interface(), boxed);
  auto * retyped = b.change_type(types.get_pointer(j), q);
  b.ret({});

  DiagnosticBag diags;
  auto built = build(env.prog, diags);
  ASSERT_TRUE(built.success);
  const FlowGraph & g = built.graph;

  EXPECT_TRUE(g.has_edge(FlowNode::local(boxed), FlowNode::local(widened)));
  EXPECT_FALSE(g.has_edge(FlowNode::local(widened), FlowNode::local(boxed)));
  // Both sides are pointers to interfaces and alias each other
  EXPECT_TRUE(g.has_edge(FlowNode::local(q), FlowNode::local(retyped)));
  EXPECT_TRUE(g.has_edge(FlowNode::local(retyped), FlowNode::local(q)));
}

TEST(VtaGraphBuilder, SliceIndexAndAppend)
{
  RuleEnv env;
  TypeContext & types = env.types;
  const Type * sl = types.get_slice(env.iface);

  Function * fn = env.prog.create_function(env.pkg, "f", types.get_signature({sl}, {}));
  Parameter * s = fn->add_param("s", sl);

  FunctionBuilder b(env.prog, fn);
  auto * zero = env.prog.create_const(types.int_type(), "0");
  auto * boxed = env.boxed_c(b);
  auto * appended = b.call_builtin("append", {s, boxed}, sl);
  auto * read = b.index(appended, zero);
  auto * addr = b.index_addr(s, zero);
  b.ret({});

  DiagnosticBag diags;
  auto built = build(env.prog, diags);
  ASSERT_TRUE(built.success);
  const FlowGraph & g = built.graph;

  const FlowNode elem = FlowNode::slice_elem(env.iface);
  EXPECT_TRUE(g.has_edge(FlowNode::local(boxed), elem));
  EXPECT_TRUE(g.has_edge(elem, FlowNode::local(read)));
  EXPECT_FALSE(g.has_edge(FlowNode::local(read), elem));
  // Element addresses read and write the shared slot
  EXPECT_TRUE(g.has_edge(elem, FlowNode::local(addr)));
  EXPECT_TRUE(g.has_edge(FlowNode::local(addr), elem));
  EXPECT_TRUE(built.dynamic_sites.empty());
}

TEST(VtaGraphBuilder, GoAndDeferSites)
{
  RuleEnv env;
  TypeContext & types = env.types;

  Function * h = env.prog.create_function(env.pkg, "h", env.unit_sig);
  FunctionBuilder(env.prog, h).ret({});

  Function * fn = env.prog.create_function(env.pkg, "f", types.get_signature({env.unit_sig}, {}));
  Parameter * fv = fn->add_param("fv", env.unit_sig);

  FunctionBuilder b(env.prog, fn);
  auto * spawned = b.go(fv, {});
  b.defer(h, {});
  b.ret({});

  DiagnosticBag diags;
  auto built = build(env.prog, diags);
  ASSERT_TRUE(built.success);

  // The deferred call is static
  ASSERT_EQ(built.dynamic_sites.size(), 1U);
  EXPECT_EQ(built.dynamic_sites[0].site, spawned);
  EXPECT_EQ(built.dynamic_sites[0].caller, fn);
  EXPECT_EQ(built.dynamic_sites[0].operand, FlowNode::local(fv));
}

TEST(VtaGraphBuilder, ArgumentAndResultFlows)
{
  RuleEnv env;
  TypeContext & types = env.types;

  Function * make = env.prog.create_function(env.pkg, "make", types.get_signature({}, {env.iface}));
  MakeInterface * made = nullptr;
  {
    FunctionBuilder b(env.prog, make);
    made = env.boxed_c(b);
    b.ret({made});
  }

  Function * take = env.prog.create_function(env.pkg, "take", types.get_signature({env.iface}, {}));
  Parameter * p = take->add_param("p", env.iface);
  FunctionBuilder(env.prog, take).ret({});

  Function * caller = env.prog.create_function(env.pkg, "caller", env.unit_sig);
  Call * result = nullptr;
  {
    FunctionBuilder b(env.prog, caller);
    result = b.call(make, {});
    b.call(take, {result});
    b.ret({});
  }

  DiagnosticBag diags;
  auto built = build(env.prog, diags);
  ASSERT_TRUE(built.success);
  const FlowGraph & g = built.graph;

  EXPECT_TRUE(g.has_edge(FlowNode::local(made), FlowNode::result_var(make, 0)));
  EXPECT_TRUE(g.has_edge(FlowNode::result_var(make, 0), FlowNode::local(result)));
  EXPECT_TRUE(g.has_edge(FlowNode::local(result), FlowNode::local(p)));
  EXPECT_TRUE(built.dynamic_sites.empty());
}

TEST(VtaGraphBuilder, ClosureBindingsAndPanicRecover)
{
  RuleEnv env;
  TypeContext & types = env.types;
  Function * outer = env.prog.create_function(env.pkg, "outer", env.unit_sig);
  Function * inner = env.prog.create_anonymous(outer, env.unit_sig);
  FreeVar * fv = inner->add_free_var("fv", env.iface);
  FunctionBuilder(env.prog, inner).ret({});

  FunctionBuilder b(env.prog, outer);
  auto * boxed = env.boxed_c(b);
  auto * closure = b.make_closure(inner, {boxed});
  b.panic(boxed);
  b.ret({});

  Function * handler = env.prog.create_function(env.pkg, "handler", env.unit_sig);
  FunctionBuilder hb(env.prog, handler);
  auto * recovered = hb.call_builtin("recover", {}, types.empty_interface());
  hb.ret({});

  DiagnosticBag diags;
  auto built = build(env.prog, diags);
  ASSERT_TRUE(built.success);
  const FlowGraph & g = built.graph;

  EXPECT_TRUE(g.has_edge(FlowNode::function(inner), FlowNode::local(closure)));
  EXPECT_TRUE(g.has_edge(FlowNode::local(boxed), FlowNode::local(fv)));
  EXPECT_TRUE(g.has_edge(FlowNode::local(boxed), FlowNode::panic_arg()));
  EXPECT_TRUE(g.has_edge(FlowNode::recover_return(), FlowNode::local(recovered)));
}

// ============================================================================
// Diagnostics
// ============================================================================

TEST(VtaGraphBuilder, MalformedInstructionIsReported)
{
  RuleEnv env;
  Function * fn =
    env.prog.create_function(env.pkg, "bad", env.types.get_signature({env.types.int_type()}, {}));
  Parameter * x = fn->add_param("x", env.types.int_type());
  FunctionBuilder b(env.prog, fn);
  b.set_pos("bad.go", 3, 7);
  b.field(x, 0);
  b.ret({});

  DiagnosticBag diags;
  auto built = build(env.prog, diags);
  EXPECT_FALSE(built.success);
  ASSERT_TRUE(diags.has_code(k_diag_malformed_instruction));

  const Diagnostic & d = diags.all()[0];
  EXPECT_EQ(d.pos.to_string(), "bad.go:3:7");
  ASSERT_EQ(d.notes.size(), 2U);
  EXPECT_EQ(d.notes[0], "in function bad");
}

TEST(VtaGraphBuilder, BuiltinOperandIsUnsupported)
{
  RuleEnv env;
  Function * fn = env.prog.create_function(env.pkg, "f", env.unit_sig);
  FunctionBuilder b(env.prog, fn);
  auto * slot = b.alloc(env.iface);
  b.store(slot, env.prog.builtin("len"));
  b.ret({});

  DiagnosticBag diags;
  auto built = build(env.prog, diags);
  EXPECT_FALSE(built.success);
  EXPECT_TRUE(diags.has_code(k_diag_unsupported_value));
}

// ============================================================================
// Parallel Construction
// ============================================================================

TEST(VtaGraphBuilder, ParallelBuildMatchesSerialBuild)
{
  auto fx = test_support::make_dispatch_fixture();
  const CallGraph initial = build_cha_call_graph(*fx.program);
  const auto fs = functions_of(*fx.program);

  DiagnosticBag serial_diags;
  auto serial = build_flow_graph(*fx.program, fs, initial, serial_diags, 1);
  DiagnosticBag parallel_diags;
  auto parallel = build_flow_graph(*fx.program, fs, initial, parallel_diags, 4);

  ASSERT_TRUE(serial.success);
  ASSERT_TRUE(parallel.success);
  EXPECT_EQ(serial.graph.node_count(), parallel.graph.node_count());
  EXPECT_EQ(serial.graph.edge_count(), parallel.graph.edge_count());
  EXPECT_EQ(serial.dynamic_sites.size(), parallel.dynamic_sites.size());

  auto a = serial.graph.dump_lines();
  auto b = parallel.graph.dump_lines();
  std::sort(a.begin(), a.end());
  std::sort(b.begin(), b.end());
  EXPECT_EQ(a, b);
}
