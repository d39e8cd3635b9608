// typeflow/vta/graph_builder.hpp - Flow graph construction from the IR
//
// Translates every instruction of the analyzed functions into flow edges.
// Interprocedural edges (arguments, results) follow the callees recorded
// for each call site in a baseline call graph.
//
#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include <gsl/span>

#include "typeflow/basic/diagnostic.hpp"
#include "typeflow/callgraph/callgraph.hpp"
#include "typeflow/ir/program.hpp"
#include "typeflow/vta/graph.hpp"

namespace typeflow
{

/**
 * A call site whose callees depend on the types reaching its operand:
 * interface invocations and calls through function values.
 */
struct DynamicCallSite
{
  const Function * caller = nullptr;
  const CallInstruction * site = nullptr;
  /// Always `Local(call value)`
  FlowNode operand;
};

// ============================================================================
// Flow Graph Helpers
// ============================================================================

/**
 * Whether values can flow into `node` in a way that matters for call
 * resolution: interface and function typed nodes (possibly behind
 * pointers) and the panic/recover sentinels.
 */
[[nodiscard]] bool has_in_flow(const FlowNode & node) noexcept;

/// Nodes standing for memory that can alias: pointer-typed or nested pointers
[[nodiscard]] bool is_reference_node(const FlowNode & node) noexcept;

// ============================================================================
// FlowGraphBuilder
// ============================================================================

/**
 * Builds the flow graph for a set of functions.
 *
 * The builder stops at the first malformed instruction and reports it to
 * the DiagnosticBag with its position, enclosing function and rendering.
 *
 * ## Usage
 * ```cpp
 * FlowGraph graph;
 * FlowGraphBuilder builder(program, cha, graph, diags);
 * if (!builder.build(functions)) { ... }
 * ```
 */
class FlowGraphBuilder
{
public:
  FlowGraphBuilder(
    const Program & program, const CallGraph & initial, FlowGraph & graph, DiagnosticBag & diags);

  /**
   * Add the fixed `Panic -> Recover` edge and visit every function.
   * @return false if a malformed instruction or value was found
   */
  bool build(gsl::span<const Function * const> functions);

  /// Visit the instructions of one function
  bool visit_function(const Function * fn);

  /// Dynamic call sites met so far, in visit order
  [[nodiscard]] const std::vector<DynamicCallSite> & dynamic_sites() const noexcept
  {
    return dynamic_sites_;
  }

  /**
   * Map a value to its flow node.
   *
   * Pointers to non-interface, non-function types become Pointer nodes,
   * or NestedPtr* nodes when an interface or function hides under further
   * pointers. Reports and returns nullopt for values without a node.
   */
  std::optional<FlowNode> node_from_value(const Value * v);

private:
  // ===========================================================================
  // Instruction Rules
  // ===========================================================================

  bool visit_instruction(const Instruction * instr);

  bool visit_unop(const UnOp * u);
  bool visit_type_assert(const TypeAssert * a);
  bool visit_extract(const Extract * e);
  bool visit_field(const Field * f);
  bool visit_field_addr(const FieldAddr * f);
  bool visit_send(const Send * s);
  bool visit_select(const Select * s);
  bool visit_index(const Index * i);
  bool visit_index_addr(const IndexAddr * i);
  bool visit_lookup(const Lookup * l);
  bool visit_map_update(const MapUpdate * u);
  bool visit_next(const Next * n);
  bool visit_closure(const MakeClosure * c);
  bool visit_call(const CallInstruction * c);
  bool visit_builtin_call(const CallInstruction * c, const Builtin * builtin);
  bool add_argument_flows(const CallInstruction * c, const Function * callee);
  bool add_result_flows(const CallInstruction * c, const Function * callee);
  bool visit_panic(const Panic * p);
  bool visit_return(const Return * r);

  // ===========================================================================
  // Edge Helpers
  // ===========================================================================

  /// Edge `src -> dst` when `dst` has in-flow
  void add_in_flow_edge(const FlowNode & src, const FlowNode & dst);

  /// Edge `r -> l`, plus `l -> r` when both are reference nodes
  void add_in_flow_alias_edges(const FlowNode & l, const FlowNode & r);

  /// node_from_value on both operands, then add_in_flow_edge
  bool flow(const Value * src, const Value * dst);

  /// node_from_value on both operands, then add_in_flow_alias_edges
  bool alias(const Value * l, const Value * r);

  /// Report a malformed instruction (VTA001) and return false
  bool malformed(std::string reason);

  /// Report an error with context notes for the current instruction; returns false
  bool report(const char * code, std::string message);

  const Program & program_;
  const CallGraph & initial_;
  FlowGraph & graph_;
  DiagnosticBag & diags_;

  std::vector<DynamicCallSite> dynamic_sites_;

  /// Instruction being visited, for diagnostics
  const Instruction * current_ = nullptr;
};

// ============================================================================
// Whole-set Build
// ============================================================================

struct FlowGraphBuildResult
{
  FlowGraph graph;
  std::vector<DynamicCallSite> dynamic_sites;
  bool success = false;
};

/**
 * Build the flow graph for `functions`, optionally on several threads.
 *
 * With `threads > 1` the functions are split into contiguous chunks; each
 * worker fills a private graph and the graphs are merged after the join.
 * Diagnostics of all workers are merged into `diags` in chunk order.
 */
[[nodiscard]] FlowGraphBuildResult build_flow_graph(
  const Program & program, gsl::span<const Function * const> functions, const CallGraph & initial,
  DiagnosticBag & diags, size_t threads = 1);

}  // namespace typeflow
