// typeflow/callgraph/callgraph.hpp - Call graph: caller -> call sites -> callees
//
#pragma once

#include <cstddef>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "typeflow/ir/function.hpp"
#include "typeflow/ir/instruction.hpp"

namespace typeflow
{

/// A single resolved call: `site` in `caller` may invoke `callee`.
struct CallEdge
{
  const Function * caller = nullptr;
  const CallInstruction * site = nullptr;
  const Function * callee = nullptr;
};

/**
 * Call graph over the functions of a Program.
 *
 * Edges are labeled by call site and deduplicated per (site, callee).
 * Nodes and edges keep insertion order, so enumeration is deterministic.
 */
class CallGraph
{
public:
  CallGraph() = default;

  CallGraph(const CallGraph &) = default;
  CallGraph & operator=(const CallGraph &) = default;
  CallGraph(CallGraph &&) = default;
  CallGraph & operator=(CallGraph &&) = default;

  // ===========================================================================
  // Construction
  // ===========================================================================

  /// Register a function as a node (idempotent)
  void add_node(const Function * fn);

  /**
   * Add an edge for `site`; the caller is the site's enclosing function.
   * @return true if the edge was not present yet
   */
  bool add_edge(const CallInstruction * site, const Function * callee);

  /// Add every node and edge of `other`
  void merge(const CallGraph & other);

  // ===========================================================================
  // Queries
  // ===========================================================================

  [[nodiscard]] bool has_node(const Function * fn) const { return node_set_.count(fn) != 0; }

  /// True if some site of `caller` calls `callee`
  [[nodiscard]] bool has_edge(const Function * caller, const Function * callee) const;

  /// Distinct callees of `caller`, in first-seen order
  [[nodiscard]] std::vector<const Function *> callees(const Function * caller) const;

  /// Callees recorded for one call site (empty if none)
  [[nodiscard]] const std::vector<const Function *> & site_callees(
    const CallInstruction * site) const;

  /// True if every edge of `other` is an edge of this graph
  [[nodiscard]] bool contains(const CallGraph & other) const;

  [[nodiscard]] const std::vector<const Function *> & nodes() const noexcept { return nodes_; }
  [[nodiscard]] const std::vector<CallEdge> & edges() const noexcept { return edges_; }
  [[nodiscard]] size_t node_count() const noexcept { return nodes_.size(); }
  [[nodiscard]] size_t edge_count() const noexcept { return edges_.size(); }

private:
  std::vector<const Function *> nodes_;
  std::unordered_set<const Function *> node_set_;
  std::vector<CallEdge> edges_;
  std::unordered_map<const CallInstruction *, std::vector<const Function *>> site_callees_;
};

/**
 * Sorted, distinct `caller -> callee` strings using Function::rel_string().
 *
 * This is the comparison format of the scenario tests.
 */
[[nodiscard]] std::vector<std::string> call_graph_edge_strings(const CallGraph & graph);

}  // namespace typeflow
