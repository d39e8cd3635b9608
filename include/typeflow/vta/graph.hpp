// typeflow/vta/graph.hpp - Type-propagation (flow) graph
//
// Directed, unlabeled graph over FlowNodes. Nodes are numbered densely in
// insertion order; successor lists keep insertion order and are
// deduplicated. There is no removal: the graph is filled once by the
// builder and read by the later phases.
//
#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "typeflow/vta/node.hpp"

namespace typeflow
{

/// Dense node index within one FlowGraph
using NodeId = uint32_t;

class FlowGraph
{
public:
  FlowGraph() = default;

  // Non-copyable, movable
  FlowGraph(const FlowGraph &) = delete;
  FlowGraph & operator=(const FlowGraph &) = delete;
  FlowGraph(FlowGraph &&) = default;
  FlowGraph & operator=(FlowGraph &&) = default;

  // ===========================================================================
  // Construction
  // ===========================================================================

  /// Intern a node, returning its id (existing or new)
  NodeId add_node(const FlowNode & node);

  /**
   * Add the edge `from -> to`, creating both nodes when absent.
   * @return true if the edge is new
   */
  bool add_edge(const FlowNode & from, const FlowNode & to);
  bool add_edge(NodeId from, NodeId to);

  /// Union `other` into this graph; edge insertion is order-independent
  void merge(const FlowGraph & other);

  // ===========================================================================
  // Queries
  // ===========================================================================

  [[nodiscard]] std::optional<NodeId> find(const FlowNode & node) const;

  [[nodiscard]] const FlowNode & node(NodeId id) const { return nodes_[id]; }

  /// Successors of `node`; empty when the node is unknown
  [[nodiscard]] std::vector<FlowNode> successors(const FlowNode & node) const;

  [[nodiscard]] const std::vector<NodeId> & successor_ids(NodeId id) const { return succs_[id]; }

  [[nodiscard]] bool has_edge(const FlowNode & from, const FlowNode & to) const;

  [[nodiscard]] size_t node_count() const noexcept { return nodes_.size(); }
  [[nodiscard]] size_t edge_count() const noexcept { return edge_keys_.size(); }

  [[nodiscard]] const std::vector<FlowNode> & nodes() const noexcept { return nodes_; }

  /// Call `fn(from, to)` for every edge, grouped by source in id order
  template <typename Fn>
  void for_each_edge(Fn && fn) const
  {
    for (NodeId from = 0; from < succs_.size(); ++from) {
      for (NodeId to : succs_[from]) {
        fn(nodes_[from], nodes_[to]);
      }
    }
  }

  /**
   * Render each node as `node -> succ_1, ..., succ_n`.
   *
   * Successors are sorted by their string form; nodes keep id order.
   * Nodes without successors render as `node -> `.
   */
  [[nodiscard]] std::vector<std::string> dump_lines() const;

private:
  [[nodiscard]] static uint64_t edge_key(NodeId from, NodeId to) noexcept
  {
    return (static_cast<uint64_t>(from) << 32U) | to;
  }

  std::vector<FlowNode> nodes_;
  std::unordered_map<FlowNode, NodeId, FlowNodeHash> ids_;
  std::vector<std::vector<NodeId>> succs_;
  std::unordered_set<uint64_t> edge_keys_;
};

}  // namespace typeflow
