// typeflow/vta/propagation.hpp - Type propagation over the flow graph
//
// Computes, for every node, the set of concrete types that can reach it:
// each node starts with its own type (unless it is abstract) and the sets
// are closed under the edges of the graph.
//
#pragma once

#include <cstddef>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <unordered_set>
#include <utility>
#include <vector>

#include "typeflow/basic/diagnostic.hpp"
#include "typeflow/vta/graph.hpp"

namespace typeflow
{

// ============================================================================
// Propagation Types
// ============================================================================

/**
 * A concrete type reaching a node.
 *
 * `function` is set when the type originates at a Function node, so that
 * calls through function values resolve to that exact function.
 */
struct PropType
{
  const Type * type = nullptr;
  const Function * function = nullptr;

  bool operator==(const PropType & o) const noexcept
  {
    return type == o.type && function == o.function;
  }
  bool operator!=(const PropType & o) const noexcept { return !(*this == o); }

  /// `*P.C`, or `func() [P.f$1]` when a function is attached
  [[nodiscard]] std::string to_string() const;
};

struct PropTypeHash
{
  size_t operator()(const PropType & p) const noexcept
  {
    const size_t a = std::hash<const void *>{}(p.type);
    const size_t b = std::hash<const void *>{}(p.function);
    return a ^ (b + 0x9e3779b97f4a7c15ULL + (a << 6) + (a >> 2));
  }
};

// ============================================================================
// TypeMap
// ============================================================================

/**
 * Per-node type sets, indexed like the FlowGraph they were computed on.
 *
 * Sets keep insertion order. The graph must outlive the map.
 */
class TypeMap
{
public:
  explicit TypeMap(const FlowGraph & graph);

  TypeMap(const TypeMap &) = delete;
  TypeMap & operator=(const TypeMap &) = delete;

  /// Types reaching `node`; empty for unknown nodes
  [[nodiscard]] const std::vector<PropType> & types(const FlowNode & node) const;
  [[nodiscard]] const std::vector<PropType> & types(NodeId id) const { return sets_[id]; }

  [[nodiscard]] bool contains(NodeId id, const PropType & p) const
  {
    return index_[id].count(p) != 0;
  }

  /// @return true if `p` was not in the set of `id` yet
  bool insert(NodeId id, const PropType & p);

  /// Sum of all set sizes
  [[nodiscard]] size_t total_size() const noexcept { return total_; }

  [[nodiscard]] const FlowGraph & graph() const noexcept { return graph_; }

private:
  const FlowGraph & graph_;
  std::vector<std::vector<PropType>> sets_;
  std::vector<std::unordered_set<PropType, PropTypeHash>> index_;
  size_t total_ = 0;
};

// ============================================================================
// TypePropagator
// ============================================================================

/**
 * Round-based fixpoint over a FlowGraph.
 *
 * Each round pushes only the types added in the previous round along the
 * outgoing edges, so type sets grow monotonically and the number of rounds
 * is bounded by `node_count + 1`. A type entering an interface-typed node
 * (or a type-parameter node, via its constraint) is kept only if it
 * implements that interface.
 */
class TypePropagator
{
public:
  using RoundObserver = std::function<void(size_t round, const TypeMap & types)>;

  TypePropagator(const FlowGraph & graph, DiagnosticBag & diags);

  /// Explicit round bound; 0 selects `node_count + 1`
  void set_round_limit(size_t limit) noexcept { round_limit_ = limit; }

  /// Called after every round with the current map
  void set_round_observer(RoundObserver observer) { observer_ = std::move(observer); }

  /**
   * Run to fixpoint.
   * @return the type map, or nullptr if the round bound was exceeded
   */
  std::unique_ptr<TypeMap> run();

  /// Rounds executed by the last run()
  [[nodiscard]] size_t rounds() const noexcept { return rounds_; }

  /// Whether `p` may enter `node` (interface filtering)
  [[nodiscard]] bool admits(const FlowNode & node, const PropType & p);

private:
  [[nodiscard]] bool implements_cached(const Type * t, const Type * iface);

  const FlowGraph & graph_;
  DiagnosticBag & diags_;
  size_t round_limit_ = 0;
  RoundObserver observer_;
  size_t rounds_ = 0;

  std::map<std::pair<const Type *, const Type *>, bool> implements_cache_;
};

/// Initial type of a node, or an empty PropType for abstract nodes
[[nodiscard]] PropType initial_type(const FlowNode & node) noexcept;

}  // namespace typeflow
