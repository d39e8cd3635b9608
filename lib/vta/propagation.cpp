// typeflow/vta/propagation.cpp - Fixpoint computation of type sets
//
#include "typeflow/vta/propagation.hpp"

#include "typeflow/basic/log.hpp"
#include "typeflow/ir/type_utils.hpp"

namespace typeflow
{

std::string PropType::to_string() const
{
  std::string s = type != nullptr ? type->to_string() : "?";
  if (function != nullptr) {
    s += " [" + function->rel_string() + "]";
  }
  return s;
}

// ============================================================================
// TypeMap
// ============================================================================

TypeMap::TypeMap(const FlowGraph & graph)
: graph_(graph), sets_(graph.node_count()), index_(graph.node_count())
{
}

const std::vector<PropType> & TypeMap::types(const FlowNode & node) const
{
  static const std::vector<PropType> k_empty;
  auto id = graph_.find(node);
  return id ? sets_[*id] : k_empty;
}

bool TypeMap::insert(NodeId id, const PropType & p)
{
  if (!index_[id].insert(p).second) {
    return false;
  }
  sets_[id].push_back(p);
  ++total_;
  return true;
}

// ============================================================================
// Seeds
// ============================================================================

PropType initial_type(const FlowNode & node) noexcept
{
  if (node.is_sentinel() || node.is_nested_ptr()) {
    return {};
  }
  const Type * t = node.type();
  if (t == nullptr || is_interface(t)) {
    return {};
  }
  if (const auto * fn = node.get_if<FunctionNode>()) {
    return PropType{t, fn->function};
  }
  return PropType{t, nullptr};
}

// ============================================================================
// TypePropagator
// ============================================================================

TypePropagator::TypePropagator(const FlowGraph & graph, DiagnosticBag & diags)
: graph_(graph), diags_(diags)
{
}

bool TypePropagator::implements_cached(const Type * t, const Type * iface)
{
  auto key = std::make_pair(t, iface);
  auto it = implements_cache_.find(key);
  if (it != implements_cache_.end()) {
    return it->second;
  }
  const bool result = implements(t, iface);
  implements_cache_.emplace(key, result);
  return result;
}

bool TypePropagator::admits(const FlowNode & node, const PropType & p)
{
  const Type * t = node.type();
  if (t == nullptr || !is_interface(t)) {
    return true;
  }
  return implements_cached(p.type, t);
}

std::unique_ptr<TypeMap> TypePropagator::run()
{
  const size_t n = graph_.node_count();
  const size_t limit = round_limit_ != 0 ? round_limit_ : n + 1;
  auto types = std::make_unique<TypeMap>(graph_);
  rounds_ = 0;

  // Round 0: seeds
  std::vector<std::vector<PropType>> delta(n);
  for (NodeId id = 0; id < n; ++id) {
    const PropType seed = initial_type(graph_.node(id));
    if (seed.type != nullptr && types->insert(id, seed)) {
      delta[id].push_back(seed);
    }
  }

  bool changed = true;
  while (changed) {
    changed = false;
    std::vector<std::vector<PropType>> next(n);

    for (NodeId from = 0; from < n; ++from) {
      if (delta[from].empty()) continue;
      for (NodeId to : graph_.successor_ids(from)) {
        const FlowNode & target = graph_.node(to);
        for (const PropType & p : delta[from]) {
          if (admits(target, p) && types->insert(to, p)) {
            next[to].push_back(p);
            changed = true;
          }
        }
      }
    }

    if (!changed) {
      break;
    }
    ++rounds_;
    if (rounds_ > limit) {
      diags_.report_error(SourcePos{}, "type propagation did not converge")
        .with_code(k_diag_round_bound)
        .with_note(
          "exceeded " + std::to_string(limit) + " rounds on " + std::to_string(n) + " nodes");
      TYPEFLOW_LOG_ERROR("type propagation exceeded {} rounds", limit);
      return nullptr;
    }

    delta = std::move(next);
    if (observer_) {
      observer_(rounds_, *types);
    }
  }

  TYPEFLOW_LOG_DEBUG(
    "type propagation: {} rounds, {} types over {} nodes", rounds_, types->total_size(), n);
  return types;
}

}  // namespace typeflow
