// typeflow/vta/graph.cpp - FlowGraph implementation
//
#include "typeflow/vta/graph.hpp"

#include <algorithm>

namespace typeflow
{

NodeId FlowGraph::add_node(const FlowNode & node)
{
  auto it = ids_.find(node);
  if (it != ids_.end()) {
    return it->second;
  }

  const auto id = static_cast<NodeId>(nodes_.size());
  nodes_.push_back(node);
  succs_.emplace_back();
  ids_.emplace(node, id);
  return id;
}

bool FlowGraph::add_edge(const FlowNode & from, const FlowNode & to)
{
  const NodeId f = add_node(from);
  const NodeId t = add_node(to);
  return add_edge(f, t);
}

bool FlowGraph::add_edge(NodeId from, NodeId to)
{
  if (!edge_keys_.insert(edge_key(from, to)).second) {
    return false;
  }
  succs_[from].push_back(to);
  return true;
}

void FlowGraph::merge(const FlowGraph & other)
{
  // Nodes first so that isolated nodes of `other` survive the merge
  for (const auto & n : other.nodes_) {
    add_node(n);
  }
  other.for_each_edge([this](const FlowNode & from, const FlowNode & to) { add_edge(from, to); });
}

std::optional<NodeId> FlowGraph::find(const FlowNode & node) const
{
  auto it = ids_.find(node);
  if (it == ids_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::vector<FlowNode> FlowGraph::successors(const FlowNode & node) const
{
  std::vector<FlowNode> out;
  if (auto id = find(node)) {
    out.reserve(succs_[*id].size());
    for (NodeId s : succs_[*id]) {
      out.push_back(nodes_[s]);
    }
  }
  return out;
}

bool FlowGraph::has_edge(const FlowNode & from, const FlowNode & to) const
{
  auto f = find(from);
  auto t = find(to);
  return f && t && edge_keys_.count(edge_key(*f, *t)) != 0;
}

std::vector<std::string> FlowGraph::dump_lines() const
{
  std::vector<std::string> lines;
  lines.reserve(nodes_.size());
  for (NodeId id = 0; id < nodes_.size(); ++id) {
    std::vector<std::string> succ;
    succ.reserve(succs_[id].size());
    for (NodeId s : succs_[id]) {
      succ.push_back(nodes_[s].to_string());
    }
    std::sort(succ.begin(), succ.end());

    std::string line = nodes_[id].to_string() + " -> ";
    for (size_t i = 0; i < succ.size(); ++i) {
      if (i > 0) line += ", ";
      line += succ[i];
    }
    lines.push_back(std::move(line));
  }
  return lines;
}

}  // namespace typeflow
