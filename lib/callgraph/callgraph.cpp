// typeflow/callgraph/callgraph.cpp - CallGraph implementation
//
#include "typeflow/callgraph/callgraph.hpp"

#include <algorithm>

namespace typeflow
{

void CallGraph::add_node(const Function * fn)
{
  if (fn != nullptr && node_set_.insert(fn).second) {
    nodes_.push_back(fn);
  }
}

bool CallGraph::add_edge(const CallInstruction * site, const Function * callee)
{
  if (site == nullptr || callee == nullptr) {
    return false;
  }

  auto & callees = site_callees_[site];
  if (std::find(callees.begin(), callees.end(), callee) != callees.end()) {
    return false;
  }
  callees.push_back(callee);

  const Function * caller = site->get_parent();
  add_node(caller);
  add_node(callee);
  edges_.push_back(CallEdge{caller, site, callee});
  return true;
}

void CallGraph::merge(const CallGraph & other)
{
  for (const Function * fn : other.nodes_) {
    add_node(fn);
  }
  for (const auto & e : other.edges_) {
    add_edge(e.site, e.callee);
  }
}

bool CallGraph::has_edge(const Function * caller, const Function * callee) const
{
  return std::any_of(edges_.begin(), edges_.end(), [&](const CallEdge & e) {
    return e.caller == caller && e.callee == callee;
  });
}

std::vector<const Function *> CallGraph::callees(const Function * caller) const
{
  std::vector<const Function *> out;
  for (const auto & e : edges_) {
    if (e.caller == caller && std::find(out.begin(), out.end(), e.callee) == out.end()) {
      out.push_back(e.callee);
    }
  }
  return out;
}

const std::vector<const Function *> & CallGraph::site_callees(const CallInstruction * site) const
{
  static const std::vector<const Function *> k_empty;
  auto it = site_callees_.find(site);
  return it != site_callees_.end() ? it->second : k_empty;
}

bool CallGraph::contains(const CallGraph & other) const
{
  return std::all_of(other.edges_.begin(), other.edges_.end(), [&](const CallEdge & e) {
    const auto & mine = site_callees(e.site);
    return std::find(mine.begin(), mine.end(), e.callee) != mine.end();
  });
}

std::vector<std::string> call_graph_edge_strings(const CallGraph & graph)
{
  std::vector<std::string> out;
  out.reserve(graph.edge_count());
  for (const auto & e : graph.edges()) {
    out.push_back(e.caller->rel_string() + " -> " + e.callee->rel_string());
  }
  std::sort(out.begin(), out.end());
  out.erase(std::unique(out.begin(), out.end()), out.end());
  return out;
}

}  // namespace typeflow
