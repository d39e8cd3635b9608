// typeflow/report/json_report.cpp - JSON report implementation
//
#include "typeflow/report/json_report.hpp"

#include <string>
#include <string_view>

namespace typeflow
{
namespace
{

using nlohmann::json;

// ============================================================================
// Helper functions
// ============================================================================

std::string_view kind_name(FlowNodeKind k)
{
  switch (k) {
    case FlowNodeKind::Constant:
      return "Constant";
    case FlowNodeKind::Pointer:
      return "Pointer";
    case FlowNodeKind::MapKey:
      return "MapKey";
    case FlowNodeKind::MapValue:
      return "MapValue";
    case FlowNodeKind::SliceElem:
      return "SliceElem";
    case FlowNodeKind::ChannelElem:
      return "ChannelElem";
    case FlowNodeKind::Field:
      return "Field";
    case FlowNodeKind::Global:
      return "Global";
    case FlowNodeKind::Local:
      return "Local";
    case FlowNodeKind::IndexedLocal:
      return "IndexedLocal";
    case FlowNodeKind::Function:
      return "Function";
    case FlowNodeKind::ResultVar:
      return "ResultVar";
    case FlowNodeKind::NestedPtrInterface:
      return "NestedPtrInterface";
    case FlowNodeKind::NestedPtrFunction:
      return "NestedPtrFunction";
    case FlowNodeKind::PanicArg:
      return "PanicArg";
    case FlowNodeKind::RecoverReturn:
      return "RecoverReturn";
  }
  return "Unknown";
}

std::string_view severity_name(Severity s)
{
  switch (s) {
    case Severity::Error:
      return "error";
    case Severity::Warning:
      return "warning";
  }
  return "error";
}

json j_prop_type(const PropType & p)
{
  json j{{"type", p.type != nullptr ? p.type->to_string() : std::string("?")}};
  if (p.function != nullptr) {
    j["function"] = p.function->rel_string();
  }
  return j;
}

json j_pos(const SourcePos & pos)
{
  if (!pos.is_valid()) {
    return nullptr;
  }
  return json{
    {"file", std::string(pos.get_file())}, {"line", pos.get_line()}, {"column", pos.get_column()}};
}

json j_diagnostic(const Diagnostic & d)
{
  json j{
    {"severity", severity_name(d.severity)},
    {"code", d.code},
    {"message", d.message},
    {"pos", j_pos(d.pos)},
    {"notes", d.notes}};
  if (d.help_message) {
    j["help"] = *d.help_message;
  }
  return j;
}

json j_stats(const AnalysisStats & s)
{
  return json{
    {"functions", s.functions},
    {"flow_nodes", s.flow_nodes},
    {"flow_edges", s.flow_edges},
    {"dynamic_sites", s.dynamic_sites},
    {"resolved_sites", s.resolved_sites},
    {"rounds", s.rounds},
    {"baseline_edges", s.baseline_edges},
    {"result_edges", s.result_edges}};
}

}  // namespace

// ============================================================================
// Public API
// ============================================================================

json call_graph_to_json(const CallGraph & graph)
{
  json nodes = json::array();
  for (const Function * fn : graph.nodes()) {
    nodes.push_back(fn->rel_string());
  }

  json edges = json::array();
  for (const CallEdge & e : graph.edges()) {
    json edge{{"caller", e.caller->rel_string()}, {"callee", e.callee->rel_string()}};
    edge["site"] = e.site->to_string();
    edge["pos"] = j_pos(e.site->get_pos());
    edges.push_back(std::move(edge));
  }

  return json{{"nodes", std::move(nodes)}, {"edges", std::move(edges)}};
}

json flow_graph_to_json(const FlowGraph & graph, const TypeMap * types)
{
  json nodes = json::array();
  for (NodeId id = 0; id < graph.node_count(); ++id) {
    const FlowNode & n = graph.node(id);
    json node{{"id", id}, {"kind", kind_name(n.kind())}, {"label", n.to_string()}};
    node["succs"] = graph.successor_ids(id);

    if (types != nullptr) {
      json set = json::array();
      for (const PropType & p : types->types(id)) {
        set.push_back(j_prop_type(p));
      }
      node["types"] = std::move(set);
    }
    nodes.push_back(std::move(node));
  }

  return json{
    {"node_count", graph.node_count()},
    {"edge_count", graph.edge_count()},
    {"nodes", std::move(nodes)}};
}

json analysis_result_to_json(const AnalysisResult & result)
{
  json diags = json::array();
  for (const Diagnostic & d : result.diagnostics) {
    diags.push_back(j_diagnostic(d));
  }

  json j{
    {"success", result.success},
    {"diagnostics", std::move(diags)},
    {"stats", j_stats(result.stats)},
    {"call_graph", call_graph_to_json(result.call_graph)}};
  if (result.flow_graph) {
    j["flow_graph"] = flow_graph_to_json(*result.flow_graph, result.types.get());
  }
  return j;
}

}  // namespace typeflow
