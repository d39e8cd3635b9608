// typeflow/report/json_report.hpp - JSON reports for analysis results
//
// Serializes call graphs, flow graphs and analysis results as
// nlohmann::json documents for external tooling.
//
#pragma once

#include <nlohmann/json.hpp>

#include "typeflow/callgraph/callgraph.hpp"
#include "typeflow/driver/analyzer.hpp"
#include "typeflow/vta/graph.hpp"
#include "typeflow/vta/propagation.hpp"

namespace typeflow
{

/**
 * Serialize a call graph.
 *
 * `{"nodes": [name...], "edges": [{"caller", "callee", "site"}...]}` with
 * functions named by Function::rel_string().
 */
[[nodiscard]] nlohmann::json call_graph_to_json(const CallGraph & graph);

/**
 * Serialize a flow graph.
 *
 * Nodes are listed in id order with their kind, rendering and successor
 * ids. When `types` is given each node also carries its type set.
 */
[[nodiscard]] nlohmann::json flow_graph_to_json(
  const FlowGraph & graph, const TypeMap * types = nullptr);

/// Serialize the result of Analyzer, including diagnostics and statistics
[[nodiscard]] nlohmann::json analysis_result_to_json(const AnalysisResult & result);

}  // namespace typeflow
