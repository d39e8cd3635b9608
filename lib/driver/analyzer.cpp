// typeflow/driver/analyzer.cpp - Analysis driver implementation
//
#include "typeflow/driver/analyzer.hpp"

#include <vector>

#include <gsl/gsl>

#include "typeflow/basic/log.hpp"
#include "typeflow/callgraph/cha.hpp"
#include "typeflow/vta/call_resolver.hpp"
#include "typeflow/vta/graph_builder.hpp"

namespace typeflow
{

void Analyzer::apply_log_level(const AnalysisOptions & options, DiagnosticBag & diags)
{
  if (!is_valid_log_level(options.log_level)) {
    TYPEFLOW_LOG_WARN("ignoring unknown log level '{}'", options.log_level);
    diags.report_warning(SourcePos{}, "unknown log level '" + options.log_level + "' ignored")
      .with_code(k_diag_config_error);
    return;
  }
  spdlog::set_level(spdlog::level::from_str(options.log_level));
}

AnalysisResult Analyzer::analyze(const Program & program, const AnalysisOptions & options)
{
  const CallGraph cha = build_cha_call_graph(program);
  const std::vector<Function *> all = program.all_functions();
  const std::vector<const Function *> functions(all.begin(), all.end());
  return analyze_functions(program, functions, cha, options);
}

AnalysisResult Analyzer::analyze_functions(
  const Program & program, gsl::span<const Function * const> functions, const CallGraph & initial,
  const AnalysisOptions & options)
{
  AnalysisResult result;
  const auto restore_level = gsl::finally(
    [previous = spdlog::get_level()] { spdlog::set_level(previous); });
  apply_log_level(options, result.diagnostics);
  result.stats.functions = functions.size();
  result.stats.baseline_edges = initial.edge_count();

  TYPEFLOW_LOG_DEBUG("analyzing {} functions", functions.size());

  // Flow graph
  FlowGraphBuildResult built =
    build_flow_graph(program, functions, initial, result.diagnostics, options.build_threads);
  result.flow_graph = std::make_unique<FlowGraph>(std::move(built.graph));
  result.stats.flow_nodes = result.flow_graph->node_count();
  result.stats.flow_edges = result.flow_graph->edge_count();
  result.stats.dynamic_sites = built.dynamic_sites.size();
  if (!built.success) {
    return result;
  }

  // Propagation
  TypePropagator propagator(*result.flow_graph, result.diagnostics);
  propagator.set_round_limit(options.round_limit);
  result.types = propagator.run();
  result.stats.rounds = propagator.rounds();
  if (!result.types) {
    return result;
  }

  // Resolution
  CallResolver resolver(initial, *result.types);
  resolver.set_preserve_baseline(options.preserve_baseline_edges);
  result.call_graph = resolver.resolve(functions, built.dynamic_sites);
  result.stats.resolved_sites = resolver.resolved_sites();
  result.stats.result_edges = result.call_graph.edge_count();

  result.success = !result.diagnostics.has_errors();
  TYPEFLOW_LOG_DEBUG(
    "analysis finished: {} -> {} call edges", result.stats.baseline_edges,
    result.stats.result_edges);
  return result;
}

}  // namespace typeflow
