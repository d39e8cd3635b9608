// typeflow/driver/analyzer.hpp - Analysis driver
//
// Single entry point for the VTA pipeline:
// baseline call graph -> flow graph -> type propagation -> call resolution.
//
#pragma once

#include <cstddef>
#include <memory>

#include <gsl/span>

#include "typeflow/basic/diagnostic.hpp"
#include "typeflow/callgraph/callgraph.hpp"
#include "typeflow/driver/analysis_options.hpp"
#include "typeflow/ir/program.hpp"
#include "typeflow/vta/graph.hpp"
#include "typeflow/vta/propagation.hpp"

namespace typeflow
{

// ============================================================================
// Analysis Result
// ============================================================================

struct AnalysisStats
{
  size_t functions = 0;
  size_t flow_nodes = 0;
  size_t flow_edges = 0;
  size_t dynamic_sites = 0;
  size_t resolved_sites = 0;
  size_t rounds = 0;
  size_t baseline_edges = 0;
  size_t result_edges = 0;
};

struct AnalysisResult
{
  /// Whether the analysis completed (no errors)
  bool success = false;

  /// Collected diagnostics
  DiagnosticBag diagnostics;

  /// Refined call graph (empty unless success)
  CallGraph call_graph;

  /// Flow graph, kept for introspection and reports
  std::unique_ptr<FlowGraph> flow_graph;

  /// Type sets over `flow_graph` (null if propagation did not finish)
  std::unique_ptr<TypeMap> types;

  AnalysisStats stats;
};

// ============================================================================
// Analyzer
// ============================================================================

/**
 * Driver orchestrating the VTA pipeline.
 *
 * The pipeline consists of:
 * 1. Baseline call graph (CHA, for analyze())
 * 2. Flow graph construction, optionally on several threads
 * 3. Type propagation to fixpoint
 * 4. Call resolution
 *
 * AnalysisOptions::log_level is applied to the default spdlog logger for
 * the duration of a run only.
 */
class Analyzer
{
public:
  /**
   * Analyze every function of `program` against its CHA call graph.
   *
   * @param program Program to analyze
   * @param options Analysis options
   * @return AnalysisResult with success status and diagnostics
   */
  [[nodiscard]] static AnalysisResult analyze(
    const Program & program, const AnalysisOptions & options = {});

  /**
   * Analyze a chosen function set against a caller-supplied baseline.
   *
   * Interprocedural flows follow the edges of `initial`; only sites of
   * `functions` are resolved.
   */
  [[nodiscard]] static AnalysisResult analyze_functions(
    const Program & program, gsl::span<const Function * const> functions,
    const CallGraph & initial, const AnalysisOptions & options = {});

private:
  /// Apply AnalysisOptions::log_level to the default spdlog logger.
  /// analyze_functions() restores the previous level before returning.
  static void apply_log_level(const AnalysisOptions & options, DiagnosticBag & diags);
};

}  // namespace typeflow
