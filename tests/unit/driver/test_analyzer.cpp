#include <gtest/gtest.h>

#include <string>
#include <vector>

#include <spdlog/spdlog.h>

#include "typeflow/callgraph/cha.hpp"
#include "typeflow/driver/analyzer.hpp"
#include "typeflow/ir/function_builder.hpp"
#include "typeflow/test_support/program_fixtures.hpp"

using namespace typeflow;

// ============================================================================
// Pipeline
// ============================================================================

TEST(DriverAnalyzer, AnalyzeFillsResultAndStats)
{
  auto fx = test_support::make_dispatch_fixture();
  AnalysisResult r = Analyzer::analyze(*fx.program);

  ASSERT_TRUE(r.success);
  EXPECT_TRUE(r.diagnostics.empty());
  ASSERT_NE(r.flow_graph, nullptr);
  ASSERT_NE(r.types, nullptr);

  EXPECT_EQ(r.stats.functions, fx.program->function_count());
  EXPECT_EQ(r.stats.flow_nodes, r.flow_graph->node_count());
  EXPECT_EQ(r.stats.flow_edges, r.flow_graph->edge_count());
  EXPECT_EQ(r.stats.dynamic_sites, 2U);
  EXPECT_EQ(r.stats.resolved_sites, 2U);
  EXPECT_GT(r.stats.rounds, 0U);
  EXPECT_EQ(r.stats.result_edges, r.call_graph.edge_count());

  // Baseline edges are preserved by default
  EXPECT_TRUE(r.call_graph.has_edge(fx.g, fx.d_f));
}

TEST(DriverAnalyzer, PureModeDropsUnreachableTargets)
{
  auto fx = test_support::make_dispatch_fixture();
  AnalysisOptions options;
  options.preserve_baseline_edges = false;
  options.build_threads = 3;

  AnalysisResult r = Analyzer::analyze(*fx.program, options);
  ASSERT_TRUE(r.success);

  const std::vector<std::string> expected = {
    "f -> f$1",
    "f -> h",
    "g -> (C).f",
  };
  EXPECT_EQ(call_graph_edge_strings(r.call_graph), expected);
  EXPECT_LT(r.stats.result_edges, r.stats.baseline_edges);
}

TEST(DriverAnalyzer, AnalyzeFunctionsUsesCallerBaseline)
{
  auto fx = test_support::make_dispatch_fixture();
  const CallGraph initial = build_static_call_graph(*fx.program);
  const std::vector<const Function *> fs{fx.g, fx.f};

  AnalysisOptions options;
  options.preserve_baseline_edges = false;
  AnalysisResult r = Analyzer::analyze_functions(*fx.program, fs, initial, options);

  ASSERT_TRUE(r.success);
  EXPECT_EQ(r.stats.functions, 2U);
  EXPECT_EQ(r.stats.baseline_edges, 1U);
  EXPECT_TRUE(r.call_graph.has_edge(fx.g, fx.c_f));
  EXPECT_TRUE(r.call_graph.has_edge(fx.f, fx.h));
}

// ============================================================================
// Failures
// ============================================================================

TEST(DriverAnalyzer, MalformedProgramFails)
{
  Program prog;
  Package * pkg = prog.create_package("P");
  const Type * i = prog.types().int_type();
  Function * fn = prog.create_function(pkg, "bad", prog.types().get_signature({i}, {}));
  Parameter * x = fn->add_param("x", i);
  FunctionBuilder b(prog, fn);
  b.lookup(x, x);
  b.ret({});

  AnalysisResult r = Analyzer::analyze(prog);
  EXPECT_FALSE(r.success);
  EXPECT_TRUE(r.diagnostics.has_code(k_diag_malformed_instruction));
  EXPECT_EQ(r.types, nullptr);
  EXPECT_EQ(r.call_graph.edge_count(), 0U);
}

TEST(DriverAnalyzer, RoundLimitFailureIsReported)
{
  // const -> boxed -> slot -> loaded takes three rounds
  Program prog;
  Package * pkg = prog.create_package("P");
  TypeContext & types = prog.types();
  const Type * unit_sig = types.get_signature({}, {});
  const Type * iface = types.new_named("P", "I", types.get_interface({{"m", unit_sig}}));
  Type * c = types.new_named("P", "C", types.int_type());
  FunctionBuilder(prog, prog.create_method(pkg, c, "m", unit_sig, false)).ret({});

  Function * fn = prog.create_function(pkg, "f", unit_sig);
  {
    FunctionBuilder b(prog, fn);
    auto * slot = b.alloc(iface);
    b.store(slot, b.make_interface(iface, prog.create_const(c, "0")));
    b.deref(slot);
    b.ret({});
  }

  AnalysisOptions options;
  options.round_limit = 1;
  AnalysisResult r = Analyzer::analyze(prog, options);
  EXPECT_FALSE(r.success);
  EXPECT_TRUE(r.diagnostics.has_code(k_diag_round_bound));
  EXPECT_NE(r.flow_graph, nullptr);
  EXPECT_EQ(r.types, nullptr);

  options.round_limit = 0;
  AnalysisResult ok = Analyzer::analyze(prog, options);
  EXPECT_TRUE(ok.success);
  EXPECT_EQ(ok.stats.rounds, 3U);
}

TEST(DriverAnalyzer, UnknownLogLevelIsAWarning)
{
  auto fx = test_support::make_dispatch_fixture();
  AnalysisOptions options;
  options.log_level = "loud";

  AnalysisResult r = Analyzer::analyze(*fx.program, options);
  EXPECT_TRUE(r.success);
  ASSERT_EQ(r.diagnostics.size(), 1U);
  EXPECT_FALSE(r.diagnostics.all()[0].is_error());
  EXPECT_EQ(r.diagnostics.all()[0].code, k_diag_config_error);
}

TEST(DriverAnalyzer, LogLevelIsRestoredAfterRun)
{
  auto fx = test_support::make_dispatch_fixture();
  const auto before = spdlog::get_level();
  AnalysisOptions options;
  options.log_level = before == spdlog::level::trace ? "critical" : "trace";

  AnalysisResult r = Analyzer::analyze(*fx.program, options);
  EXPECT_TRUE(r.success);
  EXPECT_EQ(spdlog::get_level(), before);
}
