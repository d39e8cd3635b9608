#include <gtest/gtest.h>

#include <string>

#include "typeflow/callgraph/cha.hpp"
#include "typeflow/report/json_report.hpp"
#include "typeflow/test_support/program_fixtures.hpp"

using namespace typeflow;
using nlohmann::json;

namespace
{

const json * find_edge(const json & edges, const std::string & caller, const std::string & callee)
{
  for (const auto & e : edges) {
    if (e.at("caller") == caller && e.at("callee") == callee) {
      return &e;
    }
  }
  return nullptr;
}

}  // namespace

// ============================================================================
// Call Graph
// ============================================================================

TEST(ReportJson, CallGraphNodesAndEdges)
{
  auto fx = test_support::make_dispatch_fixture();
  const CallGraph cha = build_cha_call_graph(*fx.program);
  const json j = call_graph_to_json(cha);

  ASSERT_TRUE(j.at("nodes").is_array());
  ASSERT_TRUE(j.at("edges").is_array());
  EXPECT_EQ(j.at("nodes").size(), cha.node_count());
  EXPECT_EQ(j.at("edges").size(), cha.edge_count());

  const json * invoke = find_edge(j.at("edges"), "g", "(C).f");
  ASSERT_NE(invoke, nullptr);
  EXPECT_EQ(invoke->at("site"), fx.invoke_site->to_string());
  EXPECT_EQ(invoke->at("pos").at("file"), "p.go");
  EXPECT_EQ(invoke->at("pos").at("line"), 8);
  EXPECT_EQ(invoke->at("pos").at("column"), 26);
}

TEST(ReportJson, EmptyCallGraph)
{
  const json j = call_graph_to_json(CallGraph{});
  EXPECT_TRUE(j.at("nodes").empty());
  EXPECT_TRUE(j.at("edges").empty());
}

// ============================================================================
// Analysis Result
// ============================================================================

TEST(ReportJson, SuccessfulAnalysis)
{
  auto fx = test_support::make_dispatch_fixture();
  AnalysisOptions options;
  options.preserve_baseline_edges = false;
  const AnalysisResult r = Analyzer::analyze(*fx.program, options);
  ASSERT_TRUE(r.success);

  const json j = analysis_result_to_json(r);
  EXPECT_EQ(j.at("success"), true);
  EXPECT_TRUE(j.at("diagnostics").empty());
  EXPECT_EQ(j.at("stats").at("dynamic_sites"), 2);
  EXPECT_EQ(j.at("stats").at("result_edges"), r.call_graph.edge_count());
  EXPECT_EQ(j.at("call_graph").at("edges").size(), 3U);

  // Flow graph nodes carry their type sets
  const json & fg = j.at("flow_graph");
  EXPECT_EQ(fg.at("node_count"), r.flow_graph->node_count());
  ASSERT_EQ(fg.at("nodes").size(), r.flow_graph->node_count());

  bool saw_closure = false;
  for (const auto & node : fg.at("nodes")) {
    ASSERT_TRUE(node.contains("types"));
    if (node.at("kind") != "Function") continue;
    for (const auto & t : node.at("types")) {
      if (t.contains("function") && t.at("function") == "f$1") {
        saw_closure = true;
      }
    }
  }
  EXPECT_TRUE(saw_closure);
}

TEST(ReportJson, FlowGraphWithoutTypes)
{
  auto fx = test_support::make_dispatch_fixture();
  const AnalysisResult r = Analyzer::analyze(*fx.program);
  ASSERT_NE(r.flow_graph, nullptr);

  const json j = flow_graph_to_json(*r.flow_graph);
  EXPECT_EQ(j.at("edge_count"), r.flow_graph->edge_count());
  for (const auto & node : j.at("nodes")) {
    EXPECT_FALSE(node.contains("types"));
    EXPECT_TRUE(node.at("succs").is_array());
  }
}

TEST(ReportJson, FailedAnalysisCarriesDiagnostics)
{
  Program prog;
  Package * pkg = prog.create_package("P");
  const Type * i = prog.types().int_type();
  Function * fn = prog.create_function(pkg, "bad", prog.types().get_signature({i}, {}));
  Parameter * x = fn->add_param("x", i);
  {
    FunctionBuilder b(prog, fn);
    b.set_pos("bad.go", 3, 7);
    b.lookup(x, x);
    b.ret({});
  }

  const AnalysisResult r = Analyzer::analyze(prog);
  ASSERT_FALSE(r.success);

  const json j = analysis_result_to_json(r);
  EXPECT_EQ(j.at("success"), false);
  ASSERT_FALSE(j.at("diagnostics").empty());

  const json & d = j.at("diagnostics")[0];
  EXPECT_EQ(d.at("severity"), "error");
  EXPECT_EQ(d.at("code"), k_diag_malformed_instruction);
  EXPECT_EQ(d.at("pos").at("file"), "bad.go");
  EXPECT_EQ(d.at("pos").at("line"), 3);
  EXPECT_TRUE(d.at("notes").is_array());
  EXPECT_TRUE(j.at("call_graph").at("edges").empty());
}
