// typeflow/callgraph/cha.hpp - Baseline call graphs
//
// The VTA analysis refines a baseline call graph. Two baselines are
// provided: the purely static graph and class hierarchy analysis (CHA).
//
#pragma once

#include "typeflow/callgraph/callgraph.hpp"
#include "typeflow/ir/program.hpp"

namespace typeflow
{

/**
 * Build the call graph containing only static call edges.
 *
 * A call is static when its callee is a Function or an immediately created
 * closure. Builtins and dynamic calls contribute no edges.
 */
[[nodiscard]] CallGraph build_static_call_graph(const Program & program);

/**
 * Build the class hierarchy analysis call graph.
 *
 * - Static calls resolve to their static callee.
 * - Interface invocations `x.m()` resolve to every method named `m` whose
 *   receiver type implements the interface of `x`.
 * - Calls through other function values resolve to every non-method
 *   function (closures included, package initializers excluded) whose
 *   signature is identical to the call's signature.
 */
[[nodiscard]] CallGraph build_cha_call_graph(const Program & program);

}  // namespace typeflow
