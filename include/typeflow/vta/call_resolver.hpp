// typeflow/vta/call_resolver.hpp - Call graph from propagated types
//
#pragma once

#include <cstddef>
#include <vector>

#include <gsl/span>

#include "typeflow/callgraph/callgraph.hpp"
#include "typeflow/vta/graph_builder.hpp"
#include "typeflow/vta/propagation.hpp"

namespace typeflow
{

/**
 * Resolves call sites against a TypeMap.
 *
 * Static sites resolve to their static callee. A dynamic site resolves to
 * the function carried by each type reaching its operand, or, for interface
 * invocations, to the method of that name in the type's method set.
 */
class CallResolver
{
public:
  CallResolver(const CallGraph & initial, const TypeMap & types)
  : initial_(initial), types_(types)
  {
  }

  /// Start from a copy of the baseline graph (on by default)
  void set_preserve_baseline(bool preserve) noexcept { preserve_baseline_ = preserve; }

  /**
   * Build the refined call graph for `functions`.
   *
   * Every function of the set becomes a node, whether or not it calls or
   * is called.
   */
  [[nodiscard]] CallGraph resolve(
    gsl::span<const Function * const> functions, gsl::span<const DynamicCallSite> sites);

  /// Callees of one dynamic site under the current type map
  [[nodiscard]] std::vector<const Function *> site_targets(const DynamicCallSite & site) const;

  /// Dynamic sites that resolved to at least one callee in the last resolve()
  [[nodiscard]] size_t resolved_sites() const noexcept { return resolved_sites_; }

private:
  const CallGraph & initial_;
  const TypeMap & types_;
  bool preserve_baseline_ = true;
  size_t resolved_sites_ = 0;
};

}  // namespace typeflow
