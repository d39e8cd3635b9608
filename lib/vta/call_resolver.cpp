// typeflow/vta/call_resolver.cpp - CallResolver implementation
//
#include "typeflow/vta/call_resolver.hpp"

#include <algorithm>

#include "typeflow/basic/casting.hpp"
#include "typeflow/basic/log.hpp"
#include "typeflow/ir/type_utils.hpp"

namespace typeflow
{

std::vector<const Function *> CallResolver::site_targets(const DynamicCallSite & site) const
{
  std::vector<const Function *> out;
  const CallCommon & cc = site.site->get_common();

  for (const PropType & p : types_.types(site.operand)) {
    const Function * callee = nullptr;
    if (p.function != nullptr) {
      callee = p.function;
    } else if (cc.is_invoke()) {
      callee = lookup_method(p.type, cc.method);
    }
    if (callee != nullptr && std::find(out.begin(), out.end(), callee) == out.end()) {
      out.push_back(callee);
    }
  }
  return out;
}

CallGraph CallResolver::resolve(
  gsl::span<const Function * const> functions, gsl::span<const DynamicCallSite> sites)
{
  CallGraph result;
  if (preserve_baseline_) {
    result = initial_;
  }
  resolved_sites_ = 0;

  for (const Function * fn : functions) {
    result.add_node(fn);
    for (const auto & block : fn->blocks()) {
      for (const auto & instr : block->instructions()) {
        const auto * call = dyn_cast<CallInstruction>(instr.get());
        if (call == nullptr) continue;
        if (const Function * callee = call->get_common().static_callee()) {
          result.add_edge(call, callee);
        }
      }
    }
  }

  for (const DynamicCallSite & site : sites) {
    const auto targets = site_targets(site);
    if (!targets.empty()) {
      ++resolved_sites_;
    }
    for (const Function * callee : targets) {
      result.add_edge(site.site, callee);
    }
  }

  TYPEFLOW_LOG_DEBUG(
    "call resolution: {}/{} dynamic sites resolved, {} edges", resolved_sites_, sites.size(),
    result.edge_count());
  return result;
}

}  // namespace typeflow
