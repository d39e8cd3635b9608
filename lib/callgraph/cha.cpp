// typeflow/callgraph/cha.cpp - Static and CHA call graph construction
//
#include "typeflow/callgraph/cha.hpp"

#include <unordered_map>

#include "typeflow/basic/log.hpp"
#include "typeflow/ir/type_utils.hpp"

namespace typeflow
{

namespace
{

/// Visit every call instruction of every function body
template <typename Fn>
void for_each_call_site(const Program & program, Fn && fn)
{
  for (const Function * f : program.all_functions()) {
    for (const auto & block : f->blocks()) {
      for (const auto & instr : block->instructions()) {
        if (const auto * site = dyn_cast<CallInstruction>(instr.get())) {
          fn(site);
        }
      }
    }
  }
}

/**
 * Lazily computed CHA callee sets, memoized per interface method and per
 * signature.
 */
class ChaCallees
{
public:
  explicit ChaCallees(const Program & program)
  {
    for (const Function * f : program.all_functions()) {
      if (f->is_method()) {
        methods_by_name_[f->get_name()].push_back(f);
      } else if (!f->is_package_init()) {
        funcs_by_sig_[f->get_signature()].push_back(f);
      }
    }
  }

  const std::vector<const Function *> & of(const CallCommon & call)
  {
    static const std::vector<const Function *> k_empty;

    if (!call.is_invoke()) {
      auto it = funcs_by_sig_.find(call.signature);
      return it != funcs_by_sig_.end() ? it->second : k_empty;
    }

    const Type * iface = call.value != nullptr ? call.value->get_type() : nullptr;
    if (iface == nullptr) {
      return k_empty;
    }

    auto & memo = methods_memo_[iface][call.method];
    if (!memo.computed) {
      for (const Function * m : methods_by_name_[call.method]) {
        if (reachable_through(m, iface)) {
          memo.callees.push_back(m);
        }
      }
      memo.computed = true;
    }
    return memo.callees;
  }

private:
  /**
   * Whether `m` is in the method set of some type implementing `iface`.
   * A value-receiver method of T is also a method of *T, which may
   * implement interfaces T alone does not.
   */
  static bool reachable_through(const Function * m, const Type * iface) noexcept
  {
    const Type * recv = m->get_receiver_type();
    if (implements(recv, iface)) {
      return true;
    }
    return recv != nullptr && recv->kind != TypeKind::Pointer && pointer_implements(recv, iface);
  }

  struct Memo
  {
    bool computed = false;
    std::vector<const Function *> callees;
  };

  std::unordered_map<std::string, std::vector<const Function *>> methods_by_name_;
  std::unordered_map<const Type *, std::vector<const Function *>> funcs_by_sig_;
  std::unordered_map<const Type *, std::unordered_map<std::string, Memo>> methods_memo_;
};

}  // namespace

CallGraph build_static_call_graph(const Program & program)
{
  CallGraph graph;
  for (const Function * f : program.all_functions()) {
    graph.add_node(f);
  }
  for_each_call_site(program, [&](const CallInstruction * site) {
    if (const Function * callee = site->common.static_callee()) {
      graph.add_edge(site, callee);
    }
  });

  TYPEFLOW_LOG_DEBUG(
    "static call graph: {} nodes, {} edges", graph.node_count(), graph.edge_count());
  return graph;
}

CallGraph build_cha_call_graph(const Program & program)
{
  CallGraph graph;
  for (const Function * f : program.all_functions()) {
    graph.add_node(f);
  }

  ChaCallees callees(program);
  for_each_call_site(program, [&](const CallInstruction * site) {
    const CallCommon & call = site->common;
    if (const Function * callee = call.static_callee()) {
      graph.add_edge(site, callee);
      return;
    }
    if (call.builtin() != nullptr) {
      return;
    }
    for (const Function * callee : callees.of(call)) {
      graph.add_edge(site, callee);
    }
  });

  TYPEFLOW_LOG_DEBUG("CHA call graph: {} nodes, {} edges", graph.node_count(), graph.edge_count());
  return graph;
}

}  // namespace typeflow
