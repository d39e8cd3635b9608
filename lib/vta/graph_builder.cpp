// typeflow/vta/graph_builder.cpp - Flow graph construction rules
//
#include "typeflow/vta/graph_builder.hpp"

#include <algorithm>
#include <thread>

#include "typeflow/basic/log.hpp"
#include "typeflow/ir/type_utils.hpp"

namespace typeflow
{

namespace
{

const Type * type_of(const Value * v) noexcept { return v != nullptr ? v->get_type() : nullptr; }

}  // namespace

// ============================================================================
// Flow Graph Helpers
// ============================================================================

bool has_in_flow(const FlowNode & node) noexcept
{
  if (node.is_sentinel()) {
    return true;
  }
  const Type * t = node.type();
  if (t == nullptr) {
    return false;
  }
  return interface_under_ptr(t) != nullptr || function_under_ptr(t) != nullptr ||
         is_interface(t) || is_function(t);
}

bool is_reference_node(const FlowNode & node) noexcept
{
  if (node.is_nested_ptr()) {
    return true;
  }
  const Type * t = node.type();
  return t != nullptr && t->kind == TypeKind::Pointer;
}

// ============================================================================
// FlowGraphBuilder
// ============================================================================

FlowGraphBuilder::FlowGraphBuilder(
  const Program & program, const CallGraph & initial, FlowGraph & graph, DiagnosticBag & diags)
: program_(program), initial_(initial), graph_(graph), diags_(diags)
{
}

bool FlowGraphBuilder::build(gsl::span<const Function * const> functions)
{
  graph_.add_edge(FlowNode::panic_arg(), FlowNode::recover_return());

  for (const Function * fn : functions) {
    if (!visit_function(fn)) {
      return false;
    }
  }
  return true;
}

bool FlowGraphBuilder::visit_function(const Function * fn)
{
  TYPEFLOW_LOG_TRACE("flow graph: visiting {}", fn->rel_string());
  for (const auto & block : fn->blocks()) {
    for (const auto & instr : block->instructions()) {
      if (!visit_instruction(instr.get())) {
        return false;
      }
    }
  }
  current_ = nullptr;
  return true;
}

std::optional<FlowNode> FlowGraphBuilder::node_from_value(const Value * v)
{
  if (v == nullptr) {
    malformed("missing operand");
    return std::nullopt;
  }
  if (isa<Builtin>(v)) {
    report(k_diag_unsupported_value, "builtin '" + v->get_name() + "' used as a value");
    return std::nullopt;
  }

  const Type * t = v->get_type();
  if (t == nullptr) {
    malformed("operand '" + operand_to_string(v) + "' has no type");
    return std::nullopt;
  }

  if (t->kind == TypeKind::Pointer && !is_interface(t->elem) && !is_function(t->elem)) {
    if (const Type * i = interface_under_ptr(t->elem)) {
      return FlowNode::nested_ptr_interface(i);
    }
    if (const Type * f = function_under_ptr(t->elem)) {
      return FlowNode::nested_ptr_function(f);
    }
    return FlowNode::pointer(t);
  }

  switch (v->get_kind()) {
    case ValueKind::Const:
      return FlowNode::constant(t);
    case ValueKind::Global:
      return FlowNode::global(cast<Global>(v));
    case ValueKind::Function:
      return FlowNode::function(cast<Function>(v));
    case ValueKind::Parameter:
    case ValueKind::FreeVar:
      return FlowNode::local(v);
    default:
      if (is_value_instruction_kind(v->get_kind())) {
        return FlowNode::local(v);
      }
      report(
        k_diag_unsupported_value, "value of kind '" + std::string(to_string(v->get_kind())) +
                                    "' has no flow node");
      return std::nullopt;
  }
}

// ============================================================================
// Instruction Rules
// ============================================================================

bool FlowGraphBuilder::visit_instruction(const Instruction * instr)
{
  current_ = instr;

  switch (instr->get_kind()) {
    case ValueKind::Store: {
      const auto * s = cast<Store>(instr);
      return alias(s->addr, s->val);
    }
    case ValueKind::MakeInterface:
      return flow(cast<MakeInterface>(instr)->x, instr);
    case ValueKind::MakeClosure:
      return visit_closure(cast<MakeClosure>(instr));
    case ValueKind::UnOp:
      return visit_unop(cast<UnOp>(instr));
    case ValueKind::Phi:
      for (const Value * edge : cast<Phi>(instr)->edges) {
        if (!alias(instr, edge)) return false;
      }
      return true;
    case ValueKind::ChangeInterface:
      return flow(cast<ChangeInterface>(instr)->x, instr);
    case ValueKind::ChangeType:
      // Identical values; flows matter when converting pointers to interfaces
      return alias(instr, cast<ChangeType>(instr)->x);
    case ValueKind::TypeAssert:
      return visit_type_assert(cast<TypeAssert>(instr));
    case ValueKind::Extract:
      return visit_extract(cast<Extract>(instr));
    case ValueKind::Field:
      return visit_field(cast<Field>(instr));
    case ValueKind::FieldAddr:
      return visit_field_addr(cast<FieldAddr>(instr));
    case ValueKind::Send:
      return visit_send(cast<Send>(instr));
    case ValueKind::Select:
      return visit_select(cast<Select>(instr));
    case ValueKind::Index:
      return visit_index(cast<Index>(instr));
    case ValueKind::IndexAddr:
      return visit_index_addr(cast<IndexAddr>(instr));
    case ValueKind::Lookup:
      return visit_lookup(cast<Lookup>(instr));
    case ValueKind::MapUpdate:
      return visit_map_update(cast<MapUpdate>(instr));
    case ValueKind::Next:
      return visit_next(cast<Next>(instr));
    case ValueKind::Call:
    case ValueKind::Go:
    case ValueKind::Defer:
      return visit_call(cast<CallInstruction>(instr));
    case ValueKind::Panic:
      return visit_panic(cast<Panic>(instr));
    case ValueKind::Return:
      return visit_return(cast<Return>(instr));

    // No interesting flow
    case ValueKind::Alloc:
    case ValueKind::BinOp:
    case ValueKind::Convert:
    case ValueKind::Slice:
    case ValueKind::SliceToArrayPointer:
    case ValueKind::MakeMap:
    case ValueKind::MakeChan:
    case ValueKind::MakeSlice:
    case ValueKind::Range:
    case ValueKind::Jump:
    case ValueKind::If:
    case ValueKind::RunDefers:
    case ValueKind::DebugRef:
      return true;

    default:
      return malformed(
        "unsupported instruction kind '" + std::string(to_string(instr->get_kind())) + "'");
  }
}

bool FlowGraphBuilder::visit_unop(const UnOp * u)
{
  switch (u->op) {
    case UnOpKind::Deref:
      return alias(u, u->x);
    case UnOpKind::Recv: {
      const Type * elem = chan_elem(type_of(u->x));
      if (elem == nullptr) {
        return malformed("receive from a non-channel operand");
      }
      if (u->comma_ok) {
        add_in_flow_alias_edges(FlowNode::indexed_local(u, elem, 0), FlowNode::channel_elem(elem));
        return true;
      }
      auto dst = node_from_value(u);
      if (!dst) return false;
      add_in_flow_alias_edges(*dst, FlowNode::channel_elem(elem));
      return true;
    }
    default:
      return true;
  }
}

bool FlowGraphBuilder::visit_type_assert(const TypeAssert * a)
{
  if (!a->comma_ok) {
    return flow(a->x, a);
  }

  // Result is (T, bool): the value flows into component 0
  const Type * tup = a->get_type();
  if (tup == nullptr || !tup->is_tuple() || tup->elements.empty()) {
    return malformed("comma-ok type assertion without tuple result");
  }
  auto src = node_from_value(a->x);
  if (!src) return false;
  add_in_flow_edge(*src, FlowNode::indexed_local(a, tup->elements[0], 0));
  return true;
}

bool FlowGraphBuilder::visit_extract(const Extract * e)
{
  const Type * tup = type_of(e->tuple);
  if (tup == nullptr || !tup->is_tuple() || e->index >= tup->elements.size()) {
    return malformed("extract from a non-tuple operand or out of range");
  }
  auto dst = node_from_value(e);
  if (!dst) return false;
  add_in_flow_alias_edges(
    *dst, FlowNode::indexed_local(e->tuple, tup->elements[e->index], e->index));
  return true;
}

bool FlowGraphBuilder::visit_field(const Field * f)
{
  const Type * aggregate = type_of(f->x);
  if (struct_field(aggregate, f->index) == nullptr) {
    return malformed("field of a non-struct operand or out of range");
  }
  auto dst = node_from_value(f);
  if (!dst) return false;
  add_in_flow_edge(FlowNode::field(aggregate, f->index), *dst);
  return true;
}

bool FlowGraphBuilder::visit_field_addr(const FieldAddr * f)
{
  const Type * p = core_type(type_of(f->x));
  if (p == nullptr || p->kind != TypeKind::Pointer || struct_field(p->elem, f->index) == nullptr) {
    return malformed("field address of a non-pointer-to-struct operand");
  }
  auto addr = node_from_value(f);
  if (!addr) return false;

  // Address of a field: both directions
  const FlowNode fnode = FlowNode::field(p->elem, f->index);
  add_in_flow_edge(fnode, *addr);
  add_in_flow_edge(*addr, fnode);
  return true;
}

bool FlowGraphBuilder::visit_send(const Send * s)
{
  const Type * elem = chan_elem(type_of(s->chan));
  if (elem == nullptr) {
    return malformed("send on a non-channel operand");
  }
  auto src = node_from_value(s->x);
  if (!src) return false;
  add_in_flow_alias_edges(FlowNode::channel_elem(elem), *src);
  return true;
}

bool FlowGraphBuilder::visit_select(const Select * s)
{
  size_t recv_index = 0;
  for (const auto & state : s->states) {
    const Type * elem = chan_elem(type_of(state.chan));
    if (elem == nullptr) {
      return malformed("select state on a non-channel operand");
    }

    if (state.dir == ChanDir::SendOnly) {
      auto sent = node_from_value(state.send);
      if (!sent) return false;
      add_in_flow_alias_edges(FlowNode::channel_elem(elem), *sent);
    } else {
      // Received values occupy components 2.. of the result tuple
      add_in_flow_alias_edges(
        FlowNode::indexed_local(s, elem, 2 + recv_index), FlowNode::channel_elem(elem));
      ++recv_index;
    }
  }
  return true;
}

bool FlowGraphBuilder::visit_index(const Index * i)
{
  const Type * elem = slice_array_elem(type_of(i->x), program_.types());
  if (elem == nullptr) {
    return malformed("index of a non-indexable operand");
  }
  auto dst = node_from_value(i);
  if (!dst) return false;
  add_in_flow_alias_edges(*dst, FlowNode::slice_elem(elem));
  return true;
}

bool FlowGraphBuilder::visit_index_addr(const IndexAddr * i)
{
  const Type * elem = slice_array_elem(type_of(i->x), program_.types());
  if (elem == nullptr) {
    return malformed("index address of a non-indexable operand");
  }
  auto addr = node_from_value(i);
  if (!addr) return false;

  const FlowNode enode = FlowNode::slice_elem(elem);
  add_in_flow_edge(enode, *addr);
  add_in_flow_edge(*addr, enode);
  return true;
}

bool FlowGraphBuilder::visit_lookup(const Lookup * l)
{
  const Type * m = map_of(type_of(l->x));
  if (m == nullptr) {
    // String lookups carry no interesting flow
    const Type * u = core_type(type_of(l->x));
    if (u != nullptr && u->kind == TypeKind::Basic && u->basic == BasicKind::String) {
      return true;
    }
    return malformed("lookup on a non-map operand");
  }

  const FlowNode value = FlowNode::map_value(m->elem);
  if (l->comma_ok) {
    add_in_flow_alias_edges(FlowNode::indexed_local(l, m->elem, 0), value);
    return true;
  }
  auto dst = node_from_value(l);
  if (!dst) return false;
  add_in_flow_alias_edges(*dst, value);
  return true;
}

bool FlowGraphBuilder::visit_map_update(const MapUpdate * u)
{
  const Type * m = map_of(type_of(u->map));
  if (m == nullptr) {
    return malformed("map update on a non-map operand");
  }
  auto key = node_from_value(u->key);
  if (!key) return false;
  auto value = node_from_value(u->value);
  if (!value) return false;

  add_in_flow_alias_edges(FlowNode::map_key(m->key), *key);
  add_in_flow_alias_edges(FlowNode::map_value(m->elem), *value);
  return true;
}

bool FlowGraphBuilder::visit_next(const Next * n)
{
  if (n->is_string) {
    return true;
  }
  const Type * tup = n->get_type();
  if (!isa<Range>(n->iter) || tup == nullptr || !tup->is_tuple() || tup->elements.size() != 3) {
    return malformed("next over a non-map range");
  }

  const Type * kt = tup->elements[1];
  const Type * vt = tup->elements[2];
  add_in_flow_alias_edges(FlowNode::indexed_local(n, kt, 1), FlowNode::map_key(kt));
  add_in_flow_alias_edges(FlowNode::indexed_local(n, vt, 2), FlowNode::map_value(vt));
  return true;
}

bool FlowGraphBuilder::visit_closure(const MakeClosure * c)
{
  const Function * fn = c->fn;
  if (fn == nullptr || c->bindings.size() != fn->free_vars().size()) {
    return malformed("closure bindings do not match free variables");
  }

  auto dst = node_from_value(c);
  if (!dst) return false;
  add_in_flow_edge(FlowNode::function(fn), *dst);

  for (size_t i = 0; i < c->bindings.size(); ++i) {
    if (!alias(fn->free_vars()[i].get(), c->bindings[i])) return false;
  }
  return true;
}

bool FlowGraphBuilder::visit_call(const CallInstruction * c)
{
  const CallCommon & cc = c->common;
  if (cc.value == nullptr) {
    return malformed("call without callee");
  }
  if (const Builtin * b = cc.builtin()) {
    return visit_builtin_call(c, b);
  }

  if (cc.static_callee() == nullptr) {
    dynamic_sites_.push_back(DynamicCallSite{c->get_parent(), c, FlowNode::local(cc.value)});
  }

  for (const Function * callee : initial_.site_callees(c)) {
    if (!add_argument_flows(c, callee) || !add_result_flows(c, callee)) {
      return false;
    }
  }
  return true;
}

bool FlowGraphBuilder::visit_builtin_call(const CallInstruction * c, const Builtin * builtin)
{
  const std::string & name = builtin->get_name();
  const auto * call = dyn_cast<Call>(c);

  if (name == "recover") {
    if (call == nullptr) return true;
    auto dst = node_from_value(call);
    if (!dst) return false;
    add_in_flow_edge(FlowNode::recover_return(), *dst);
    return true;
  }

  if (name == "append" && c->common.args.size() > 1) {
    const Type * elem = slice_array_elem(type_of(c->common.args[0]), program_.types());
    if (elem == nullptr) {
      return malformed("append to a non-slice operand");
    }
    // Element arguments flow into the shared element node; a spread
    // argument (same slice type) aliases the same node already.
    for (size_t i = 1; i < c->common.args.size(); ++i) {
      const Value * arg = c->common.args[i];
      if (type_of(arg) != elem) continue;
      auto src = node_from_value(arg);
      if (!src) return false;
      add_in_flow_alias_edges(FlowNode::slice_elem(elem), *src);
    }
  }
  return true;
}

bool FlowGraphBuilder::add_argument_flows(const CallInstruction * c, const Function * callee)
{
  const auto & params = callee->params();
  if (params.empty()) {
    // No parameters, or a declaration without body
    return true;
  }

  const CallCommon & cc = c->common;
  size_t offset = 0;
  if (cc.is_invoke()) {
    offset = 1;
    // Receivers only flow when the concrete receiver is itself a function
    if (is_function(params[0]->get_type()) && !flow(cc.value, params[0].get())) {
      return false;
    }
  }

  for (size_t i = 0; i < cc.args.size(); ++i) {
    if (params.size() <= i + offset) {
      break;
    }
    if (!alias(params[i + offset].get(), cc.args[i])) {
      return false;
    }
  }
  return true;
}

bool FlowGraphBuilder::add_result_flows(const CallInstruction * c, const Function * callee)
{
  const auto * call = dyn_cast<Call>(c);
  if (call == nullptr) {
    // go and defer discard results
    return true;
  }

  const size_t n = callee->result_count();
  if (n == 0) {
    return true;
  }
  if (n == 1) {
    auto dst = node_from_value(call);
    if (!dst) return false;
    add_in_flow_edge(FlowNode::result_var(callee, 0), *dst);
    return true;
  }

  const Type * tup = call->get_type();
  if (tup == nullptr || !tup->is_tuple() || tup->elements.size() < n) {
    return malformed("call result does not match the results of " + callee->rel_string());
  }
  for (size_t i = 0; i < n; ++i) {
    add_in_flow_edge(
      FlowNode::result_var(callee, i), FlowNode::indexed_local(call, tup->elements[i], i));
  }
  return true;
}

bool FlowGraphBuilder::visit_panic(const Panic * p)
{
  if (p->x == nullptr) {
    return malformed("panic without argument");
  }
  // Strings and other method-less values are not interesting
  if (!can_have_methods(type_of(p->x))) {
    return true;
  }
  auto src = node_from_value(p->x);
  if (!src) return false;
  add_in_flow_edge(*src, FlowNode::panic_arg());
  return true;
}

bool FlowGraphBuilder::visit_return(const Return * r)
{
  const Function * parent = r->get_parent();
  for (size_t i = 0; i < r->results.size(); ++i) {
    auto src = node_from_value(r->results[i]);
    if (!src) return false;
    add_in_flow_edge(*src, FlowNode::result_var(parent, i));
  }
  return true;
}

// ============================================================================
// Edge Helpers
// ============================================================================

void FlowGraphBuilder::add_in_flow_edge(const FlowNode & src, const FlowNode & dst)
{
  if (has_in_flow(dst)) {
    graph_.add_edge(src, dst);
  }
}

void FlowGraphBuilder::add_in_flow_alias_edges(const FlowNode & l, const FlowNode & r)
{
  add_in_flow_edge(r, l);
  if (is_reference_node(l) && is_reference_node(r)) {
    add_in_flow_edge(l, r);
  }
}

bool FlowGraphBuilder::flow(const Value * src, const Value * dst)
{
  auto s = node_from_value(src);
  if (!s) return false;
  auto d = node_from_value(dst);
  if (!d) return false;
  add_in_flow_edge(*s, *d);
  return true;
}

bool FlowGraphBuilder::alias(const Value * l, const Value * r)
{
  auto ln = node_from_value(l);
  if (!ln) return false;
  auto rn = node_from_value(r);
  if (!rn) return false;
  add_in_flow_alias_edges(*ln, *rn);
  return true;
}

bool FlowGraphBuilder::malformed(std::string reason)
{
  return report(k_diag_malformed_instruction, "malformed instruction: " + reason);
}

bool FlowGraphBuilder::report(const char * code, std::string message)
{
  const Function * fn = current_ != nullptr ? current_->get_parent() : nullptr;
  const std::string where = fn != nullptr ? fn->rel_string() : "<unknown>";
  const std::string rendering = current_ != nullptr ? current_->to_string() : "<none>";

  TYPEFLOW_LOG_ERROR("{} in {}: {} [{}]", message, where, rendering, code);

  auto diag = diags_.report_error(current_ != nullptr ? current_->get_pos() : SourcePos{}, message);
  diag.with_code(code).with_note("in function " + where).with_note("instruction: " + rendering);
  return false;
}

// ============================================================================
// Whole-set Build
// ============================================================================

FlowGraphBuildResult build_flow_graph(
  const Program & program, gsl::span<const Function * const> functions, const CallGraph & initial,
  DiagnosticBag & diags, size_t threads)
{
  FlowGraphBuildResult result;
  const size_t count = functions.size();
  threads = std::max<size_t>(1, std::min(threads, count));

  if (threads == 1) {
    FlowGraphBuilder builder(program, initial, result.graph, diags);
    result.success = builder.build(functions);
    result.dynamic_sites = builder.dynamic_sites();
    return result;
  }

  struct Worker
  {
    FlowGraph graph;
    DiagnosticBag diags;
    std::vector<DynamicCallSite> sites;
    bool success = false;
  };

  std::vector<Worker> workers(threads);
  std::vector<std::thread> pool;
  pool.reserve(threads);

  const size_t chunk = (count + threads - 1) / threads;
  for (size_t w = 0; w < threads; ++w) {
    const size_t begin = std::min(count, w * chunk);
    const size_t len = std::min(chunk, count - begin);
    pool.emplace_back([&, w, begin, len] {
      Worker & worker = workers[w];
      FlowGraphBuilder builder(program, initial, worker.graph, worker.diags);
      worker.success = builder.build(functions.subspan(begin, len));
      worker.sites = builder.dynamic_sites();
    });
  }
  for (auto & t : pool) {
    t.join();
  }

  result.success = true;
  for (auto & worker : workers) {
    result.graph.merge(worker.graph);
    result.dynamic_sites.insert(
      result.dynamic_sites.end(), worker.sites.begin(), worker.sites.end());
    diags.merge(std::move(worker.diags));
    result.success = result.success && worker.success;
  }

  TYPEFLOW_LOG_DEBUG(
    "flow graph built on {} threads: {} nodes, {} edges", threads, result.graph.node_count(),
    result.graph.edge_count());
  return result;
}

}  // namespace typeflow
