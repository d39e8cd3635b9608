// typeflow/test_support/program_fixtures.hpp - IR programs shared by tests
//
// Small hand-lowered programs used by unit and integration tests. Each
// fixture owns its Program and exposes the functions and types tests refer
// to by name.
//
#pragma once

#include <memory>

#include "typeflow/ir/function_builder.hpp"
#include "typeflow/ir/program.hpp"

namespace typeflow::test_support
{

/**
 * Interface dispatch and function values in package P:
 *
 * ```go
 * type I interface { f() }
 * type C int
 * func (C) f() {}
 * type D struct{}
 * func (D) f() {}
 *
 * func g() { var i I = C(0); i.f() }
 * func h() {}
 * func f(b bool) {
 *   p := func() {}   // f$1
 *   p()
 *   if b { p = h }
 *   p()
 * }
 * ```
 *
 * `D` is never converted to `I`, so VTA drops the `g -> (D).f` edge that
 * CHA reports.
 */
struct DispatchFixture
{
  std::unique_ptr<Program> program = std::make_unique<Program>();

  Package * pkg = nullptr;
  const Type * iface = nullptr;
  Type * c = nullptr;
  Type * d = nullptr;

  Function * c_f = nullptr;
  Function * d_f = nullptr;
  Function * g = nullptr;
  Function * h = nullptr;
  Function * f = nullptr;
  Function * f1 = nullptr;

  /// `i.f()` in g
  Call * invoke_site = nullptr;
  /// First `p()`: static call of f$1
  Call * static_site = nullptr;
  /// Second `p()`: call through the phi of f$1 and h
  Call * dynamic_site = nullptr;
};

[[nodiscard]] inline DispatchFixture make_dispatch_fixture()
{
  DispatchFixture fx;
  Program & prog = *fx.program;
  TypeContext & types = prog.types();

  fx.pkg = prog.create_package("P");
  const Type * unit_sig = types.get_signature({}, {});

  fx.iface = types.new_named("P", "I", types.get_interface({{"f", unit_sig}}));
  fx.c = types.new_named("P", "C", types.int_type());
  fx.d = types.new_named("P", "D", types.get_struct({}));

  fx.c_f = prog.create_method(fx.pkg, fx.c, "f", unit_sig, false);
  FunctionBuilder(prog, fx.c_f).ret({});
  fx.d_f = prog.create_method(fx.pkg, fx.d, "f", unit_sig, false);
  FunctionBuilder(prog, fx.d_f).ret({});

  // g
  fx.g = prog.create_function(fx.pkg, "g", unit_sig);
  {
    FunctionBuilder b(prog, fx.g);
    b.set_pos("p.go", 8, 1);
    auto * i = b.make_interface(fx.iface, prog.create_const(fx.c, "0"));
    b.set_pos("p.go", 8, 26);
    fx.invoke_site = b.invoke(i, "f", {});
    b.ret({});
  }

  // h
  fx.h = prog.create_function(fx.pkg, "h", unit_sig);
  FunctionBuilder(prog, fx.h).ret({});

  // f
  fx.f = prog.create_function(fx.pkg, "f", types.get_signature({types.bool_type()}, {}));
  Parameter * cond = fx.f->add_param("b", types.bool_type());
  fx.f1 = prog.create_anonymous(fx.f, unit_sig);
  FunctionBuilder(prog, fx.f1).ret({});
  {
    FunctionBuilder b(prog, fx.f);
    BasicBlock * entry = b.create_block("entry");
    BasicBlock * then_block = fx.f->add_block("if.then");
    BasicBlock * done = fx.f->add_block("if.done");

    b.set_block(entry);
    b.set_pos("p.go", 12, 3);
    fx.static_site = b.call(fx.f1, {});
    b.if_then(cond, then_block, done);

    b.set_block(then_block);
    b.jump(done);

    b.set_block(done);
    auto * p = b.phi(unit_sig, {fx.f1, fx.h});
    b.set_pos("p.go", 14, 3);
    fx.dynamic_site = b.call(p, {});
    b.ret({});
  }

  return fx;
}

/**
 * Generic function instantiated twice:
 *
 * ```go
 * type I interface { F() }
 * type A struct{}; func (A) F() {}
 * type B struct{}; func (B) F() {}
 *
 * func instantiated[X I](x X) { x.F() }
 *
 * func f() { instantiated[A](A{}); instantiated[B](B{}) }
 * ```
 *
 * Each instance is its own Function with its own parameter, and calls
 * `F` through an interface conversion of that parameter.
 */
struct GenericsFixture
{
  std::unique_ptr<Program> program = std::make_unique<Program>();

  Package * pkg = nullptr;
  const Type * iface = nullptr;
  Type * a = nullptr;
  Type * b = nullptr;

  Function * a_f = nullptr;
  Function * b_f = nullptr;
  Function * generic = nullptr;
  Function * inst_a = nullptr;
  Function * inst_b = nullptr;
  Function * f = nullptr;
};

namespace detail
{

/// Body of `instantiated[T]`: `t0 = make I <- T (x); invoke t0.F()`
inline void build_instance_body(
  Program & prog, Function * inst, const Type * arg, const Type * iface)
{
  Parameter * x = inst->add_param("x", arg);
  FunctionBuilder b(prog, inst);
  auto * boxed = b.make_interface(iface, x);
  b.invoke(boxed, "F", {});
  b.ret({});
}

}  // namespace detail

[[nodiscard]] inline GenericsFixture make_generics_fixture()
{
  GenericsFixture fx;
  Program & prog = *fx.program;
  TypeContext & types = prog.types();

  fx.pkg = prog.create_package("P");
  const Type * unit_sig = types.get_signature({}, {});

  fx.iface = types.new_named("P", "I", types.get_interface({{"F", unit_sig}}));
  fx.a = types.new_named("P", "A", types.get_struct({}));
  fx.b = types.new_named("P", "B", types.get_struct({}));

  fx.a_f = prog.create_method(fx.pkg, fx.a, "F", unit_sig, false);
  FunctionBuilder(prog, fx.a_f).ret({});
  fx.b_f = prog.create_method(fx.pkg, fx.b, "F", unit_sig, false);
  FunctionBuilder(prog, fx.b_f).ret({});

  // The generic origin has no body of its own; only instances are analyzed
  const Type * x_param = types.new_type_param("X", fx.iface);
  fx.generic =
    prog.create_function(fx.pkg, "instantiated", types.get_signature({x_param}, {}));

  fx.inst_a = prog.create_instance(fx.generic, {fx.a}, types.get_signature({fx.a}, {}));
  detail::build_instance_body(prog, fx.inst_a, fx.a, fx.iface);
  fx.inst_b = prog.create_instance(fx.generic, {fx.b}, types.get_signature({fx.b}, {}));
  detail::build_instance_body(prog, fx.inst_b, fx.b, fx.iface);

  fx.f = prog.create_function(fx.pkg, "f", unit_sig);
  {
    FunctionBuilder b(prog, fx.f);
    b.call(fx.inst_a, {prog.create_const(fx.a, "A{}")});
    b.call(fx.inst_b, {prog.create_const(fx.b, "B{}")});
    b.ret({});
  }

  return fx;
}

/**
 * Value- and pointer-receiver methods behind one interface:
 *
 * ```go
 * type I interface { f(func()); g() }
 * type C int
 * func (C) f(fn func()) { fn() }
 * func (*C) g() {}
 * func h() {}
 * func k(p *C) { var i I = p; i.f(h) }
 * ```
 *
 * Only `*C` implements `I`, yet `(C).f` is in its method set.
 */
struct MixedReceiverFixture
{
  std::unique_ptr<Program> program = std::make_unique<Program>();

  Package * pkg = nullptr;
  const Type * iface = nullptr;
  Type * c = nullptr;

  Function * c_f = nullptr;
  Function * ptr_c_g = nullptr;
  Function * h = nullptr;
  Function * k = nullptr;

  /// `fn` parameter of (C).f
  Parameter * fn_param = nullptr;
  /// `i.f(h)` in k
  Call * invoke_site = nullptr;
};

[[nodiscard]] inline MixedReceiverFixture make_mixed_receiver_fixture()
{
  MixedReceiverFixture fx;
  Program & prog = *fx.program;
  TypeContext & types = prog.types();

  fx.pkg = prog.create_package("P");
  const Type * unit_sig = types.get_signature({}, {});
  const Type * f_sig = types.get_signature({unit_sig}, {});

  fx.iface = types.new_named("P", "I", types.get_interface({{"f", f_sig}, {"g", unit_sig}}));
  fx.c = types.new_named("P", "C", types.int_type());
  const Type * ptr_c = types.get_pointer(fx.c);

  fx.c_f = prog.create_method(fx.pkg, fx.c, "f", f_sig, false);
  fx.fn_param = fx.c_f->add_param("fn", unit_sig);
  {
    FunctionBuilder b(prog, fx.c_f);
    b.call(fx.fn_param, {});
    b.ret({});
  }
  fx.ptr_c_g = prog.create_method(fx.pkg, fx.c, "g", unit_sig, true);
  FunctionBuilder(prog, fx.ptr_c_g).ret({});

  fx.h = prog.create_function(fx.pkg, "h", unit_sig);
  FunctionBuilder(prog, fx.h).ret({});

  fx.k = prog.create_function(fx.pkg, "k", types.get_signature({ptr_c}, {}));
  Parameter * p = fx.k->add_param("p", ptr_c);
  {
    FunctionBuilder b(prog, fx.k);
    auto * i = b.make_interface(fx.iface, p);
    fx.invoke_site = b.invoke(i, "f", {fx.h});
    b.ret({});
  }

  return fx;
}

}  // namespace typeflow::test_support
