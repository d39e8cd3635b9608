// typeflow/ir/program.cpp - Program implementation
//
#include "typeflow/ir/program.hpp"

#include <algorithm>

namespace typeflow
{

Package * Program::create_package(std::string_view name)
{
  packages_.push_back(std::make_unique<Package>(this, types_.intern(name)));
  return packages_.back().get();
}

Function * Program::add_function(std::unique_ptr<Function> fn, Package * pkg)
{
  Function * ptr = fn.get();
  functions_.push_back(std::move(fn));
  if (pkg != nullptr) {
    pkg->functions_.push_back(ptr);
  }
  return ptr;
}

Function * Program::create_function(Package * pkg, std::string_view name, const Type * signature)
{
  auto fn = std::make_unique<Function>(std::string(name), signature, pkg);
  fn->package_init_ = name == "init";
  return add_function(std::move(fn), pkg);
}

Function * Program::create_method(
  Package * pkg, Type * recv_named, std::string_view name, const Type * signature,
  bool pointer_receiver, std::string_view recv_name)
{
  const Type * recv = pointer_receiver ? types_.get_pointer(recv_named) : recv_named;

  auto fn = std::make_unique<Function>(std::string(name), signature, pkg);
  fn->receiver_ = recv;
  fn->add_param(std::string(recv_name), recv);

  Function * ptr = add_function(std::move(fn), pkg);
  types_.add_method(recv_named, name, ptr, pointer_receiver);
  return ptr;
}

Function * Program::create_anonymous(Function * enclosing, const Type * signature)
{
  std::string name = enclosing->get_name() + "$" + std::to_string(enclosing->next_anon_index());

  auto fn = std::make_unique<Function>(std::move(name), signature, enclosing->get_package());
  fn->enclosing_ = enclosing;
  return add_function(std::move(fn), enclosing->get_package());
}

Function * Program::create_instance(
  Function * origin, std::vector<const Type *> type_args, const Type * signature)
{
  std::string name = origin->get_name() + "[";
  for (size_t i = 0; i < type_args.size(); ++i) {
    if (i > 0) name += ", ";
    name += type_args[i] != nullptr ? type_args[i]->to_string() : "?";
  }
  name += "]";

  auto fn = std::make_unique<Function>(std::move(name), signature, origin->get_package());
  fn->origin_ = origin;
  fn->type_args_ = std::move(type_args);
  return add_function(std::move(fn), origin->get_package());
}

Global * Program::create_global(Package * pkg, std::string_view name, const Type * declared)
{
  globals_.push_back(std::make_unique<Global>(types_.get_pointer(declared), std::string(name)));
  Global * g = globals_.back().get();
  if (pkg != nullptr) {
    pkg->globals_.push_back(g);
  }
  return g;
}

Const * Program::create_const(const Type * type, std::string literal)
{
  consts_.push_back(std::make_unique<Const>(type, std::move(literal)));
  return consts_.back().get();
}

Builtin * Program::builtin(std::string_view name)
{
  for (const auto & b : builtins_) {
    if (b->get_name() == name) return b.get();
  }
  builtins_.push_back(std::make_unique<Builtin>(std::string(name)));
  return builtins_.back().get();
}

std::vector<Function *> Program::all_functions() const
{
  std::vector<Function *> out;
  out.reserve(functions_.size());
  for (const auto & f : functions_) {
    out.push_back(f.get());
  }
  return out;
}

Function * Program::find_function(std::string_view rel_name) const
{
  auto it = std::find_if(functions_.begin(), functions_.end(), [&](const auto & f) {
    return f->rel_string() == rel_name;
  });
  return it != functions_.end() ? it->get() : nullptr;
}

}  // namespace typeflow
