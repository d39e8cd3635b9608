// typeflow/ir/function.cpp - Function implementation
//
#include "typeflow/ir/function.hpp"

#include "typeflow/ir/program.hpp"

namespace typeflow
{

namespace
{

/// Render a receiver type relative to `pkg`: `C`, `*C`, or qualified when foreign
std::string relative_type_name(const Type * t, const Package * pkg)
{
  if (t == nullptr) {
    return "?";
  }
  if (t->kind == TypeKind::Pointer) {
    return "*" + relative_type_name(t->elem, pkg);
  }
  if (t->is_named() && pkg != nullptr && t->package == pkg->get_name()) {
    return std::string(t->name);
  }
  return t->to_string();
}

}  // namespace

std::string Function::rel_string() const
{
  if (enclosing_ != nullptr) {
    // Anonymous functions are named "<enclosing>$<n>"
    const std::string & outer = enclosing_->get_name();
    return enclosing_->rel_string() + get_name().substr(outer.size());
  }
  if (receiver_ != nullptr) {
    return "(" + relative_type_name(receiver_, package_) + ")." + get_name();
  }
  return get_name();
}

size_t Function::result_count() const noexcept
{
  const Type * sig = get_signature();
  return sig != nullptr ? sig->results.size() : 0;
}

const Type * Function::result_type(size_t index) const noexcept
{
  const Type * sig = get_signature();
  if (sig == nullptr || index >= sig->results.size()) {
    return nullptr;
  }
  return sig->results[index];
}

Parameter * Function::add_param(std::string name, const Type * type)
{
  params_.push_back(std::make_unique<Parameter>(type, std::move(name), this));
  return params_.back().get();
}

FreeVar * Function::add_free_var(std::string name, const Type * type)
{
  free_vars_.push_back(std::make_unique<FreeVar>(type, std::move(name), this));
  return free_vars_.back().get();
}

BasicBlock * Function::add_block(std::string comment)
{
  blocks_.push_back(std::make_unique<BasicBlock>(this, blocks_.size(), std::move(comment)));
  return blocks_.back().get();
}

}  // namespace typeflow
