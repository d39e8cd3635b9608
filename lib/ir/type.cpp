// typeflow/ir/type.cpp - Type context implementation
//
#include "typeflow/ir/type.hpp"

#include <algorithm>
#include <cstring>
#include <sstream>
#include <utility>

namespace typeflow
{

namespace
{

constexpr std::pair<BasicKind, const char *> k_basic_names[] = {
  {BasicKind::Bool, "bool"},
  {BasicKind::Int, "int"},
  {BasicKind::Int8, "int8"},
  {BasicKind::Int16, "int16"},
  {BasicKind::Int32, "int32"},
  {BasicKind::Int64, "int64"},
  {BasicKind::Uint, "uint"},
  {BasicKind::Uint8, "uint8"},
  {BasicKind::Uint16, "uint16"},
  {BasicKind::Uint32, "uint32"},
  {BasicKind::Uint64, "uint64"},
  {BasicKind::Uintptr, "uintptr"},
  {BasicKind::Float32, "float32"},
  {BasicKind::Float64, "float64"},
  {BasicKind::String, "string"},
  {BasicKind::UnsafePointer, "unsafe.Pointer"},
  {BasicKind::UntypedNil, "untyped nil"},
};

const char * basic_name(BasicKind k)
{
  for (const auto & [kind, name] : k_basic_names) {
    if (kind == k) return name;
  }
  return "invalid";
}

void write_type_list(std::ostream & os, const std::vector<const Type *> & types, bool variadic)
{
  for (size_t i = 0; i < types.size(); ++i) {
    if (i > 0) os << ", ";
    const Type * t = types[i];
    if (variadic && i + 1 == types.size() && t != nullptr && t->kind == TypeKind::Slice) {
      os << "..." << (t->elem != nullptr ? t->elem->to_string() : "?");
      continue;
    }
    os << (t != nullptr ? t->to_string() : "?");
  }
}

void write_signature_tail(std::ostream & os, const Type & sig)
{
  os << "(";
  write_type_list(os, sig.params, sig.variadic);
  os << ")";
  if (sig.results.size() == 1) {
    os << " " << (sig.results[0] != nullptr ? sig.results[0]->to_string() : "?");
  } else if (sig.results.size() > 1) {
    os << " (";
    write_type_list(os, sig.results, false);
    os << ")";
  }
}

}  // namespace

// ============================================================================
// Type
// ============================================================================

std::string Type::to_string() const
{
  std::ostringstream os;
  switch (kind) {
    case TypeKind::Basic:
      os << basic_name(basic);
      break;
    case TypeKind::Named:
      if (!package.empty()) {
        os << package << ".";
      }
      os << name;
      break;
    case TypeKind::TypeParam:
      os << name;
      break;
    case TypeKind::Pointer:
      os << "*" << elem->to_string();
      break;
    case TypeKind::Slice:
      os << "[]" << elem->to_string();
      break;
    case TypeKind::Array:
      os << "[" << length << "]" << elem->to_string();
      break;
    case TypeKind::Map:
      os << "map[" << key->to_string() << "]" << elem->to_string();
      break;
    case TypeKind::Chan:
      if (dir == ChanDir::RecvOnly) {
        os << "<-chan " << elem->to_string();
      } else if (dir == ChanDir::SendOnly) {
        os << "chan<- " << elem->to_string();
      } else {
        os << "chan " << elem->to_string();
      }
      break;
    case TypeKind::Struct:
      os << "struct{";
      for (size_t i = 0; i < fields.size(); ++i) {
        if (i > 0) os << "; ";
        if (fields[i].embedded) {
          os << fields[i].type->to_string();
        } else {
          os << fields[i].name << " " << fields[i].type->to_string();
        }
      }
      os << "}";
      break;
    case TypeKind::Interface:
      os << "interface{";
      for (size_t i = 0; i < methods.size(); ++i) {
        if (i > 0) os << "; ";
        os << methods[i].name;
        write_signature_tail(os, *methods[i].signature);
      }
      os << "}";
      break;
    case TypeKind::Signature:
      os << "func";
      write_signature_tail(os, *this);
      break;
    case TypeKind::Tuple:
      os << "(";
      write_type_list(os, elements, false);
      os << ")";
      break;
  }
  return os.str();
}

// ============================================================================
// TypeContext Implementation
// ============================================================================

TypeContext::TypeContext()
{
  for (const auto & entry : k_basic_names) {
    Type t{TypeKind::Basic};
    t.basic = entry.first;
    basics_.push_back(push(std::move(t)));
  }
  empty_interface_ = get_interface({});
}

Type * TypeContext::push(Type t)
{
  types_.push_back(std::move(t));
  return &types_.back();
}

const Type * TypeContext::basic(BasicKind kind) const noexcept
{
  for (const Type * t : basics_) {
    if (t->basic == kind) return t;
  }
  return nullptr;
}

const Type * TypeContext::lookup_basic(std::string_view name) const
{
  if (name == "byte") return basic(BasicKind::Uint8);
  if (name == "rune") return basic(BasicKind::Int32);
  for (const auto & [kind, basic_name] : k_basic_names) {
    if (name == basic_name) return basic(kind);
  }
  return nullptr;
}

const Type * TypeContext::get_pointer(const Type * elem)
{
  // Search for existing
  for (const auto & t : types_) {
    if (t.kind == TypeKind::Pointer && t.elem == elem) {
      return &t;
    }
  }

  Type new_type{TypeKind::Pointer};
  new_type.elem = elem;
  return push(std::move(new_type));
}

const Type * TypeContext::get_slice(const Type * elem)
{
  for (const auto & t : types_) {
    if (t.kind == TypeKind::Slice && t.elem == elem) {
      return &t;
    }
  }

  Type new_type{TypeKind::Slice};
  new_type.elem = elem;
  return push(std::move(new_type));
}

const Type * TypeContext::get_array(const Type * elem, uint64_t length)
{
  for (const auto & t : types_) {
    if (t.kind == TypeKind::Array && t.elem == elem && t.length == length) {
      return &t;
    }
  }

  Type new_type{TypeKind::Array};
  new_type.elem = elem;
  new_type.length = length;
  return push(std::move(new_type));
}

const Type * TypeContext::get_map(const Type * key, const Type * value)
{
  for (const auto & t : types_) {
    if (t.kind == TypeKind::Map && t.key == key && t.elem == value) {
      return &t;
    }
  }

  Type new_type{TypeKind::Map};
  new_type.key = key;
  new_type.elem = value;
  return push(std::move(new_type));
}

const Type * TypeContext::get_chan(const Type * elem, ChanDir dir)
{
  for (const auto & t : types_) {
    if (t.kind == TypeKind::Chan && t.elem == elem && t.dir == dir) {
      return &t;
    }
  }

  Type new_type{TypeKind::Chan};
  new_type.elem = elem;
  new_type.dir = dir;
  return push(std::move(new_type));
}

const Type * TypeContext::get_struct(std::vector<StructField> fields)
{
  for (auto & f : fields) {
    f.name = intern(f.name);
  }
  for (const auto & t : types_) {
    if (t.kind == TypeKind::Struct && t.fields == fields) {
      return &t;
    }
  }

  Type new_type{TypeKind::Struct};
  new_type.fields = std::move(fields);
  return push(std::move(new_type));
}

const Type * TypeContext::get_interface(std::vector<InterfaceMethod> methods)
{
  for (auto & m : methods) {
    m.name = intern(m.name);
  }
  // Method order is irrelevant to identity
  std::sort(
    methods.begin(), methods.end(),
    [](const InterfaceMethod & a, const InterfaceMethod & b) { return a.name < b.name; });
  for (const auto & t : types_) {
    if (t.kind == TypeKind::Interface && t.methods == methods) {
      return &t;
    }
  }

  Type new_type{TypeKind::Interface};
  new_type.methods = std::move(methods);
  return push(std::move(new_type));
}

const Type * TypeContext::get_signature(
  std::vector<const Type *> params, std::vector<const Type *> results, bool variadic)
{
  for (const auto & t : types_) {
    if (
      t.kind == TypeKind::Signature && t.variadic == variadic && t.params == params &&
      t.results == results) {
      return &t;
    }
  }

  Type new_type{TypeKind::Signature};
  new_type.params = std::move(params);
  new_type.results = std::move(results);
  new_type.variadic = variadic;
  return push(std::move(new_type));
}

const Type * TypeContext::get_tuple(std::vector<const Type *> elements)
{
  for (const auto & t : types_) {
    if (t.kind == TypeKind::Tuple && t.elements == elements) {
      return &t;
    }
  }

  Type new_type{TypeKind::Tuple};
  new_type.elements = std::move(elements);
  return push(std::move(new_type));
}

Type * TypeContext::new_named(
  std::string_view package, std::string_view name, const Type * underlying)
{
  Type new_type{TypeKind::Named};
  new_type.package = intern(package);
  new_type.name = intern(name);
  new_type.underlying_type = underlying != nullptr ? underlying->underlying() : nullptr;
  return push(std::move(new_type));
}

void TypeContext::set_underlying(Type * named, const Type * underlying)
{
  if (named != nullptr && named->kind == TypeKind::Named && underlying != nullptr) {
    named->underlying_type = underlying->underlying();
  }
}

void TypeContext::add_method(
  Type * named, std::string_view name, const Function * fn, bool pointer_receiver)
{
  if (named == nullptr || named->kind != TypeKind::Named) {
    return;
  }
  named->declared_methods.push_back(MethodDecl{intern(name), fn, pointer_receiver});
}

Type * TypeContext::new_type_param(
  std::string_view name, const Type * constraint, const Type * core)
{
  Type new_type{TypeKind::TypeParam};
  new_type.name = intern(name);
  new_type.constraint = constraint;
  new_type.core = core;
  return push(std::move(new_type));
}

std::string_view TypeContext::intern(std::string_view s)
{
  auto it = strings_.find(s);
  if (it != strings_.end()) {
    return *it;
  }

  char * const ptr = static_cast<char *>(arena_.allocate(s.size() + 1, 1));
  std::memcpy(ptr, s.data(), s.size());
  ptr[s.size()] = '\0';

  const std::string_view stored(ptr, s.size());
  strings_.insert(stored);
  return stored;
}

}  // namespace typeflow
