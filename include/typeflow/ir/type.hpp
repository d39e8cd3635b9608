// typeflow/ir/type.hpp - Static types of the program representation
//
// Types are interned by TypeContext: two structurally identical composite
// types are the same object, so type identity is pointer identity. Named
// types and type parameters are nominal and never unified.
//
#pragma once

#include <cstdint>
#include <deque>
#include <memory_resource>
#include <string>
#include <string_view>
#include <unordered_set>
#include <vector>

namespace typeflow
{

class Function;

// ============================================================================
// Type Kind
// ============================================================================

enum class TypeKind : uint8_t {
  Basic,
  Named,      ///< pkg.Name with an underlying type and declared methods
  Pointer,    ///< *T
  Slice,      ///< []T
  Array,      ///< [N]T
  Map,        ///< map[K]V
  Chan,       ///< chan T, chan<- T, <-chan T
  Struct,     ///< struct{...}
  Interface,  ///< interface{...}
  Signature,  ///< func(...) ...
  Tuple,      ///< (T1, T2, ...) - multi-value results
  TypeParam,  ///< type parameter of a generic function (uninstantiated code only)
};

enum class BasicKind : uint8_t {
  Bool,
  Int,
  Int8,
  Int16,
  Int32,
  Int64,
  Uint,
  Uint8,
  Uint16,
  Uint32,
  Uint64,
  Uintptr,
  Float32,
  Float64,
  String,
  UnsafePointer,
  UntypedNil,
};

enum class ChanDir : uint8_t {
  SendRecv,
  SendOnly,
  RecvOnly,
};

struct Type;

struct StructField
{
  std::string_view name;
  const Type * type = nullptr;
  bool embedded = false;

  [[nodiscard]] bool operator==(const StructField & o) const noexcept
  {
    return name == o.name && type == o.type && embedded == o.embedded;
  }
};

/// Abstract method of an interface. `signature` excludes the receiver.
struct InterfaceMethod
{
  std::string_view name;
  const Type * signature = nullptr;

  [[nodiscard]] bool operator==(const InterfaceMethod & o) const noexcept
  {
    return name == o.name && signature == o.signature;
  }
};

/// Concrete method declared on a named type.
struct MethodDecl
{
  std::string_view name;
  const Function * function = nullptr;
  bool pointer_receiver = false;
};

// ============================================================================
// Type
// ============================================================================

/**
 * Semantic type of an IR value.
 *
 * Only the fields relevant to `kind` are populated.
 */
struct Type
{
  TypeKind kind;

  /// For Basic
  BasicKind basic = BasicKind::Int;

  /// For Named and TypeParam: the declared name; for Named: the package
  std::string_view name;
  std::string_view package;

  /// For Pointer/Slice/Array/Chan: element type; for Map: value type
  const Type * elem = nullptr;

  /// For Map: key type
  const Type * key = nullptr;

  /// For Named: underlying type (set once the declaration is complete)
  const Type * underlying_type = nullptr;

  /// For TypeParam: constraint (an interface) and optional core type
  const Type * constraint = nullptr;
  const Type * core = nullptr;

  /// For Array: length
  uint64_t length = 0;

  /// For Chan: direction
  ChanDir dir = ChanDir::SendRecv;

  /// For Signature: whether the last parameter is variadic
  bool variadic = false;

  /// For Struct
  std::vector<StructField> fields;

  /// For Interface, sorted by name
  std::vector<InterfaceMethod> methods;

  /// For Signature
  std::vector<const Type *> params;
  std::vector<const Type *> results;

  /// For Tuple
  std::vector<const Type *> elements;

  /// For Named: methods declared with T or *T receivers
  std::vector<MethodDecl> declared_methods;

  // ===========================================================================
  // Type Queries
  // ===========================================================================

  /// Underlying type: Named types resolve to their declaration, others are their own
  [[nodiscard]] const Type * underlying() const noexcept
  {
    if (kind == TypeKind::Named) {
      return underlying_type != nullptr ? underlying_type : this;
    }
    return this;
  }

  [[nodiscard]] bool is_named() const noexcept { return kind == TypeKind::Named; }
  [[nodiscard]] bool is_pointer() const noexcept { return kind == TypeKind::Pointer; }
  [[nodiscard]] bool is_type_param() const noexcept { return kind == TypeKind::TypeParam; }

  /// Interfaces and type parameters are not concrete
  [[nodiscard]] bool is_interface() const noexcept
  {
    return kind == TypeKind::TypeParam || underlying()->kind == TypeKind::Interface;
  }

  [[nodiscard]] bool is_signature() const noexcept
  {
    return underlying()->kind == TypeKind::Signature;
  }

  [[nodiscard]] bool is_tuple() const noexcept { return kind == TypeKind::Tuple; }

  /// Go-style rendering, e.g. `*int`, `map[string]P.I`, `func(int) (bool, error)`
  [[nodiscard]] std::string to_string() const;
};

// ============================================================================
// Type Context
// ============================================================================

/**
 * Owns and interns all types of one Program.
 *
 * Composite types are created on demand and deduplicated; named types
 * and type parameters are created fresh on every call.
 */
class TypeContext
{
public:
  TypeContext();

  TypeContext(const TypeContext &) = delete;
  TypeContext & operator=(const TypeContext &) = delete;

  // ===========================================================================
  // Built-in Types
  // ===========================================================================

  [[nodiscard]] const Type * basic(BasicKind kind) const noexcept;

  [[nodiscard]] const Type * bool_type() const noexcept { return basic(BasicKind::Bool); }
  [[nodiscard]] const Type * int_type() const noexcept { return basic(BasicKind::Int); }
  [[nodiscard]] const Type * string_type() const noexcept { return basic(BasicKind::String); }
  [[nodiscard]] const Type * byte_type() const noexcept { return basic(BasicKind::Uint8); }

  /// `interface{}`
  [[nodiscard]] const Type * empty_interface() const noexcept { return empty_interface_; }

  /// Look up a basic type by its Go name ("int", "string", "byte", ...)
  [[nodiscard]] const Type * lookup_basic(std::string_view name) const;

  // ===========================================================================
  // Composite Type Creation (Interned)
  // ===========================================================================

  const Type * get_pointer(const Type * elem);
  const Type * get_slice(const Type * elem);
  const Type * get_array(const Type * elem, uint64_t length);
  const Type * get_map(const Type * key, const Type * value);
  const Type * get_chan(const Type * elem, ChanDir dir = ChanDir::SendRecv);
  const Type * get_struct(std::vector<StructField> fields);
  const Type * get_interface(std::vector<InterfaceMethod> methods);
  const Type * get_signature(
    std::vector<const Type *> params, std::vector<const Type *> results, bool variadic = false);
  const Type * get_tuple(std::vector<const Type *> elements);

  // ===========================================================================
  // Nominal Types
  // ===========================================================================

  /// Declare a named type; the underlying type may be supplied later
  Type * new_named(
    std::string_view package, std::string_view name, const Type * underlying = nullptr);

  void set_underlying(Type * named, const Type * underlying);

  /// Attach a concrete method to a named type
  void add_method(Type * named, std::string_view name, const Function * fn, bool pointer_receiver);

  Type * new_type_param(
    std::string_view name, const Type * constraint, const Type * core = nullptr);

  // ===========================================================================
  // Strings
  // ===========================================================================

  /// Intern a string; the view stays valid for the lifetime of the context
  [[nodiscard]] std::string_view intern(std::string_view s);

  [[nodiscard]] size_t size() const noexcept { return types_.size(); }

private:
  Type * push(Type t);

  std::vector<const Type *> basics_;
  const Type * empty_interface_ = nullptr;

  std::pmr::monotonic_buffer_resource arena_{4096};
  // Pointers to types are handed out widely; the container must keep
  // element addresses stable.
  std::pmr::deque<Type> types_{&arena_};
  std::pmr::unordered_set<std::string_view> strings_{&arena_};
};

}  // namespace typeflow
