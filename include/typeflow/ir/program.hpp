// typeflow/ir/program.hpp - Whole-program container
//
// A Program owns every type, package, function, global, constant and builtin
// of the analyzed code. It is built by a collaborator (lowering from source,
// or test fixtures through FunctionBuilder) and is read-only to the analysis.
//
#pragma once

#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "typeflow/ir/function.hpp"
#include "typeflow/ir/type.hpp"
#include "typeflow/ir/value.hpp"

namespace typeflow
{

class Program;

// ============================================================================
// Package
// ============================================================================

/// A Go-style package: a named group of functions and globals.
class Package
{
public:
  Package(Program * program, std::string_view name) : program_(program), name_(name) {}

  Package(const Package &) = delete;
  Package & operator=(const Package &) = delete;

  [[nodiscard]] Program * get_program() const noexcept { return program_; }
  [[nodiscard]] std::string_view get_name() const noexcept { return name_; }

  /// Functions declared in this package (anonymous functions included)
  [[nodiscard]] const std::vector<Function *> & functions() const noexcept { return functions_; }
  [[nodiscard]] const std::vector<Global *> & globals() const noexcept { return globals_; }

private:
  friend class Program;

  Program * program_;
  std::string_view name_;
  std::vector<Function *> functions_;
  std::vector<Global *> globals_;
};

// ============================================================================
// Program
// ============================================================================

class Program
{
public:
  Program() = default;

  Program(const Program &) = delete;
  Program & operator=(const Program &) = delete;

  [[nodiscard]] TypeContext & types() noexcept { return types_; }
  [[nodiscard]] const TypeContext & types() const noexcept { return types_; }

  // ===========================================================================
  // Declarations
  // ===========================================================================

  Package * create_package(std::string_view name);

  /// Package-level function; `init` becomes a package initializer
  Function * create_function(Package * pkg, std::string_view name, const Type * signature);

  /**
   * Method of named type `recv_named` with receiver T or *T.
   *
   * The receiver becomes parameter 0 (named `recv_name`) and the method is
   * added to the method set of the named type.
   */
  Function * create_method(
    Package * pkg, Type * recv_named, std::string_view name, const Type * signature,
    bool pointer_receiver, std::string_view recv_name = "recv");

  /// Anonymous function nested in `enclosing`, named `<enclosing>$<n>`
  Function * create_anonymous(Function * enclosing, const Type * signature);

  /// Instance of generic `origin` with the given type arguments
  Function * create_instance(
    Function * origin, std::vector<const Type *> type_args, const Type * signature);

  /// Package-level variable of type `declared`; its value has type *declared
  Global * create_global(Package * pkg, std::string_view name, const Type * declared);

  Const * create_const(const Type * type, std::string literal);

  /// Typed nil constant
  Const * create_nil(const Type * type) { return create_const(type, "nil"); }

  /// Built-in function by name, created on first use
  Builtin * builtin(std::string_view name);

  // ===========================================================================
  // Queries
  // ===========================================================================

  [[nodiscard]] const std::vector<std::unique_ptr<Package>> & packages() const noexcept
  {
    return packages_;
  }

  /// Every function in creation order
  [[nodiscard]] std::vector<Function *> all_functions() const;

  /// Find a function by rel_string() (first match across packages)
  [[nodiscard]] Function * find_function(std::string_view rel_name) const;

  [[nodiscard]] size_t function_count() const noexcept { return functions_.size(); }

private:
  Function * add_function(std::unique_ptr<Function> fn, Package * pkg);

  TypeContext types_;
  std::vector<std::unique_ptr<Package>> packages_;
  std::vector<std::unique_ptr<Function>> functions_;
  std::vector<std::unique_ptr<Global>> globals_;
  std::vector<std::unique_ptr<Const>> consts_;
  std::vector<std::unique_ptr<Builtin>> builtins_;
};

}  // namespace typeflow
