// typeflow/ir/function.hpp - Basic blocks and functions
//
#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

#include "typeflow/ir/instruction.hpp"
#include "typeflow/ir/value.hpp"

namespace typeflow
{

class Package;

// ============================================================================
// Basic Block
// ============================================================================

/**
 * A straight-line sequence of instructions.
 *
 * Blocks own their instructions. Successors are set by the last
 * instruction (Jump: one, If: two, Return/Panic: none).
 */
class BasicBlock
{
public:
  BasicBlock(Function * parent, size_t index, std::string comment)
  : parent_(parent), index_(index), comment_(std::move(comment))
  {
  }

  BasicBlock(const BasicBlock &) = delete;
  BasicBlock & operator=(const BasicBlock &) = delete;

  [[nodiscard]] Function * get_parent() const noexcept { return parent_; }
  [[nodiscard]] size_t get_index() const noexcept { return index_; }
  [[nodiscard]] const std::string & get_comment() const noexcept { return comment_; }

  [[nodiscard]] const std::vector<std::unique_ptr<Instruction>> & instructions() const noexcept
  {
    return instrs_;
  }

  [[nodiscard]] const std::vector<BasicBlock *> & successors() const noexcept { return succs_; }
  [[nodiscard]] const std::vector<BasicBlock *> & predecessors() const noexcept { return preds_; }

  /// Append an instruction and take ownership of it
  template <typename T>
  T * append(std::unique_ptr<T> instr)
  {
    T * ptr = instr.get();
    static_cast<Instruction *>(ptr)->block_ = this;
    instrs_.push_back(std::move(instr));
    return ptr;
  }

  void add_successor(BasicBlock * target)
  {
    succs_.push_back(target);
    if (target != nullptr) {
      target->preds_.push_back(this);
    }
  }

private:
  Function * parent_;
  size_t index_;
  std::string comment_;
  std::vector<std::unique_ptr<Instruction>> instrs_;
  std::vector<BasicBlock *> succs_;
  std::vector<BasicBlock *> preds_;
};

// ============================================================================
// Function
// ============================================================================

/**
 * A function, method, closure body or generic instantiation.
 *
 * The value of a Function is the function itself; its type is its signature
 * without receiver. Methods carry their receiver as parameter 0 and record
 * the receiver type (T or *T) separately.
 *
 * Anonymous functions are owned by the Program like any other function and
 * link to their enclosing function through get_enclosing(). Instances of a
 * generic function link to it through get_origin().
 */
class Function : public ValueBase<Function, Value, ValueKind::Function>
{
public:
  Function(std::string name, const Type * signature, Package * package)
  : ValueBase(signature, std::move(name)), package_(package)
  {
  }

  // ===========================================================================
  // Identity
  // ===========================================================================

  [[nodiscard]] Package * get_package() const noexcept { return package_; }

  /// Signature without receiver
  [[nodiscard]] const Type * get_signature() const noexcept { return get_type(); }

  /// Receiver type for methods (T or *T), nullptr otherwise
  [[nodiscard]] const Type * get_receiver_type() const noexcept { return receiver_; }
  [[nodiscard]] bool is_method() const noexcept { return receiver_ != nullptr; }

  /// Enclosing function of an anonymous function
  [[nodiscard]] Function * get_enclosing() const noexcept { return enclosing_; }

  /// Generic function this function instantiates
  [[nodiscard]] Function * get_origin() const noexcept { return origin_; }
  [[nodiscard]] const std::vector<const Type *> & get_type_args() const noexcept
  {
    return type_args_;
  }

  /// Package initializers are never address-taken
  [[nodiscard]] bool is_package_init() const noexcept { return package_init_; }

  /**
   * Name relative to the function's own package.
   *
   * `f`, `(C).f`, `(*C).f`, `f$1`, `instantiated[P.A]`.
   */
  [[nodiscard]] std::string rel_string() const;

  // ===========================================================================
  // Body
  // ===========================================================================

  [[nodiscard]] const std::vector<std::unique_ptr<Parameter>> & params() const noexcept
  {
    return params_;
  }
  [[nodiscard]] const std::vector<std::unique_ptr<FreeVar>> & free_vars() const noexcept
  {
    return free_vars_;
  }
  [[nodiscard]] const std::vector<std::unique_ptr<BasicBlock>> & blocks() const noexcept
  {
    return blocks_;
  }

  /// Functions without blocks are external (declared only)
  [[nodiscard]] bool has_body() const noexcept { return !blocks_.empty(); }

  /// Number of results in the signature
  [[nodiscard]] size_t result_count() const noexcept;

  /// Type of result `index`, or nullptr
  [[nodiscard]] const Type * result_type(size_t index) const noexcept;

  Parameter * add_param(std::string name, const Type * type);
  FreeVar * add_free_var(std::string name, const Type * type);
  BasicBlock * add_block(std::string comment = {});

  /// Next register name ("t0", "t1", ...)
  std::string next_register_name() { return "t" + std::to_string(next_register_++); }

  /// Next anonymous function ordinal (1-based)
  size_t next_anon_index() noexcept { return ++anon_count_; }

private:
  friend class Program;

  Package * package_;
  const Type * receiver_ = nullptr;
  Function * enclosing_ = nullptr;
  Function * origin_ = nullptr;
  std::vector<const Type *> type_args_;
  bool package_init_ = false;

  std::vector<std::unique_ptr<Parameter>> params_;
  std::vector<std::unique_ptr<FreeVar>> free_vars_;
  std::vector<std::unique_ptr<BasicBlock>> blocks_;

  size_t next_register_ = 0;
  size_t anon_count_ = 0;
};

}  // namespace typeflow
