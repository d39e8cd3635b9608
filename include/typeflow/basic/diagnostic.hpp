// typeflow/basic/diagnostic.hpp - Diagnostics reported by the analysis
//
// The library never throws: malformed input, unsupported values and a
// broken propagation bound are collected here, and each phase reports
// success through its result struct.
//
#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "typeflow/basic/source_pos.hpp"

namespace typeflow
{

// ============================================================================
// Diagnostic Codes
// ============================================================================

/// Instruction whose operands cannot be classified into flow nodes
inline constexpr const char * k_diag_malformed_instruction = "VTA001";
/// Value kind the flow-graph builder cannot turn into a node
inline constexpr const char * k_diag_unsupported_value = "VTA002";
/// Propagation exceeded its round bound (monotonicity broken)
inline constexpr const char * k_diag_round_bound = "VTA003";

// ============================================================================
// Diagnostic
// ============================================================================

enum class Severity : uint8_t {
  Error,
  Warning,
};

struct Diagnostic
{
  Severity severity = Severity::Error;
  std::string code;
  std::string message;
  /// Position of the offending instruction; invalid for whole-program errors
  SourcePos pos;

  /// Context lines, e.g. `in function f` and the instruction rendering
  std::vector<std::string> notes;
  std::optional<std::string> help_message;

  [[nodiscard]] bool is_error() const noexcept { return severity == Severity::Error; }

  /// `file:line:col: error: message [code]`, then one line per note
  [[nodiscard]] std::string to_string() const;
};

class DiagnosticBag;

/**
 * Fills in a diagnostic and adds it to its bag when destroyed.
 *
 * ```cpp
 * diags.report_error(instr->get_pos(), "lookup on a non-map operand")
 *   .with_code(k_diag_malformed_instruction)
 *   .with_note("in function " + fn->rel_string());
 * ```
 */
class DiagnosticBuilder
{
public:
  DiagnosticBuilder(DiagnosticBag & bag, Diagnostic diag);
  DiagnosticBuilder(DiagnosticBuilder && other) noexcept;
  DiagnosticBuilder(const DiagnosticBuilder &) = delete;
  DiagnosticBuilder & operator=(const DiagnosticBuilder &) = delete;
  ~DiagnosticBuilder();

  DiagnosticBuilder & with_code(std::string code);
  DiagnosticBuilder & with_note(std::string note);
  DiagnosticBuilder & with_help(std::string help_msg);

private:
  DiagnosticBag & bag_;
  Diagnostic diagnostic_;
  bool committed_ = false;
};

// ============================================================================
// DiagnosticBag
// ============================================================================

/// Ordered collection of diagnostics for one analysis run
class DiagnosticBag
{
public:
  DiagnosticBuilder report_error(SourcePos pos, std::string message);
  DiagnosticBuilder report_warning(SourcePos pos, std::string message);

  void add(Diagnostic diag) { diagnostics_.push_back(std::move(diag)); }

  /// Append the diagnostics of `other`, leaving it empty
  void merge(DiagnosticBag && other);

  [[nodiscard]] const std::vector<Diagnostic> & all() const noexcept { return diagnostics_; }
  [[nodiscard]] bool empty() const noexcept { return diagnostics_.empty(); }
  [[nodiscard]] size_t size() const noexcept { return diagnostics_.size(); }
  [[nodiscard]] bool has_errors() const noexcept;

  [[nodiscard]] bool has_code(const std::string & code) const noexcept
  {
    return find_code(code) != nullptr;
  }

  /// First diagnostic with `code`, or nullptr
  [[nodiscard]] const Diagnostic * find_code(const std::string & code) const noexcept;

  [[nodiscard]] auto begin() const noexcept { return diagnostics_.begin(); }
  [[nodiscard]] auto end() const noexcept { return diagnostics_.end(); }

private:
  std::vector<Diagnostic> diagnostics_;
};

}  // namespace typeflow
