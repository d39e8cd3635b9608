// typeflow/basic/diagnostic.cpp - Diagnostic implementation
//
#include "typeflow/basic/diagnostic.hpp"

#include <algorithm>
#include <iterator>
#include <utility>

namespace typeflow
{

std::string SourcePos::to_string() const
{
  if (!is_valid()) {
    return "-";
  }
  const std::string file = file_.empty() ? std::string("<unknown>") : std::string(file_);
  return file + ":" + std::to_string(line_) + ":" + std::to_string(column_);
}

std::string Diagnostic::to_string() const
{
  std::string out = pos.to_string();
  out += is_error() ? ": error: " : ": warning: ";
  out += message;
  if (!code.empty()) {
    out += " [" + code + "]";
  }
  for (const auto & note : notes) {
    out += "\n  note: " + note;
  }
  if (help_message) {
    out += "\n  help: " + *help_message;
  }
  return out;
}

// ============================================================================
// DiagnosticBuilder
// ============================================================================

DiagnosticBuilder::DiagnosticBuilder(DiagnosticBag & bag, Diagnostic diag)
: bag_(bag), diagnostic_(std::move(diag))
{
}

DiagnosticBuilder::DiagnosticBuilder(DiagnosticBuilder && other) noexcept
: bag_(other.bag_), diagnostic_(std::move(other.diagnostic_)), committed_(other.committed_)
{
  other.committed_ = true;
}

DiagnosticBuilder::~DiagnosticBuilder()
{
  if (!committed_) {
    bag_.add(std::move(diagnostic_));
  }
}

DiagnosticBuilder & DiagnosticBuilder::with_code(std::string code)
{
  diagnostic_.code = std::move(code);
  return *this;
}

DiagnosticBuilder & DiagnosticBuilder::with_note(std::string note)
{
  diagnostic_.notes.push_back(std::move(note));
  return *this;
}

DiagnosticBuilder & DiagnosticBuilder::with_help(std::string help_msg)
{
  diagnostic_.help_message = std::move(help_msg);
  return *this;
}

// ============================================================================
// DiagnosticBag
// ============================================================================

DiagnosticBuilder DiagnosticBag::report_error(SourcePos pos, std::string message)
{
  Diagnostic d;
  d.pos = pos;
  d.message = std::move(message);
  return {*this, std::move(d)};
}

DiagnosticBuilder DiagnosticBag::report_warning(SourcePos pos, std::string message)
{
  Diagnostic d;
  d.severity = Severity::Warning;
  d.pos = pos;
  d.message = std::move(message);
  return {*this, std::move(d)};
}

void DiagnosticBag::merge(DiagnosticBag && other)
{
  diagnostics_.insert(
    diagnostics_.end(), std::make_move_iterator(other.diagnostics_.begin()),
    std::make_move_iterator(other.diagnostics_.end()));
  other.diagnostics_.clear();
}

bool DiagnosticBag::has_errors() const noexcept
{
  return std::any_of(
    diagnostics_.begin(), diagnostics_.end(), [](const Diagnostic & d) { return d.is_error(); });
}

const Diagnostic * DiagnosticBag::find_code(const std::string & code) const noexcept
{
  auto it = std::find_if(
    diagnostics_.begin(), diagnostics_.end(), [&](const Diagnostic & d) { return d.code == code; });
  return it != diagnostics_.end() ? &*it : nullptr;
}

}  // namespace typeflow
