// typeflow/basic/source_pos.hpp - Source positions attached to IR instructions
//
#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace typeflow
{

/**
 * A position in the source file an instruction was lowered from.
 *
 * Positions are supplied by the collaborator that builds the IR. The file
 * name is interned by the owning Program, so a SourcePos is cheap to copy.
 */
class SourcePos
{
public:
  /// Create an unknown position
  constexpr SourcePos() noexcept = default;

  constexpr SourcePos(std::string_view file, uint32_t line, uint32_t column) noexcept
  : file_(file), line_(line), column_(column)
  {
  }

  /// Lines are 1-based; line 0 means "no position"
  [[nodiscard]] constexpr bool is_valid() const noexcept { return line_ != 0; }

  [[nodiscard]] constexpr std::string_view get_file() const noexcept { return file_; }
  [[nodiscard]] constexpr uint32_t get_line() const noexcept { return line_; }
  [[nodiscard]] constexpr uint32_t get_column() const noexcept { return column_; }

  [[nodiscard]] constexpr bool operator==(const SourcePos & other) const noexcept
  {
    return file_ == other.file_ && line_ == other.line_ && column_ == other.column_;
  }
  [[nodiscard]] constexpr bool operator!=(const SourcePos & other) const noexcept
  {
    return !(*this == other);
  }

  /// Render as `file:line:col` (`-` when unknown)
  [[nodiscard]] std::string to_string() const;

private:
  std::string_view file_;
  uint32_t line_ = 0;
  uint32_t column_ = 0;
};

}  // namespace typeflow
