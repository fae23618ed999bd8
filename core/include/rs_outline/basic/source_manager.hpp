// rs_outline/basic/source_manager.hpp - Source location and range management
//
// This header provides types for tracking byte ranges in one source file and
// converting them to line/column positions.
//
#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace rs_outline
{

// ============================================================================
// SourceLocation - Compact source position
// ============================================================================

/**
 * A compact representation of a source location.
 *
 * Internally stores a byte offset into the source file. Line and column
 * information can be computed on demand via SourceManager.
 */
class SourceLocation
{
public:
  /// Invalid/unknown location sentinel
  static constexpr uint32_t k_invalid_offset = UINT32_MAX;

  constexpr SourceLocation() noexcept : offset_(k_invalid_offset) {}
  constexpr explicit SourceLocation(uint32_t offset) noexcept : offset_(offset) {}

  [[nodiscard]] constexpr bool is_invalid() const noexcept { return offset_ == k_invalid_offset; }

  [[nodiscard]] constexpr uint32_t get_offset() const noexcept { return offset_; }

  [[nodiscard]] constexpr bool operator<(SourceLocation other) const noexcept
  {
    return offset_ < other.offset_;
  }

private:
  uint32_t offset_;
};

// ============================================================================
// SourceRange - Start and end locations
// ============================================================================

/**
 * A half-open byte range [start, end) into the source text.
 */
class SourceRange
{
public:
  constexpr SourceRange() noexcept = default;

  constexpr SourceRange(SourceLocation start, SourceLocation end) noexcept
  : start_(start), end_(end)
  {
  }

  constexpr SourceRange(uint32_t start_offset, uint32_t end_offset) noexcept
  : start_(SourceLocation(start_offset)), end_(SourceLocation(end_offset))
  {
  }

  [[nodiscard]] constexpr SourceLocation get_begin() const noexcept { return start_; }
  [[nodiscard]] constexpr SourceLocation get_end() const noexcept { return end_; }

  [[nodiscard]] constexpr bool is_invalid() const noexcept
  {
    return start_.is_invalid() || end_.is_invalid();
  }

private:
  SourceLocation start_;
  SourceLocation end_;
};

// ============================================================================
// LineColumn - Human-readable position
// ============================================================================

/**
 * Human-readable line and column position (1-indexed), used for diagnostics.
 */
struct LineColumn
{
  uint32_t line = 0;    ///< 1-indexed line number (0 = invalid)
  uint32_t column = 0;  ///< 1-indexed column number (0 = invalid)
};

/**
 * Range with pre-computed line/column information (diagnostic printing).
 */
struct FullSourceRange
{
  uint32_t start_line = 0;
  uint32_t start_column = 0;
  uint32_t end_line = 0;
  uint32_t end_column = 0;

  [[nodiscard]] bool is_valid() const noexcept { return start_line > 0; }
};

/**
 * Returns true when `text` is well-formed UTF-8 (no overlongs, no surrogates,
 * nothing above U+10FFFF).
 */
[[nodiscard]] bool is_valid_utf8(std::string_view text) noexcept;

// ============================================================================
// SourceManager - Source file and location management
// ============================================================================

/**
 * Owns the text of one source file and provides location services.
 *
 * Features:
 * - Stores the file path exactly as supplied by the caller
 * - Converts between byte offsets and line/column positions
 * - Slices text by byte range, clamping out-of-range requests
 */
class SourceManager
{
public:
  explicit SourceManager(std::string source) : source_(std::move(source)) { build_line_table(); }

  SourceManager(std::filesystem::path file_path, std::string source)
  : file_path_(std::move(file_path)), source_(std::move(source))
  {
    build_line_table();
  }

  [[nodiscard]] const std::filesystem::path & get_file_path() const noexcept { return file_path_; }

  [[nodiscard]] std::string_view get_source() const noexcept { return source_; }

  [[nodiscard]] size_t size() const noexcept { return source_.size(); }

  /// Convert byte offset to line/column (both 1-indexed)
  [[nodiscard]] LineColumn get_line_column(uint32_t offset) const noexcept;

  /// Get the content of a specific line (0-indexed), without the line break
  [[nodiscard]] std::string_view get_line(uint32_t line_index) const noexcept;

  /**
   * Get a slice of source by range.
   *
   * An invalid range or a start past the end yields an empty view; an end
   * past the end of the text is clamped.
   */
  [[nodiscard]] std::string_view get_source_slice(SourceRange range) const noexcept;

  [[nodiscard]] FullSourceRange get_full_range(SourceRange range) const noexcept;

  /**
   * Number of text lines, counted the way an editor shows them: a trailing
   * line break does not open a new line, and an empty file has zero lines.
   */
  [[nodiscard]] uint32_t count_text_lines() const noexcept;

  /// Byte length of the last text line, excluding "\n" / "\r\n" (0 if empty)
  [[nodiscard]] uint32_t last_text_line_length() const noexcept;

private:
  void build_line_table();

  std::filesystem::path file_path_;
  std::string source_;
  std::vector<uint32_t> line_offsets_;  ///< Offset of each line start
};

}  // namespace rs_outline
