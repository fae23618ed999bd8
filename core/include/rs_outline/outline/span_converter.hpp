// rs_outline/outline/span_converter.hpp - Parser positions to outline coordinates
//
// Outlines carry two coordinate systems:
//   - HumanSpan: 1-based line, 0-based byte column within the line (display)
//   - ByteSpan:  absolute byte offsets into the source text (exact slicing)
//
#pragma once

#include <cstdint>

namespace rs_outline
{

/// A position as reported by the parser: 0-based row, 0-based byte column.
struct TextPoint
{
  uint32_t row = 0;
  uint32_t column = 0;
};

/// A (line, column) endpoint of a HumanSpan.
struct HumanPoint
{
  int32_t line = 0;
  int32_t column = 0;

  friend constexpr bool operator==(HumanPoint a, HumanPoint b) noexcept
  {
    return a.line == b.line && a.column == b.column;
  }
  friend constexpr bool operator<=(HumanPoint a, HumanPoint b) noexcept
  {
    return a.line < b.line || (a.line == b.line && a.column <= b.column);
  }
};

struct HumanSpan
{
  HumanPoint start;
  HumanPoint end;

  friend constexpr bool operator==(const HumanSpan & a, const HumanSpan & b) noexcept
  {
    return a.start == b.start && a.end == b.end;
  }

  /// True when `inner` lies within this span (lexicographic comparison).
  [[nodiscard]] constexpr bool contains(const HumanSpan & inner) const noexcept
  {
    return start <= inner.start && inner.end <= end;
  }
};

/**
 * Absolute byte-offset range. Signed so that the reserved "unset" value
 * (0, -1) can be represented.
 */
struct ByteSpan
{
  int32_t start = 0;
  int32_t end = -1;

  [[nodiscard]] static constexpr ByteSpan unset() noexcept { return {0, -1}; }

  [[nodiscard]] constexpr bool is_unset() const noexcept { return start == 0 && end == -1; }

  friend constexpr bool operator==(const ByteSpan & a, const ByteSpan & b) noexcept
  {
    return a.start == b.start && a.end == b.end;
  }
};

/// Row becomes 1-based, column stays 0-based.
[[nodiscard]] constexpr HumanPoint to_human_point(TextPoint p) noexcept
{
  return {static_cast<int32_t>(p.row) + 1, static_cast<int32_t>(p.column)};
}

[[nodiscard]] constexpr HumanSpan to_human_span(TextPoint start, TextPoint end) noexcept
{
  return {to_human_point(start), to_human_point(end)};
}

/// Byte offsets pass through unchanged.
[[nodiscard]] constexpr ByteSpan to_byte_span(uint32_t start_byte, uint32_t end_byte) noexcept
{
  return {static_cast<int32_t>(start_byte), static_cast<int32_t>(end_byte)};
}

}  // namespace rs_outline
