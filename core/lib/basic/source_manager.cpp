// rs_outline/basic/source_manager.cpp - Source file implementation
#include "rs_outline/basic/source_manager.hpp"

#include <algorithm>

namespace rs_outline
{

bool is_valid_utf8(std::string_view text) noexcept
{
  size_t i = 0;
  while (i < text.size()) {
    const auto lead = static_cast<unsigned char>(text[i]);
    if (lead < 0x80) {
      ++i;
      continue;
    }

    size_t len = 0;
    uint32_t cp = 0;
    if ((lead & 0xE0) == 0xC0) {
      len = 2;
      cp = lead & 0x1F;
    } else if ((lead & 0xF0) == 0xE0) {
      len = 3;
      cp = lead & 0x0F;
    } else if ((lead & 0xF8) == 0xF0) {
      len = 4;
      cp = lead & 0x07;
    } else {
      return false;
    }

    if (i + len > text.size()) return false;
    for (size_t k = 1; k < len; ++k) {
      const auto c = static_cast<unsigned char>(text[i + k]);
      if ((c & 0xC0) != 0x80) return false;
      cp = (cp << 6) | (c & 0x3F);
    }

    // Overlong encodings
    if ((len == 2 && cp < 0x80) || (len == 3 && cp < 0x800) || (len == 4 && cp < 0x10000)) {
      return false;
    }
    if (cp > 0x10FFFF) return false;
    if (cp >= 0xD800 && cp <= 0xDFFF) return false;

    i += len;
  }
  return true;
}

LineColumn SourceManager::get_line_column(uint32_t offset) const noexcept
{
  if (offset > source_.size()) {
    offset = static_cast<uint32_t>(source_.size());
  }

  auto it = std::upper_bound(line_offsets_.begin(), line_offsets_.end(), offset);
  if (it == line_offsets_.begin()) {
    return {1, offset + 1};
  }
  --it;

  const uint32_t line = static_cast<uint32_t>(it - line_offsets_.begin()) + 1;
  const uint32_t column = offset - *it + 1;
  return {line, column};
}

std::string_view SourceManager::get_line(uint32_t line_index) const noexcept
{
  if (line_index >= line_offsets_.size()) {
    return {};
  }

  const uint32_t start = line_offsets_[line_index];
  auto end = static_cast<uint32_t>(source_.size());
  if (line_index + 1 < line_offsets_.size()) {
    end = line_offsets_[line_index + 1];
    if (end > start && source_[end - 1] == '\n') {
      --end;
    }
  }

  return std::string_view(source_).substr(start, end - start);
}

std::string_view SourceManager::get_source_slice(SourceRange range) const noexcept
{
  if (range.is_invalid()) return {};
  const auto start = range.get_begin().get_offset();
  auto end = range.get_end().get_offset();
  if (start >= source_.size() || end <= start) return {};
  if (end > source_.size()) end = static_cast<uint32_t>(source_.size());
  return std::string_view(source_).substr(start, end - start);
}

FullSourceRange SourceManager::get_full_range(SourceRange range) const noexcept
{
  FullSourceRange result;
  if (range.is_invalid()) {
    return result;
  }

  const auto start_lc = get_line_column(range.get_begin().get_offset());
  const auto end_lc = get_line_column(range.get_end().get_offset());

  result.start_line = start_lc.line;
  result.start_column = start_lc.column;
  result.end_line = end_lc.line;
  result.end_column = end_lc.column;

  return result;
}

uint32_t SourceManager::count_text_lines() const noexcept
{
  if (source_.empty()) return 0;
  const auto breaks = static_cast<uint32_t>(line_offsets_.size() - 1);
  return source_.back() == '\n' ? breaks : breaks + 1;
}

uint32_t SourceManager::last_text_line_length() const noexcept
{
  if (source_.empty()) return 0;

  size_t end = source_.size();
  if (source_[end - 1] == '\n') {
    --end;
    if (end > 0 && source_[end - 1] == '\r') --end;
  }

  const size_t brk = source_.rfind('\n', end == 0 ? 0 : end - 1);
  const size_t start = (brk == std::string::npos || brk >= end) ? 0 : brk + 1;
  return static_cast<uint32_t>(end - start);
}

void SourceManager::build_line_table()
{
  line_offsets_.clear();
  line_offsets_.push_back(0);

  for (size_t i = 0; i < source_.size(); ++i) {
    if (source_[i] == '\n') {
      line_offsets_.push_back(static_cast<uint32_t>(i + 1));
    }
  }
}

}  // namespace rs_outline
