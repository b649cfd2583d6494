// xaml_bridge/basic/source_index.cpp - Line start index implementation
#include "xaml_bridge/basic/source_index.hpp"

#include <algorithm>

namespace xaml_bridge
{

uint32_t SourceIndex::line_start(uint32_t line) const noexcept
{
  if (line == 0 || line > line_offsets_.size()) {
    return size();
  }
  return line_offsets_[line - 1];
}

uint32_t SourceIndex::character_position(uint32_t line, uint32_t column) const noexcept
{
  if (line == 0 || line > line_offsets_.size()) {
    return size();
  }
  const int64_t pos =
    static_cast<int64_t>(line_offsets_[line - 1]) + static_cast<int64_t>(column) - 2;
  if (pos < 0) {
    return 0;
  }
  return static_cast<uint32_t>(std::min<int64_t>(pos, size()));
}

LineColumn SourceIndex::line_column(uint32_t offset) const noexcept
{
  if (offset > text_.size()) {
    offset = size();
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

std::string_view SourceIndex::line_text(uint32_t line) const noexcept
{
  if (line == 0 || line > line_offsets_.size()) {
    return {};
  }

  const uint32_t start = line_offsets_[line - 1];
  uint32_t end = size();
  if (line < line_offsets_.size()) {
    end = line_offsets_[line];
  }
  while (end > start && (text_[end - 1] == '\n' || text_[end - 1] == '\r')) {
    --end;
  }
  return std::string_view(text_).substr(start, end - start);
}

std::string_view SourceIndex::slice(SourceRange range) const noexcept
{
  if (!range.is_valid()) {
    return {};
  }
  const auto start = range.get_begin();
  auto end = range.get_end();
  if (start >= text_.size()) {
    return {};
  }
  if (end > text_.size()) {
    end = size();
  }
  return std::string_view(text_).substr(start, end - start);
}

void SourceIndex::build_line_table()
{
  line_offsets_.clear();
  line_offsets_.push_back(0);

  for (size_t i = 0; i < text_.size(); ++i) {
    const char c = text_[i];
    if (c == '\r') {
      if (i + 1 < text_.size() && text_[i + 1] == '\n') {
        ++i;
      }
      line_offsets_.push_back(static_cast<uint32_t>(i + 1));
    } else if (c == '\n') {
      line_offsets_.push_back(static_cast<uint32_t>(i + 1));
    }
  }
}

}  // namespace xaml_bridge
