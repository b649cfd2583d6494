// xaml_bridge/basic/source_index.hpp - Source positions and line-start index
//
// This header provides types for tracking markup source locations and the
// position index used to turn parser line/column pairs back into offsets.
//
#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace xaml_bridge
{

// ============================================================================
// SourceRange - Half-open byte range
// ============================================================================

/**
 * A range of source text defined by byte offsets.
 *
 * The range is inclusive of the start and exclusive of the end,
 * following the half-open interval convention [start, end).
 */
class SourceRange
{
public:
  /// Invalid/unknown offset sentinel
  static constexpr uint32_t k_invalid_offset = UINT32_MAX;

  /// Create an invalid range
  constexpr SourceRange() noexcept = default;

  /// Create a range from byte offsets
  constexpr SourceRange(uint32_t start_offset, uint32_t end_offset) noexcept
  : start_(start_offset), end_(end_offset)
  {
  }

  [[nodiscard]] constexpr uint32_t get_begin() const noexcept { return start_; }
  [[nodiscard]] constexpr uint32_t get_end() const noexcept { return end_; }

  [[nodiscard]] constexpr bool is_valid() const noexcept
  {
    return start_ != k_invalid_offset && end_ != k_invalid_offset && start_ <= end_;
  }

  [[nodiscard]] constexpr bool contains(uint32_t offset) const noexcept
  {
    return is_valid() && offset >= start_ && offset < end_;
  }

  [[nodiscard]] constexpr uint32_t size() const noexcept
  {
    if (!is_valid()) return 0;
    return end_ - start_;
  }

  [[nodiscard]] constexpr bool operator==(SourceRange other) const noexcept
  {
    return start_ == other.start_ && end_ == other.end_;
  }
  [[nodiscard]] constexpr bool operator!=(SourceRange other) const noexcept
  {
    return !(*this == other);
  }

private:
  uint32_t start_ = k_invalid_offset;
  uint32_t end_ = k_invalid_offset;
};

// ============================================================================
// LineColumn - Human-readable position
// ============================================================================

/**
 * Human-readable line and column position (1-indexed).
 */
struct LineColumn
{
  uint32_t line = 0;    ///< 1-indexed line number (0 = invalid)
  uint32_t column = 0;  ///< 1-indexed column number (0 = invalid)

  [[nodiscard]] constexpr bool is_valid() const noexcept { return line > 0 && column > 0; }
};

// ============================================================================
// SourceIndex - Line start table over raw markup
// ============================================================================

/**
 * Precomputed line-start offsets over one markup text.
 *
 * `\n`, `\r\n` and a bare `\r` each terminate exactly one line. Line numbers
 * are 1-based, matching what XML parsers report.
 */
class SourceIndex
{
public:
  SourceIndex() { build_line_table(); }

  explicit SourceIndex(std::string text) : text_(std::move(text)) { build_line_table(); }

  /// Replace the indexed text
  void set_text(std::string text)
  {
    text_ = std::move(text);
    build_line_table();
  }

  [[nodiscard]] std::string_view text() const noexcept { return text_; }
  [[nodiscard]] uint32_t size() const noexcept { return static_cast<uint32_t>(text_.size()); }

  /// Number of lines (an empty text has one line)
  [[nodiscard]] uint32_t line_count() const noexcept
  {
    return static_cast<uint32_t>(line_offsets_.size());
  }

  /// Offset of the first character of a 1-based line; text size when out of range
  [[nodiscard]] uint32_t line_start(uint32_t line) const noexcept;

  /**
   * Convert a parser line/column pair to an absolute offset.
   *
   * Computes `lineStart + column - 2`. Element columns reported by XML
   * parsers point at the first character of the tag name, so the result
   * lands on the `<` that opens the tag. Results are clamped into the text.
   */
  [[nodiscard]] uint32_t character_position(uint32_t line, uint32_t column) const noexcept;

  /// Convert an offset to a 1-based line/column
  [[nodiscard]] LineColumn line_column(uint32_t offset) const noexcept;

  /// Content of a 1-based line without its terminator
  [[nodiscard]] std::string_view line_text(uint32_t line) const noexcept;

  [[nodiscard]] std::string_view slice(SourceRange range) const noexcept;
  [[nodiscard]] std::string_view slice(uint32_t begin, uint32_t end) const noexcept
  {
    return slice(SourceRange(begin, end));
  }

private:
  void build_line_table();

  std::string text_;
  std::vector<uint32_t> line_offsets_;  ///< Offset of each line start
};

}  // namespace xaml_bridge
