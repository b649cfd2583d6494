// xaml_bridge/formatting/whitespace_extractor.hpp - Source whitespace recovery
//
// Recovers whitespace and raw tag fragments around structural nodes purely
// from the source text and the position index. The XML parser's own
// whitespace handling is never relied upon.
//
#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "xaml_bridge/ast/formatting_hints.hpp"
#include "xaml_bridge/basic/source_index.hpp"

namespace xaml_bridge
{

/// One attribute as written inside an opening tag
struct AttributeSpan
{
  std::string name;       ///< Qualified name as written
  std::string raw_value;  ///< Text between the quotes, entities not decoded
  std::string leading_whitespace;
  uint32_t begin = 0;  ///< Offset of the first name character
  uint32_t end = 0;    ///< Offset after the closing quote
  char quote = '"';
};

/// Result of scanning an opening tag starting at `<`
struct OpenTagScan
{
  bool ok = false;
  uint32_t begin = 0;       ///< Offset of `<`
  uint32_t name_begin = 0;  ///< Offset of the first name character
  std::string name;
  std::vector<AttributeSpan> attributes;
  std::string tag_end_whitespace;  ///< Whitespace before `>` or `/>`
  bool self_closing = false;
  uint32_t end = 0;  ///< Offset after `>`
};

/// Half-open span of a closing tag, comment or declaration
struct MarkupSpan
{
  bool ok = false;
  uint32_t begin = 0;
  uint32_t end = 0;
};

class WhitespaceExtractor
{
public:
  static constexpr uint32_t npos = UINT32_MAX;

  explicit WhitespaceExtractor(const SourceIndex & index) : index_(index) {}

  /**
   * Whitespace between `pos` and the previous non-whitespace character,
   * normalized. The scan never moves before `floor`.
   */
  [[nodiscard]] std::string leading_whitespace(uint32_t pos, uint32_t floor = 0) const;

  /// Same scan as leading_whitespace() without normalization
  [[nodiscard]] std::string raw_leading_whitespace(uint32_t pos, uint32_t floor = 0) const;

  /**
   * Collapse runs spanning several line breaks to the final line break
   * (as written) plus the indentation after it. Idempotent.
   */
  [[nodiscard]] static std::string normalize_leading_whitespace(std::string_view ws);

  /// Whitespace from `pos` up to the next non-whitespace character
  [[nodiscard]] std::string trailing_whitespace(uint32_t pos) const;

  /**
   * Whitespace in front of attribute `name` inside the opening tag that
   * starts at `element_start`. `preserve_line_break` is set when it contains
   * a line break. Empty hints when the attribute cannot be located.
   */
  [[nodiscard]] FormattingHints attribute_leading_whitespace(
    std::string_view name, uint32_t element_start) const;

  /// Offset of the next `<name` tag at or after `from`, skipping comments, CDATA and PIs
  [[nodiscard]] uint32_t find_tag_start(std::string_view name, uint32_t from) const;

  [[nodiscard]] OpenTagScan scan_open_tag(uint32_t begin) const;

  [[nodiscard]] MarkupSpan find_close_tag(std::string_view name, uint32_t from) const;

  [[nodiscard]] MarkupSpan find_comment(uint32_t from) const;

  /// `<?xml ... ?>` at or after `from` (only whitespace may precede it)
  [[nodiscard]] MarkupSpan find_declaration(uint32_t from) const;

  /// First `<` at or after `from`, or the text size
  [[nodiscard]] uint32_t next_markup(uint32_t from) const;

  [[nodiscard]] static bool is_whitespace(char c) noexcept
  {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r';
  }

  [[nodiscard]] static bool is_all_whitespace(std::string_view s) noexcept;

  [[nodiscard]] const SourceIndex & index() const noexcept { return index_; }

private:
  [[nodiscard]] std::string_view text() const noexcept { return index_.text(); }

  /// Skip `<!-- -->`, `<![CDATA[ ]]>` or `<? ?>` at `pos`; returns `pos` when none starts there
  [[nodiscard]] uint32_t skip_special(uint32_t pos) const;

  const SourceIndex & index_;
};

}  // namespace xaml_bridge
