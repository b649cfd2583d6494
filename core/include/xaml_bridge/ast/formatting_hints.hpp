// xaml_bridge/ast/formatting_hints.hpp - Per-node source formatting snapshot
#pragma once

#include <cstddef>
#include <optional>
#include <string>

namespace xaml_bridge
{

/**
 * Whitespace and raw-text fragments recorded from the source for one node.
 *
 * Every field is optional: nodes created by transformation rules carry no
 * hints and are laid out with computed indentation by the writer.
 */
struct FormattingHints
{
  /// Whitespace before the node (normalized, see WhitespaceExtractor)
  std::optional<std::string> leading_whitespace;

  /// Whitespace after the node's end (unnormalized)
  std::optional<std::string> trailing_whitespace;

  /// Whitespace between the open tag and the first child or text
  std::optional<std::string> inner_whitespace;

  /// Whitespace before the end tag (`</Name>`), when it follows markup
  std::optional<std::string> closing_whitespace;

  /// Whitespace between the last attribute and `>` or `/>`
  std::optional<std::string> tag_end_whitespace;

  /// Raw source text of the node (attribute `name="value"`, text body, comment body)
  std::optional<std::string> original_text;

  /// Decoded value as parsed, compared against the current value to detect edits
  std::optional<std::string> original_value;

  /// Name as parsed, compared against the current name to detect renames
  std::optional<std::string> original_name;

  /// Quote character used around an attribute value
  char quote_char = '"';

  /// Whether an element without content was written as `<X/>`
  std::optional<bool> self_closing;

  /// Number of sibling child elements that precede this property element or comment
  std::optional<std::size_t> content_anchor;

  /// Position among all content items of the parent, for stable interleaving
  std::size_t source_order = 0;

  bool preserve_line_break = false;
  bool has_newline_after = false;
  bool single_line = false;
  int indent_level = 0;
  std::string indent_string;

  [[nodiscard]] bool empty() const noexcept
  {
    return !leading_whitespace && !trailing_whitespace && !inner_whitespace &&
           !closing_whitespace && !tag_end_whitespace && !original_text;
  }
};

}  // namespace xaml_bridge
