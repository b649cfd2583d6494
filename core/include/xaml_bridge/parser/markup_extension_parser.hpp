// xaml_bridge/parser/markup_extension_parser.hpp - `{Name ...}` value parser
#pragma once

#include <cstdint>
#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>

#include "xaml_bridge/ast/unified_ast.hpp"

namespace xaml_bridge
{

class MarkupExtensionParseError : public std::runtime_error
{
public:
  MarkupExtensionParseError(const std::string & message, uint32_t offset)
  : std::runtime_error(message), offset_(offset)
  {
  }

  /// Offset into the attribute value where parsing stopped
  [[nodiscard]] uint32_t offset() const noexcept { return offset_; }

private:
  uint32_t offset_;
};

/**
 * Recursive-descent parser for markup extension literals.
 *
 * Grammar:
 *   extension := '{' name (argument (',' argument)*)? '}'
 *   argument  := value | key '=' value
 *   value     := extension | quoted | bare
 *   quoted    := '\'' ... '\'' | '"' ... '"'     (backslash escapes)
 *   bare      := text up to ',' or '}' at brace depth 0
 *
 * A value starting with `{}` is a literal escape, never an extension.
 */
class MarkupExtensionParser
{
public:
  /// Whether an attribute value is written as a markup extension
  [[nodiscard]] static bool is_markup_extension(std::string_view value) noexcept;

  /// Parse a complete `{...}` value; throws MarkupExtensionParseError
  [[nodiscard]] std::unique_ptr<MarkupExtension> parse(std::string_view text);

private:
  std::unique_ptr<MarkupExtension> parse_extension();
  void parse_argument(MarkupExtension & ext);
  MarkupExtensionArgument parse_value();
  std::string parse_quoted(char quote);
  std::string parse_bare(bool stop_at_equals);

  void skip_whitespace() noexcept;
  [[nodiscard]] bool at_end() const noexcept { return pos_ >= text_.size(); }
  [[nodiscard]] char peek() const noexcept { return at_end() ? '\0' : text_[pos_]; }
  [[noreturn]] void fail(const std::string & message) const;

  std::string_view text_;
  size_t pos_ = 0;
};

}  // namespace xaml_bridge
