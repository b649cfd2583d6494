// xaml_bridge/parser/markup_extension_parser.cpp - `{Name ...}` value parser
//
#include "xaml_bridge/parser/markup_extension_parser.hpp"

#include <fmt/format.h>

#include "xaml_bridge/formatting/whitespace_extractor.hpp"

namespace xaml_bridge
{

namespace
{

std::string_view trim(std::string_view s) noexcept
{
  while (!s.empty() && WhitespaceExtractor::is_whitespace(s.front())) s.remove_prefix(1);
  while (!s.empty() && WhitespaceExtractor::is_whitespace(s.back())) s.remove_suffix(1);
  return s;
}

}  // namespace

bool MarkupExtensionParser::is_markup_extension(std::string_view value) noexcept
{
  const std::string_view v = trim(value);
  if (v.size() < 2 || v.front() != '{' || v.back() != '}') return false;
  return v.rfind("{}", 0) != 0;
}

std::unique_ptr<MarkupExtension> MarkupExtensionParser::parse(std::string_view text)
{
  text_ = text;
  pos_ = 0;
  skip_whitespace();
  auto ext = parse_extension();
  skip_whitespace();
  if (!at_end()) fail("unexpected text after closing '}'");
  return ext;
}

void MarkupExtensionParser::fail(const std::string & message) const
{
  throw MarkupExtensionParseError(
    fmt::format("invalid markup extension '{}': {} at offset {}", text_, message, pos_),
    static_cast<uint32_t>(pos_));
}

void MarkupExtensionParser::skip_whitespace() noexcept
{
  while (!at_end() && WhitespaceExtractor::is_whitespace(text_[pos_])) ++pos_;
}

std::unique_ptr<MarkupExtension> MarkupExtensionParser::parse_extension()
{
  if (peek() != '{') fail("expected '{'");
  ++pos_;
  skip_whitespace();

  const size_t name_begin = pos_;
  while (!at_end() && !WhitespaceExtractor::is_whitespace(peek()) && peek() != ',' &&
         peek() != '}' && peek() != '{') {
    ++pos_;
  }
  if (pos_ == name_begin) fail("missing extension name");

  auto ext = std::make_unique<MarkupExtension>(std::string(text_.substr(name_begin, pos_ - name_begin)));

  skip_whitespace();
  if (peek() != '}') {
    while (true) {
      parse_argument(*ext);
      skip_whitespace();
      if (peek() == ',') {
        ++pos_;
        continue;
      }
      if (peek() == '}') break;
      fail(at_end() ? "unterminated extension" : "expected ',' or '}'");
    }
  }
  ++pos_;

  ext->adopt_arguments();
  ext->refresh_payload();
  return ext;
}

void MarkupExtensionParser::parse_argument(MarkupExtension & ext)
{
  skip_whitespace();
  const char c = peek();

  if (c == '{' || c == '\'' || c == '"') {
    MarkupExtensionArgument arg = parse_value();
    if (ext.positional) fail("more than one positional argument");
    ext.positional = std::move(arg);
    return;
  }

  std::string token = parse_bare(true);
  if (peek() == '=') {
    ++pos_;
    if (token.empty()) fail("missing parameter name");
    MarkupExtensionArgument arg = parse_value();
    arg.name = std::move(token);
    ext.parameters.push_back(std::move(arg));
    return;
  }

  if (token.empty()) fail("empty argument");
  if (ext.positional) fail("more than one positional argument");
  MarkupExtensionArgument arg;
  arg.value = std::move(token);
  ext.positional = std::move(arg);
}

MarkupExtensionArgument MarkupExtensionParser::parse_value()
{
  skip_whitespace();
  MarkupExtensionArgument arg;
  const char c = peek();
  if (c == '{' && text_.compare(pos_, 2, "{}") != 0) {
    arg.value = parse_extension();
  } else if (c == '\'' || c == '"') {
    ++pos_;
    arg.value = parse_quoted(c);
    arg.quote = c;
  } else {
    arg.value = parse_bare(false);
  }
  return arg;
}

std::string MarkupExtensionParser::parse_quoted(char quote)
{
  std::string out;
  while (!at_end()) {
    const char c = text_[pos_++];
    if (c == '\\' && !at_end()) {
      out.push_back(text_[pos_++]);
    } else if (c == quote) {
      return out;
    } else {
      out.push_back(c);
    }
  }
  fail("unterminated quoted value");
}

std::string MarkupExtensionParser::parse_bare(bool stop_at_equals)
{
  std::string out;
  int depth = 0;
  while (!at_end()) {
    const char c = peek();
    if (depth == 0 && (c == ',' || c == '}')) break;
    if (depth == 0 && stop_at_equals && c == '=') break;
    if (c == '\\' && pos_ + 1 < text_.size()) {
      out.push_back(text_[pos_ + 1]);
      pos_ += 2;
      continue;
    }
    if (c == '{') ++depth;
    if (c == '}') --depth;
    out.push_back(c);
    ++pos_;
  }
  if (depth != 0) fail("unbalanced braces");
  return std::string(trim(out));
}

}  // namespace xaml_bridge
