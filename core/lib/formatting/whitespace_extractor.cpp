// xaml_bridge/formatting/whitespace_extractor.cpp - Source whitespace recovery
//
#include "xaml_bridge/formatting/whitespace_extractor.hpp"

#include <regex>

#include "xaml_bridge/basic/logging.hpp"

namespace xaml_bridge
{

namespace
{

bool is_line_break(char c) noexcept { return c == '\n' || c == '\r'; }

bool is_name_terminator(char c) noexcept
{
  return WhitespaceExtractor::is_whitespace(c) || c == '/' || c == '>';
}

std::string escape_regex(std::string_view s)
{
  static constexpr std::string_view special = R"(\^$.|?*+()[]{})";
  std::string out;
  out.reserve(s.size() * 2);
  for (const char c : s) {
    if (special.find(c) != std::string_view::npos) out.push_back('\\');
    out.push_back(c);
  }
  return out;
}

/// Whether `pos` lies outside any quoted attribute value of `tag`
bool outside_quotes(std::string_view tag, size_t pos) noexcept
{
  char quote = 0;
  for (size_t i = 0; i < pos && i < tag.size(); ++i) {
    const char c = tag[i];
    if (quote != 0) {
      if (c == quote) quote = 0;
    } else if (c == '"' || c == '\'') {
      quote = c;
    }
  }
  return quote == 0;
}

}  // namespace

bool WhitespaceExtractor::is_all_whitespace(std::string_view s) noexcept
{
  for (const char c : s) {
    if (!is_whitespace(c)) return false;
  }
  return true;
}

std::string WhitespaceExtractor::normalize_leading_whitespace(std::string_view ws)
{
  size_t breaks = 0;
  for (size_t i = 0; i < ws.size(); ++i) {
    if (ws[i] == '\r') {
      ++breaks;
      if (i + 1 < ws.size() && ws[i + 1] == '\n') ++i;
    } else if (ws[i] == '\n') {
      ++breaks;
    }
  }
  if (breaks <= 1) return std::string(ws);

  size_t last = ws.size();
  while (last > 0 && !is_line_break(ws[last - 1])) --last;
  size_t start = last - 1;
  if (ws[start] == '\n' && start > 0 && ws[start - 1] == '\r') --start;
  return std::string(ws.substr(start));
}

std::string WhitespaceExtractor::raw_leading_whitespace(uint32_t pos, uint32_t floor) const
{
  const std::string_view src = text();
  if (pos == 0 || pos > src.size()) return {};
  uint32_t start = pos;
  while (start > floor && is_whitespace(src[start - 1])) --start;
  return std::string(src.substr(start, pos - start));
}

std::string WhitespaceExtractor::leading_whitespace(uint32_t pos, uint32_t floor) const
{
  return normalize_leading_whitespace(raw_leading_whitespace(pos, floor));
}

std::string WhitespaceExtractor::trailing_whitespace(uint32_t pos) const
{
  const std::string_view src = text();
  if (pos >= src.size()) return {};
  uint32_t end = pos;
  while (end < src.size() && is_whitespace(src[end])) ++end;
  return std::string(src.substr(pos, end - pos));
}

FormattingHints WhitespaceExtractor::attribute_leading_whitespace(
  std::string_view name, uint32_t element_start) const
{
  FormattingHints hints;
  const std::string_view src = text();
  if (name.empty() || element_start >= src.size()) return hints;

  // Opening tag spans up to the first '>' outside quoted values
  size_t tag_end = element_start;
  char quote = 0;
  for (; tag_end < src.size(); ++tag_end) {
    const char c = src[tag_end];
    if (quote != 0) {
      if (c == quote) quote = 0;
    } else if (c == '"' || c == '\'') {
      quote = c;
    } else if (c == '>') {
      break;
    }
  }
  const std::string tag(src.substr(element_start, tag_end - element_start));

  try {
    const std::regex pattern("(\\s+)" + escape_regex(name) + "\\s*=");
    for (auto it = std::sregex_iterator(tag.begin(), tag.end(), pattern);
         it != std::sregex_iterator(); ++it) {
      const auto & m = *it;
      if (!outside_quotes(tag, static_cast<size_t>(m.position(0)))) continue;
      std::string ws = m.str(1);
      hints.preserve_line_break = ws.find_first_of("\r\n") != std::string::npos;
      hints.leading_whitespace = std::move(ws);
      return hints;
    }
  } catch (const std::regex_error & e) {
    log_debug("attribute whitespace lookup for '{}' failed: {}", name, e.what());
    return FormattingHints{};
  }
  return hints;
}

uint32_t WhitespaceExtractor::skip_special(uint32_t pos) const
{
  const std::string_view src = text();
  auto skip_to = [&](std::string_view terminator, size_t from) -> uint32_t {
    const size_t end = src.find(terminator, from);
    if (end == std::string_view::npos) return static_cast<uint32_t>(src.size());
    return static_cast<uint32_t>(end + terminator.size());
  };

  const std::string_view rest = src.substr(pos);
  if (rest.rfind("<!--", 0) == 0) return skip_to("-->", pos + 4);
  if (rest.rfind("<![CDATA[", 0) == 0) return skip_to("]]>", pos + 9);
  if (rest.rfind("<?", 0) == 0) return skip_to("?>", pos + 2);
  if (rest.rfind("<!", 0) == 0) return skip_to(">", pos + 2);
  return pos;
}

uint32_t WhitespaceExtractor::next_markup(uint32_t from) const
{
  const std::string_view src = text();
  if (from >= src.size()) return static_cast<uint32_t>(src.size());
  const size_t pos = src.find('<', from);
  return pos == std::string_view::npos ? static_cast<uint32_t>(src.size())
                                       : static_cast<uint32_t>(pos);
}

uint32_t WhitespaceExtractor::find_tag_start(std::string_view name, uint32_t from) const
{
  const std::string_view src = text();
  size_t pos = from;
  while (pos < src.size()) {
    pos = src.find('<', pos);
    if (pos == std::string_view::npos) return npos;
    const uint32_t skipped = skip_special(static_cast<uint32_t>(pos));
    if (skipped != pos) {
      pos = skipped;
      continue;
    }
    const size_t after = pos + 1 + name.size();
    if (src.compare(pos + 1, name.size(), name) == 0 && after < src.size() &&
        is_name_terminator(src[after])) {
      return static_cast<uint32_t>(pos);
    }
    ++pos;
  }
  return npos;
}

OpenTagScan WhitespaceExtractor::scan_open_tag(uint32_t begin) const
{
  OpenTagScan scan;
  const std::string_view src = text();
  if (begin >= src.size() || src[begin] != '<') return scan;

  const auto size = static_cast<uint32_t>(src.size());
  uint32_t i = begin + 1;
  scan.begin = begin;
  scan.name_begin = i;
  while (i < size && !is_name_terminator(src[i])) ++i;
  scan.name = std::string(src.substr(scan.name_begin, i - scan.name_begin));
  if (scan.name.empty()) return scan;

  while (i < size) {
    const uint32_t ws_start = i;
    while (i < size && is_whitespace(src[i])) ++i;
    if (i >= size) return scan;

    if (src[i] == '/' && i + 1 < size && src[i + 1] == '>') {
      scan.tag_end_whitespace = std::string(src.substr(ws_start, i - ws_start));
      scan.self_closing = true;
      scan.end = i + 2;
      scan.ok = true;
      return scan;
    }
    if (src[i] == '>') {
      scan.tag_end_whitespace = std::string(src.substr(ws_start, i - ws_start));
      scan.end = i + 1;
      scan.ok = true;
      return scan;
    }

    AttributeSpan attr;
    attr.leading_whitespace = std::string(src.substr(ws_start, i - ws_start));
    attr.begin = i;
    while (i < size && !is_whitespace(src[i]) && src[i] != '=' && src[i] != '/' && src[i] != '>') {
      ++i;
    }
    attr.name = std::string(src.substr(attr.begin, i - attr.begin));
    while (i < size && is_whitespace(src[i])) ++i;
    if (i >= size || src[i] != '=' || attr.name.empty()) return scan;
    ++i;
    while (i < size && is_whitespace(src[i])) ++i;
    if (i >= size || (src[i] != '"' && src[i] != '\'')) return scan;
    attr.quote = src[i];
    const uint32_t value_begin = ++i;
    const size_t close = src.find(attr.quote, value_begin);
    if (close == std::string_view::npos) return scan;
    attr.raw_value = std::string(src.substr(value_begin, close - value_begin));
    i = static_cast<uint32_t>(close + 1);
    attr.end = i;
    scan.attributes.push_back(std::move(attr));
  }
  return scan;
}

MarkupSpan WhitespaceExtractor::find_close_tag(std::string_view name, uint32_t from) const
{
  MarkupSpan span;
  const std::string_view src = text();
  size_t pos = from;
  while (pos < src.size()) {
    pos = src.find('<', pos);
    if (pos == std::string_view::npos) return span;
    const uint32_t skipped = skip_special(static_cast<uint32_t>(pos));
    if (skipped != pos) {
      pos = skipped;
      continue;
    }
    if (pos + 1 < src.size() && src[pos + 1] == '/' &&
        src.compare(pos + 2, name.size(), name) == 0) {
      const size_t after = pos + 2 + name.size();
      if (after < src.size() && (is_whitespace(src[after]) || src[after] == '>')) {
        const size_t gt = src.find('>', after);
        if (gt == std::string_view::npos) return span;
        span.ok = true;
        span.begin = static_cast<uint32_t>(pos);
        span.end = static_cast<uint32_t>(gt + 1);
        return span;
      }
    }
    ++pos;
  }
  return span;
}

MarkupSpan WhitespaceExtractor::find_comment(uint32_t from) const
{
  MarkupSpan span;
  const std::string_view src = text();
  if (from >= src.size()) return span;
  const size_t begin = src.find("<!--", from);
  if (begin == std::string_view::npos) return span;
  const size_t end = src.find("-->", begin + 4);
  if (end == std::string_view::npos) return span;
  span.ok = true;
  span.begin = static_cast<uint32_t>(begin);
  span.end = static_cast<uint32_t>(end + 3);
  return span;
}

MarkupSpan WhitespaceExtractor::find_declaration(uint32_t from) const
{
  MarkupSpan span;
  const std::string_view src = text();
  size_t i = from;
  while (i < src.size() && is_whitespace(src[i])) ++i;
  if (src.compare(i, 5, "<?xml") != 0 || i + 5 >= src.size() || !is_whitespace(src[i + 5])) {
    return span;
  }
  const size_t end = src.find("?>", i + 5);
  if (end == std::string_view::npos) return span;
  span.ok = true;
  span.begin = static_cast<uint32_t>(i);
  span.end = static_cast<uint32_t>(end + 2);
  return span;
}

}  // namespace xaml_bridge
