// xaml_bridge/parser/structural_converter.cpp - Markup text to Unified AST
//
#include "xaml_bridge/parser/structural_converter.hpp"

#include <algorithm>
#include <cctype>
#include <map>
#include <regex>
#include <utility>
#include <vector>

#include <fmt/format.h>

#include "tinyxml2.h"
#include "xaml_bridge/basic/diagnostic_codes.hpp"
#include "xaml_bridge/basic/logging.hpp"
#include "xaml_bridge/basic/source_index.hpp"
#include "xaml_bridge/formatting/whitespace_extractor.hpp"
#include "xaml_bridge/parser/markup_extension_parser.hpp"

namespace xaml_bridge
{

namespace
{

constexpr const char * k_xml_reserved_namespace = "http://www.w3.org/XML/1998/namespace";
constexpr std::string_view k_utf8_bom = "\xEF\xBB\xBF";

using NamespaceScope = std::map<std::string, std::string, std::less<>>;

struct QualifiedName
{
  std::string prefix;
  std::string local;
};

QualifiedName split_qualified_name(std::string_view name)
{
  const auto colon = name.find(':');
  if (colon == std::string_view::npos) return {{}, std::string(name)};
  return {std::string(name.substr(0, colon)), std::string(name.substr(colon + 1))};
}

bool is_directive_name(std::string_view local) noexcept
{
  return local == "Name" || local == "Key" || local == "Class" || local == "FieldModifier" ||
         local == "Shared";
}

bool has_line_break(std::string_view s) noexcept
{
  return s.find_first_of("\r\n") != std::string_view::npos;
}

bool iequals(std::string_view a, std::string_view b) noexcept
{
  return a.size() == b.size() && std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
           return std::tolower(static_cast<unsigned char>(x)) ==
                  std::tolower(static_cast<unsigned char>(y));
         });
}

std::string trim_copy(std::string_view s)
{
  while (!s.empty() && WhitespaceExtractor::is_whitespace(s.front())) s.remove_prefix(1);
  while (!s.empty() && WhitespaceExtractor::is_whitespace(s.back())) s.remove_suffix(1);
  return std::string(s);
}

uint32_t first_content_column(const SourceIndex & index, uint32_t line)
{
  const std::string_view text = index.line_text(line);
  for (size_t i = 0; i < text.size(); ++i) {
    if (!WhitespaceExtractor::is_whitespace(text[i])) return static_cast<uint32_t>(i + 1);
  }
  return 1;
}

XmlDeclaration parse_declaration(std::string_view raw)
{
  XmlDeclaration decl;
  decl.original_text = std::string(raw);
  static const std::regex pseudo_attribute(R"re((\w+)\s*=\s*(["'])(.*?)\2)re");
  const std::string text(raw);
  for (auto it = std::sregex_iterator(text.begin(), text.end(), pseudo_attribute);
       it != std::sregex_iterator(); ++it) {
    const std::string key = (*it)[1];
    const std::string value = (*it)[3];
    if (key == "version") {
      decl.version = value;
    } else if (key == "encoding") {
      decl.encoding = value;
    } else if (key == "standalone") {
      decl.standalone = value;
    }
  }
  return decl;
}

// ============================================================================
// TreeBuilder - one conversion run
// ============================================================================

class TreeBuilder
{
public:
  TreeBuilder(const SourceIndex & index, DiagnosticBag & diags, const std::string & file_path)
  : index_(index), ws_(index), diags_(diags), file_path_(file_path)
  {
  }

  std::unique_ptr<Document> build(const tinyxml2::XMLDocument & xml, bool has_bom);

private:
  std::unique_ptr<Element> build_element(
    const tinyxml2::XMLElement & xe, const NamespaceScope & parent_scope);
  void build_property_element(
    const tinyxml2::XMLElement & xe, Element & owner, const NamespaceScope & scope,
    size_t anchor, size_t order);
  void build_attributes(
    const tinyxml2::XMLElement & xe, const OpenTagScan & open, Element & elem,
    NamespaceScope & scope);
  std::unique_ptr<Comment> build_comment(
    const tinyxml2::XMLComment & xc, CommentPlacement placement);

  /// Raw source region of a text node starting at the cursor; advances the cursor
  std::string_view take_text_region(const tinyxml2::XMLText & xt);

  void assign_value(Property & prop, const std::string & value);
  void close_tag(std::string_view name, const OpenTagScan & open, UnifiedNode & node);

  FormattingHints attribute_hints(
    const AttributeSpan * span, std::string_view name, const OpenTagScan & open) const;

  std::optional<std::string> resolve_prefix(
    const NamespaceScope & scope, const std::string & prefix, uint32_t line, uint32_t column);

  void warn(const char * code, const std::string & message, uint32_t line, uint32_t column);

  const SourceIndex & index_;
  WhitespaceExtractor ws_;
  DiagnosticBag & diags_;
  const std::string & file_path_;
  uint32_t cursor_ = 0;
};

void TreeBuilder::warn(
  const char * code, const std::string & message, uint32_t line, uint32_t column)
{
  auto builder = diags_.report_warning(code, message);
  builder.at(line, column);
  if (!file_path_.empty()) builder.with_file(file_path_);
}

std::optional<std::string> TreeBuilder::resolve_prefix(
  const NamespaceScope & scope, const std::string & prefix, uint32_t line, uint32_t column)
{
  auto it = scope.find(prefix);
  if (it != scope.end()) return it->second;
  if (!prefix.empty()) {
    warn(codes::k_undeclared_prefix, "Undeclared namespace prefix '" + prefix + "'", line, column);
  }
  return std::nullopt;
}

std::unique_ptr<Document> TreeBuilder::build(const tinyxml2::XMLDocument & xml, bool has_bom)
{
  auto doc = std::make_unique<Document>();
  doc->file_path = file_path_;
  doc->has_bom = has_bom;

  const MarkupSpan decl = ws_.find_declaration(0);
  if (decl.ok) {
    doc->declaration = parse_declaration(index_.slice(decl.begin, decl.end));
    if (doc->declaration->encoding) doc->encoding = *doc->declaration->encoding;
    cursor_ = decl.end;
  }

  const NamespaceScope scope{{"xml", k_xml_reserved_namespace}};
  for (const tinyxml2::XMLNode * node = xml.FirstChild(); node; node = node->NextSibling()) {
    if (const auto * xc = node->ToComment()) {
      auto comment = build_comment(*xc, CommentPlacement::Standalone);
      if (doc->root()) {
        doc->trailing_comments.push_back(std::move(comment));
      } else {
        doc->leading_comments.push_back(std::move(comment));
      }
    } else if (const auto * xe = node->ToElement()) {
      doc->set_root(build_element(*xe, scope));
    }
  }

  const std::string_view rest = index_.slice(cursor_, index_.size());
  if (!rest.empty() && WhitespaceExtractor::is_all_whitespace(rest)) {
    doc->trailing_whitespace = std::string(rest);
  }

  if (auto * root = doc->root()) {
    for (const auto & nd : root->namespace_declarations) {
      doc->symbols.register_namespace(nd.prefix, nd.uri);
    }
    for (const auto * e : root->descendants()) {
      for (const auto & nd : e->namespace_declarations) {
        if (!doc->symbols.namespace_for_prefix(nd.prefix)) {
          doc->symbols.register_namespace(nd.prefix, nd.uri);
        }
      }
    }
  }
  doc->refresh_symbols();
  return doc;
}

std::unique_ptr<Element> TreeBuilder::build_element(
  const tinyxml2::XMLElement & xe, const NamespaceScope & parent_scope)
{
  auto elem = std::make_unique<Element>();
  const uint32_t floor = cursor_;
  const uint32_t begin = ws_.find_tag_start(xe.Name(), cursor_);
  OpenTagScan open;
  if (begin != WhitespaceExtractor::npos) open = ws_.scan_open_tag(begin);

  if (open.ok) {
    const LineColumn lc = index_.line_column(open.name_begin);
    elem->location = Location{lc.line, lc.column, begin, 0};
    elem->hints.leading_whitespace = ws_.leading_whitespace(begin, floor);
    elem->hints.tag_end_whitespace = open.tag_end_whitespace;
    elem->hints.self_closing = open.self_closing;
    cursor_ = open.end;
  } else {
    elem->location.line = static_cast<uint32_t>(xe.GetLineNum());
    log_debug("no source span for <{}> at line {}", xe.Name(), xe.GetLineNum());
  }

  NamespaceScope scope = parent_scope;
  build_attributes(xe, open, *elem, scope);

  const QualifiedName qn = split_qualified_name(xe.Name());
  elem->type_name = qn.local;
  elem->prefix = qn.prefix;
  elem->xml_namespace =
    resolve_prefix(scope, qn.prefix, elem->location.line, elem->location.column);

  size_t order = 0;
  bool flattened = false;
  for (const tinyxml2::XMLNode * node = xe.FirstChild(); node; node = node->NextSibling()) {
    if (const auto * ce = node->ToElement()) {
      const QualifiedName child_name = split_qualified_name(ce->Name());
      if (child_name.local.find('.') != std::string::npos) {
        build_property_element(*ce, *elem, scope, elem->children().size(), order++);
      } else {
        auto child = build_element(*ce, scope);
        child->hints.source_order = order++;
        elem->add_child(std::move(child));
      }
    } else if (const auto * cc = node->ToComment()) {
      auto comment = build_comment(*cc, CommentPlacement::WithinContent);
      comment->hints.content_anchor = elem->children().size();
      comment->hints.source_order = order++;
      elem->add_comment(std::move(comment));
    } else if (const auto * ct = node->ToText()) {
      const std::string decoded = ct->Value() ? ct->Value() : "";
      if (WhitespaceExtractor::is_all_whitespace(decoded) && !ct->CData()) continue;
      const std::string_view raw = take_text_region(*ct);
      if (elem->text_content) {
        // Mixed content keeps one text run; later runs are appended
        if (!flattened) {
          warn(
            codes::k_mixed_content_flattened,
            fmt::format(
              "Mixed content in <{}> is merged into one text run before the child elements",
              xe.Name()),
            static_cast<uint32_t>(ct->GetLineNum()),
            first_content_column(index_, static_cast<uint32_t>(ct->GetLineNum())));
          flattened = true;
        }
        *elem->text_content += trim_copy(decoded);
        elem->text_hints.original_text = *elem->text_hints.original_text + std::string(raw);
        elem->text_hints.original_value = elem->text_content;
        continue;
      }
      elem->text_content = trim_copy(decoded);
      elem->text_hints.original_text = std::string(raw);
      elem->text_hints.original_value = elem->text_content;
      elem->text_hints.content_anchor = elem->children().size();
      elem->text_hints.source_order = order++;
    }
  }

  close_tag(xe.Name(), open, *elem);
  return elem;
}

void TreeBuilder::build_attributes(
  const tinyxml2::XMLElement & xe, const OpenTagScan & open, Element & elem,
  NamespaceScope & scope)
{
  struct Entry
  {
    const tinyxml2::XMLAttribute * attr;
    const AttributeSpan * span;
  };

  std::vector<Entry> entries;
  size_t index = 0;
  for (const auto * a = xe.FirstAttribute(); a; a = a->Next(), ++index) {
    const AttributeSpan * span = nullptr;
    if (open.ok) {
      if (index < open.attributes.size() && open.attributes[index].name == a->Name()) {
        span = &open.attributes[index];
      } else {
        for (const auto & s : open.attributes) {
          if (s.name == a->Name()) {
            span = &s;
            break;
          }
        }
      }
    }
    entries.push_back({a, span});
  }

  // Namespace declarations first, so prefixes used earlier in the tag resolve
  for (const auto & entry : entries) {
    const std::string_view name = entry.attr->Name();
    if (name != "xmlns" && name.rfind("xmlns:", 0) != 0) continue;
    NamespaceDeclaration decl;
    decl.prefix = name == "xmlns" ? std::string() : std::string(name.substr(6));
    decl.uri = entry.attr->Value();
    if (entry.span) {
      decl.leading_whitespace = entry.span->leading_whitespace;
      decl.original_text = std::string(index_.slice(entry.span->begin, entry.span->end));
    }
    scope[decl.prefix] = decl.uri;
    elem.namespace_declarations.push_back(std::move(decl));
  }

  for (const auto & entry : entries) {
    const std::string name = entry.attr->Name();
    if (name == "xmlns" || name.rfind("xmlns:", 0) == 0) continue;

    const std::string value = entry.attr->Value();
    const QualifiedName qn = split_qualified_name(name);
    FormattingHints hints = attribute_hints(entry.span, name, open);

    Location loc;
    if (entry.span) {
      const LineColumn lc = index_.line_column(entry.span->begin);
      loc = Location{lc.line, lc.column, entry.span->begin, entry.span->end - entry.span->begin};
    } else {
      loc.line = elem.location.line;
    }

    if (!qn.prefix.empty()) {
      const auto it = scope.find(qn.prefix);
      const bool language_namespace =
        it != scope.end() ? it->second == k_xaml_language_namespace : qn.prefix == "x";
      if (it == scope.end() && qn.prefix != "x") {
        warn(
          codes::k_undeclared_prefix, "Undeclared namespace prefix '" + qn.prefix + "'", loc.line,
          loc.column);
      }
      if (language_namespace && is_directive_name(qn.local)) {
        if (qn.local == "Name") {
          elem.x_name = value;
        } else if (qn.local == "Key") {
          elem.x_key = value;
        } else if (qn.local == "Class") {
          elem.x_class = value;
        } else if (qn.local == "FieldModifier") {
          elem.x_field_modifier = value;
        } else {
          elem.x_shared = iequals(value, "true");
        }
        hints.original_value = value;
        elem.directive_prefix = qn.prefix;
        elem.directive_hints[qn.local] = std::move(hints);
        continue;
      }
    }

    auto prop = std::make_unique<Property>();
    prop->prefix = qn.prefix;
    const auto dot = qn.local.find('.');
    if (dot != std::string::npos && dot > 0 && dot < qn.local.size() - 1) {
      prop->kind = PropertyKind::AttachedProperty;
      prop->attached_owner_type = qn.local.substr(0, dot);
      prop->name = qn.local.substr(dot + 1);
    } else {
      prop->name = qn.local;
    }
    prop->hints = std::move(hints);
    prop->location = loc;
    assign_value(*prop, value);
    elem.add_property(std::move(prop));
  }
}

FormattingHints TreeBuilder::attribute_hints(
  const AttributeSpan * span, std::string_view name, const OpenTagScan & open) const
{
  FormattingHints hints;
  if (span) {
    hints.leading_whitespace = span->leading_whitespace;
    hints.original_text = std::string(index_.slice(span->begin, span->end));
    hints.quote_char = span->quote;
  } else if (open.ok) {
    hints = ws_.attribute_leading_whitespace(name, open.begin);
  }
  hints.preserve_line_break = hints.leading_whitespace && has_line_break(*hints.leading_whitespace);
  hints.original_name = std::string(name);
  return hints;
}

void TreeBuilder::assign_value(Property & prop, const std::string & value)
{
  if (MarkupExtensionParser::is_markup_extension(value)) {
    try {
      MarkupExtensionParser parser;
      auto ext = parser.parse(value);
      ext->location = prop.location;
      prop.hints.original_value = ext->to_string();
      prop.set_value(std::move(ext));
      return;
    } catch (const MarkupExtensionParseError & e) {
      warn(codes::k_markup_extension_invalid, e.what(), prop.location.line, prop.location.column);
    }
  }
  prop.hints.original_value = value;
  prop.set_value(value);
}

void TreeBuilder::build_property_element(
  const tinyxml2::XMLElement & xe, Element & owner, const NamespaceScope & scope, size_t anchor,
  size_t order)
{
  auto prop = std::make_unique<Property>();
  prop->kind = PropertyKind::PropertyElement;

  const QualifiedName qn = split_qualified_name(xe.Name());
  const auto dot = qn.local.find('.');
  const std::string owner_type = qn.local.substr(0, dot);
  prop->name = qn.local.substr(dot + 1);
  prop->prefix = qn.prefix;
  if (owner_type != owner.type_name) prop->attached_owner_type = owner_type;

  const uint32_t floor = cursor_;
  const uint32_t begin = ws_.find_tag_start(xe.Name(), cursor_);
  OpenTagScan open;
  if (begin != WhitespaceExtractor::npos) open = ws_.scan_open_tag(begin);
  if (open.ok) {
    const LineColumn lc = index_.line_column(open.name_begin);
    prop->location = Location{lc.line, lc.column, begin, 0};
    prop->hints.leading_whitespace = ws_.leading_whitespace(begin, floor);
    prop->hints.tag_end_whitespace = open.tag_end_whitespace;
    prop->hints.self_closing = open.self_closing;
    cursor_ = open.end;
    if (!open.attributes.empty()) {
      log_debug("attributes on property element <{}> are not kept", xe.Name());
    }
  } else {
    prop->location.line = static_cast<uint32_t>(xe.GetLineNum());
  }
  prop->hints.content_anchor = anchor;
  prop->hints.source_order = order;
  prop->hints.original_name = qn.local;

  std::vector<std::unique_ptr<Element>> values;
  std::vector<std::unique_ptr<Comment>> comments;
  std::string text;
  std::string raw_text;
  size_t inner_order = 0;

  for (const tinyxml2::XMLNode * node = xe.FirstChild(); node; node = node->NextSibling()) {
    if (const auto * ce = node->ToElement()) {
      auto value = build_element(*ce, scope);
      value->hints.source_order = inner_order++;
      values.push_back(std::move(value));
    } else if (const auto * cc = node->ToComment()) {
      auto comment = build_comment(*cc, CommentPlacement::BeforeElement);
      comment->hints.content_anchor = values.size();
      comment->hints.source_order = inner_order++;
      if (!values.empty()) comment->placement = CommentPlacement::WithinContent;
      comments.push_back(std::move(comment));
    } else if (const auto * ct = node->ToText()) {
      const std::string decoded = ct->Value() ? ct->Value() : "";
      if (WhitespaceExtractor::is_all_whitespace(decoded) && !ct->CData()) continue;
      raw_text += std::string(take_text_region(*ct));
      text += trim_copy(decoded);
    }
  }

  if (values.size() == 1) {
    prop->set_value(std::move(values.front()));
    for (auto & c : comments) prop->add_comment(std::move(c));
  } else if (values.size() > 1) {
    auto collection = std::make_unique<Element>(qn.local, owner.xml_namespace);
    collection->synthetic_collection = true;
    collection->prefix = qn.prefix;
    collection->location = prop->location;
    for (auto & v : values) collection->add_child(std::move(v));
    for (auto & c : comments) collection->add_comment(std::move(c));
    prop->set_value(std::move(collection));
  } else {
    for (auto & c : comments) prop->add_comment(std::move(c));
    if (!raw_text.empty()) {
      prop->hints.original_text = raw_text;
      assign_value(*prop, text);
    }
  }

  close_tag(xe.Name(), open, *prop);
  owner.add_property(std::move(prop));
}

std::unique_ptr<Comment> TreeBuilder::build_comment(
  const tinyxml2::XMLComment & xc, CommentPlacement placement)
{
  auto comment = std::make_unique<Comment>(xc.Value() ? xc.Value() : "");
  comment->placement = placement;

  const uint32_t floor = cursor_;
  const MarkupSpan span = ws_.find_comment(cursor_);
  if (span.ok) {
    const LineColumn lc = index_.line_column(span.begin);
    comment->location = Location{lc.line, lc.column + 1, span.begin, span.end - span.begin};
    comment->hints.leading_whitespace = ws_.leading_whitespace(span.begin, floor);
    comment->hints.original_text = std::string(index_.slice(span.begin, span.end));
    cursor_ = span.end;
  } else {
    comment->location.line = static_cast<uint32_t>(xc.GetLineNum());
  }
  return comment;
}

std::string_view TreeBuilder::take_text_region(const tinyxml2::XMLText & xt)
{
  const std::string_view src = index_.text();
  uint32_t end = ws_.next_markup(cursor_);
  if (xt.CData()) {
    const size_t close = src.find("]]>", end);
    if (close != std::string_view::npos) end = static_cast<uint32_t>(close + 3);
  }
  const std::string_view region = index_.slice(cursor_, end);
  cursor_ = end;
  return region;
}

void TreeBuilder::close_tag(std::string_view name, const OpenTagScan & open, UnifiedNode & node)
{
  if (!open.ok) return;
  if (!open.self_closing) {
    const MarkupSpan close = ws_.find_close_tag(name, cursor_);
    if (close.ok) {
      const std::string_view between = index_.slice(cursor_, close.begin);
      if (WhitespaceExtractor::is_all_whitespace(between)) {
        node.hints.closing_whitespace = std::string(between);
      }
      cursor_ = close.end;
    }
  }
  node.location.length = cursor_ - open.begin;
}

}  // namespace

// ============================================================================
// StructuralConverter
// ============================================================================

StructuralParseResult StructuralConverter::convert(
  std::string_view text, const std::string & file_path)
{
  StructuralParseResult result;

  const bool has_bom = text.rfind(k_utf8_bom, 0) == 0;
  if (has_bom) text.remove_prefix(k_utf8_bom.size());
  const SourceIndex index{std::string(text)};

  tinyxml2::XMLDocument xml(true, tinyxml2::PRESERVE_WHITESPACE);
  const tinyxml2::XMLError err = xml.Parse(index.text().data(), index.text().size());
  if (err != tinyxml2::XML_SUCCESS) {
    result.error_line = static_cast<uint32_t>(std::max(1, xml.ErrorLineNum()));
    result.error_column = first_content_column(index, result.error_line);
    result.error_message = xml.ErrorStr() ? xml.ErrorStr() : xml.ErrorName();
    log_debug("structural parse failed at line {}: {}", result.error_line, result.error_message);
    return result;
  }

  TreeBuilder builder(index, diags_, file_path);
  result.document = builder.build(xml, has_bom);
  log_debug("structural conversion of '{}' complete", file_path.empty() ? "<input>" : file_path);
  return result;
}

}  // namespace xaml_bridge
