// xaml_bridge/serialization/xaml_writer.cpp - Formatting-preserving markup writer
//
#include "xaml_bridge/serialization/xaml_writer.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <map>
#include <memory>
#include <string_view>
#include <utility>
#include <vector>

#include <fmt/format.h>
#include <fmt/ranges.h>

namespace xaml_bridge
{

namespace
{

constexpr std::string_view k_utf8_bom = "\xEF\xBB\xBF";

constexpr std::array<std::string_view, 5> k_directive_order = {
  "Name", "Key", "Class", "FieldModifier", "Shared"};

std::string escape_attribute(std::string_view value, char quote)
{
  std::string out;
  out.reserve(value.size());
  for (const char c : value) {
    switch (c) {
      case '&':
        out += "&amp;";
        break;
      case '<':
        out += "&lt;";
        break;
      case '>':
        out += "&gt;";
        break;
      case '"':
        out += quote == '"' ? "&quot;" : "\"";
        break;
      case '\'':
        out += quote == '\'' ? "&apos;" : "'";
        break;
      default:
        out.push_back(c);
    }
  }
  return out;
}

std::string escape_text(std::string_view value)
{
  std::string out;
  out.reserve(value.size());
  for (const char c : value) {
    if (c == '&') {
      out += "&amp;";
    } else if (c == '<') {
      out += "&lt;";
    } else if (c == '>') {
      out += "&gt;";
    } else {
      out.push_back(c);
    }
  }
  return out;
}

/// Comment bodies may not contain "--"
std::string sanitize_comment(std::string_view text)
{
  std::string out;
  out.reserve(text.size());
  for (const char c : text) {
    if (c == '-' && !out.empty() && out.back() == '-') out.push_back(' ');
    out.push_back(c);
  }
  if (!out.empty() && out.back() == '-') out.push_back(' ');
  return out;
}

bool iequals(std::string_view a, std::string_view b) noexcept
{
  return a.size() == b.size() && std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
           return std::tolower(static_cast<unsigned char>(x)) ==
                  std::tolower(static_cast<unsigned char>(y));
         });
}

std::optional<std::string> directive_value(const Element & elem, std::string_view name)
{
  if (name == "Name") return elem.x_name;
  if (name == "Key") return elem.x_key;
  if (name == "Class") return elem.x_class;
  if (name == "FieldModifier") return elem.x_field_modifier;
  if (elem.x_shared) return std::string(*elem.x_shared ? "True" : "False");
  return std::nullopt;
}

bool is_review_annotation(const Comment & c) noexcept
{
  return !c.preserve && c.placement == CommentPlacement::Standalone;
}

bool written_as_property_element(const Property & prop)
{
  return prop.kind == PropertyKind::PropertyElement || prop.element() != nullptr;
}

/// Value text of an attribute-syntax property
std::string attribute_value(const Property & prop)
{
  if (const auto * literal = prop.literal()) return *literal;
  if (const auto * ext = prop.markup_extension()) return ext->to_string();
  return {};
}

std::string qualified(const std::string & prefix, const std::string & name)
{
  return prefix.empty() ? name : prefix + ":" + name;
}

/// One item between an element's start and end tags
struct ContentItem
{
  enum class Kind : uint8_t { Child, Comment, PropertyElement, Text };

  Kind kind;
  size_t anchor;
  int rank;  ///< Anchored content (0) precedes the child element at the same index (1)
  size_t order;
  const void * node;
};

/// An attribute ready to be written (text excludes the leading whitespace)
struct AttributeText
{
  std::optional<std::string> leading;
  std::string text;
};

// ============================================================================
// TextEmitter - one write run
// ============================================================================

class TextEmitter
{
public:
  TextEmitter(const XamlWriterOptions & options, const Document * doc)
  : options_(options), doc_(doc)
  {
    if (!doc_) {
      target_namespace_ = options_.target_namespace.value_or(k_avalonia_namespace);
      return;
    }
    if (const Element * root = doc_->root()) {
      for (const auto & decl : root->namespace_declarations) {
        if (decl.prefix.empty()) document_default_ = decl.uri;
      }
    }
    target_namespace_ = target_namespace_for(*doc_, options_);
    if (options_.add_transformation_comments) {
      for (const auto & record : doc_->transformation_trace) {
        if (record.node_id != 0) trace_[record.node_id].push_back(&record);
      }
    }
  }

  std::string document()
  {
    const Document & doc = *doc_;
    const bool preserve = options_.preserve_formatting;

    if (preserve && doc.has_bom) out_ += k_utf8_bom;
    if (options_.include_xml_declaration && doc.declaration) {
      if (preserve && doc.declaration->original_text) {
        out_ += *doc.declaration->original_text;
      } else {
        out_ += fmt::format(
          "<?xml version=\"{}\" encoding=\"{}\"?>", doc.declaration->version, options_.encoding);
      }
    }

    for (const auto & c : doc.leading_comments) comment(*c, 0);
    if (const Element * root = doc.root()) element(*root, 0, std::nullopt);

    // An annotation attached to the document is written in place of a computed one
    const bool attached = std::any_of(
      doc.trailing_comments.begin(), doc.trailing_comments.end(),
      [](const auto & c) { return is_review_annotation(*c); });
    if (options_.annotate_diagnostics && !attached) {
      if (auto body = review_annotation(
            doc.collect_all_diagnostics(), options_.annotation_cap, options_.new_line)) {
        annotation(*body);
      }
    }
    for (const auto & c : doc.trailing_comments) {
      if (!is_review_annotation(*c)) {
        comment(*c, 0);
      } else if (options_.annotate_diagnostics) {
        annotation(c->text);
      }
    }

    if (preserve && doc.trailing_whitespace) {
      out_ += *doc.trailing_whitespace;
    } else if (!preserve) {
      out_ += options_.new_line;
    }
    return std::move(out_);
  }

  std::string subtree(const Element & elem)
  {
    element(elem, 0, std::nullopt);
    return std::move(out_);
  }

private:
  void indent(size_t depth)
  {
    for (size_t i = 0; i < depth; ++i) out_ += options_.indent_string;
  }

  void leading(const FormattingHints & hints, size_t depth)
  {
    if (options_.preserve_formatting && hints.leading_whitespace) {
      out_ += *hints.leading_whitespace;
      return;
    }
    if (!out_.empty()) out_ += options_.new_line;
    indent(depth);
  }

  std::optional<std::string> resolve_namespace(const Element & elem) const
  {
    if (
      options_.use_target_namespace && elem.prefix.empty() &&
      (!elem.xml_namespace || elem.xml_namespace == document_default_)) {
      return target_namespace_;
    }
    if (elem.override_namespace) return elem.override_namespace;
    return elem.xml_namespace;
  }

  /// Override namespace the element is written in; the target namespace wins in its own scope
  std::optional<std::string> override_in_effect(const Element & elem) const
  {
    if (!elem.override_namespace) return std::nullopt;
    if (
      options_.use_target_namespace && elem.prefix.empty() &&
      (!elem.xml_namespace || elem.xml_namespace == document_default_)) {
      return std::nullopt;
    }
    return elem.override_namespace;
  }

  /// Prefix written on the tag; an overridden element moves into the default namespace
  std::string written_prefix(const Element & elem) const
  {
    return override_in_effect(elem) ? std::string() : elem.prefix;
  }

  // --------------------------------------------------------------------------
  // Elements
  // --------------------------------------------------------------------------

  void element(const Element & elem, size_t depth, std::optional<std::string> in_scope_default)
  {
    transformation_comment(elem, depth);
    leading(elem.hints, depth);

    const std::string name = qualified(written_prefix(elem), elem.type_name);
    out_ += '<';
    out_ += name;

    std::vector<AttributeText> attrs;
    in_scope_default = namespace_attributes(elem, attrs, std::move(in_scope_default));
    directive_attributes(elem, attrs);
    property_attributes(elem, attrs);
    write_attributes(attrs, name, depth);

    close_start_and_content(elem.hints, name, content_of(elem), depth, in_scope_default);
  }

  std::optional<std::string> namespace_attributes(
    const Element & elem, std::vector<AttributeText> & attrs,
    std::optional<std::string> in_scope_default)
  {
    const bool preserve = options_.preserve_formatting;
    auto recorded = [&](const NamespaceDeclaration & decl) {
      if (preserve && decl.original_text) {
        attrs.push_back({decl.leading_whitespace, *decl.original_text});
      } else {
        attrs.push_back(
          {decl.leading_whitespace,
           decl.attribute_name() + "=\"" + escape_attribute(decl.uri, '"') + "\""});
      }
    };

    auto default_declaration = [&](std::optional<std::string> ws, const std::string & uri) {
      attrs.push_back({std::move(ws), "xmlns=\"" + escape_attribute(uri, '"') + "\""});
    };

    const bool root = elem.parent() == nullptr;
    const std::optional<std::string> override_ns = override_in_effect(elem);
    bool own_default = false;

    if (root && options_.use_target_namespace) {
      const NamespaceDeclaration * default_decl = nullptr;
      const NamespaceDeclaration * x_decl = nullptr;
      for (const auto & decl : elem.namespace_declarations) {
        if (decl.prefix.empty()) default_decl = &decl;
        if (decl.prefix == "x") x_decl = &decl;
      }
      const std::string default_uri = override_ns.value_or(target_namespace_);
      default_declaration(
        default_decl ? default_decl->leading_whitespace : std::nullopt, default_uri);
      if (x_decl && x_decl->uri == k_xaml_language_namespace) {
        recorded(*x_decl);
      } else {
        attrs.push_back(
          {x_decl ? x_decl->leading_whitespace : std::nullopt,
           std::string("xmlns:x=\"") + k_xaml_language_namespace + "\""});
      }
      for (const auto & decl : elem.namespace_declarations) {
        if (!decl.prefix.empty() && decl.prefix != "x") recorded(decl);
      }
      return default_uri;
    }

    for (const auto & decl : elem.namespace_declarations) {
      if (!decl.prefix.empty()) {
        recorded(decl);
        continue;
      }
      own_default = true;
      if (override_ns && decl.uri != *override_ns) {
        default_declaration(decl.leading_whitespace, *override_ns);
        in_scope_default = override_ns;
      } else {
        recorded(decl);
        in_scope_default = decl.uri;
      }
    }

    if (!own_default && (elem.prefix.empty() || override_ns)) {
      const auto resolved = override_ns ? override_ns : resolve_namespace(elem);
      if (resolved && resolved != in_scope_default) {
        default_declaration(std::nullopt, *resolved);
        in_scope_default = resolved;
      }
    }
    return in_scope_default;
  }

  void directive_attributes(const Element & elem, std::vector<AttributeText> & attrs)
  {
    for (const auto directive : k_directive_order) {
      const auto value = directive_value(elem, directive);
      if (!value) continue;

      const auto hint = elem.directive_hints.find(std::string(directive));
      const FormattingHints * hints =
        hint != elem.directive_hints.end() ? &hint->second : nullptr;
      const std::string attr_name = qualified(elem.directive_prefix, std::string(directive));

      if (options_.preserve_formatting && hints && hints->original_text && hints->original_value) {
        const bool unchanged = directive == "Shared" ? iequals(*hints->original_value, *value)
                                                     : *hints->original_value == *value;
        if (unchanged && hints->original_name == attr_name) {
          attrs.push_back({hints->leading_whitespace, *hints->original_text});
          continue;
        }
      }
      const char quote = hints ? hints->quote_char : '"';
      attrs.push_back(
        {hints ? hints->leading_whitespace : std::nullopt,
         attr_name + "=" + quote + escape_attribute(*value, quote) + quote});
    }
  }

  void property_attributes(const Element & elem, std::vector<AttributeText> & attrs)
  {
    std::vector<const Property *> props;
    for (const auto & p : elem.properties()) {
      if (!written_as_property_element(*p)) props.push_back(p.get());
    }
    if (options_.sort_attributes) {
      std::stable_sort(props.begin(), props.end(), [](const Property * a, const Property * b) {
        return a->attribute_name() < b->attribute_name();
      });
    }

    for (const Property * p : props) {
      const std::string name = p->attribute_name();
      const std::string value = attribute_value(*p);
      const FormattingHints & hints = p->hints;
      if (
        options_.preserve_formatting && hints.original_text && hints.original_name == name &&
        hints.original_value == value) {
        attrs.push_back({hints.leading_whitespace, *hints.original_text});
        continue;
      }
      const char quote = hints.quote_char;
      attrs.push_back(
        {hints.leading_whitespace, name + "=" + quote + escape_attribute(value, quote) + quote});
    }
  }

  void write_attributes(const std::vector<AttributeText> & attrs, const std::string & name, size_t depth)
  {
    if (options_.preserve_formatting) {
      for (const auto & a : attrs) {
        out_ += a.leading.value_or(" ");
        out_ += a.text;
      }
      return;
    }

    bool separate = options_.attributes_on_separate_lines && !attrs.empty();
    if (!separate && attrs.size() > 1) {
      size_t width = depth * options_.indent_string.size() + 1 + name.size() + 1;
      for (const auto & a : attrs) width += 1 + a.text.size();
      separate = width > options_.max_line_length;
    }
    for (const auto & a : attrs) {
      if (separate) {
        out_ += options_.new_line;
        indent(depth + 1);
      } else {
        out_ += ' ';
      }
      out_ += a.text;
    }
  }

  // --------------------------------------------------------------------------
  // Content
  // --------------------------------------------------------------------------

  bool emits_comment(const Comment & c) const
  {
    return c.preserve && options_.preserve_comments;
  }

  std::vector<ContentItem> content_of(const Element & elem) const
  {
    std::vector<ContentItem> items;
    const auto & children = elem.children();
    for (size_t i = 0; i < children.size(); ++i) {
      items.push_back(
        {ContentItem::Kind::Child, i, 1, children[i]->hints.source_order, children[i].get()});
    }
    for (const auto & c : elem.comments) {
      if (!emits_comment(*c)) continue;
      items.push_back(
        {ContentItem::Kind::Comment, c->hints.content_anchor.value_or(children.size()), 0,
         c->hints.source_order, c.get()});
    }
    for (const auto & p : elem.properties()) {
      if (!written_as_property_element(*p)) continue;
      items.push_back(
        {ContentItem::Kind::PropertyElement, p->hints.content_anchor.value_or(0), 0,
         p->hints.source_order, p.get()});
    }
    if (elem.text_content && !elem.text_content->empty()) {
      items.push_back(
        {ContentItem::Kind::Text, elem.text_hints.content_anchor.value_or(0), 0,
         elem.text_hints.source_order, &elem});
    }
    std::stable_sort(items.begin(), items.end(), [](const ContentItem & a, const ContentItem & b) {
      if (a.anchor != b.anchor) return a.anchor < b.anchor;
      if (a.rank != b.rank) return a.rank < b.rank;
      return a.order < b.order;
    });
    return items;
  }

  /// Content of a property element: its single value or the items of its collection
  std::vector<ContentItem> content_of(const Property & prop) const
  {
    const Element * value = prop.element();
    if (value && value->synthetic_collection) return content_of(*value);

    std::vector<ContentItem> items;
    if (value) items.push_back({ContentItem::Kind::Child, 0, 1, 0, value});
    for (const auto & c : prop.comments) {
      if (!emits_comment(*c)) continue;
      items.push_back(
        {ContentItem::Kind::Comment, c->hints.content_anchor.value_or(0), 0,
         c->hints.source_order, c.get()});
    }
    std::stable_sort(items.begin(), items.end(), [](const ContentItem & a, const ContentItem & b) {
      if (a.anchor != b.anchor) return a.anchor < b.anchor;
      return a.rank < b.rank;
    });
    return items;
  }

  void close_start_and_content(
    const FormattingHints & hints, const std::string & name, const std::vector<ContentItem> & items,
    size_t depth, const std::optional<std::string> & in_scope_default)
  {
    const bool preserve = options_.preserve_formatting;
    const std::string tag_end = preserve ? hints.tag_end_whitespace.value_or("") : "";

    if (items.empty()) {
      const bool self_close =
        preserve && hints.self_closing ? *hints.self_closing : options_.use_self_closing_tags;
      if (self_close) {
        out_ += preserve ? tag_end + "/>" : " />";
      } else {
        out_ += tag_end + ">";
        if (preserve && hints.closing_whitespace) out_ += *hints.closing_whitespace;
        out_ += "</" + name + ">";
      }
      return;
    }

    out_ += tag_end + ">";
    bool block = false;
    for (const auto & item : items) {
      if (item.kind != ContentItem::Kind::Text) block = true;
    }

    for (const auto & item : items) {
      switch (item.kind) {
        case ContentItem::Kind::Child:
          element(*static_cast<const Element *>(item.node), depth + 1, in_scope_default);
          break;
        case ContentItem::Kind::Comment:
          comment(*static_cast<const Comment *>(item.node), depth + 1);
          break;
        case ContentItem::Kind::PropertyElement:
          property_element(*static_cast<const Property *>(item.node), depth + 1, in_scope_default);
          break;
        case ContentItem::Kind::Text:
          text(*static_cast<const Element *>(item.node), depth + 1, block);
          break;
      }
    }

    if (preserve && hints.closing_whitespace) {
      out_ += *hints.closing_whitespace;
    } else if (block) {
      out_ += options_.new_line;
      indent(depth);
    }
    out_ += "</" + name + ">";
  }

  void text(const Element & elem, size_t depth, bool block)
  {
    const FormattingHints & hints = elem.text_hints;
    if (
      options_.preserve_formatting && hints.original_text && hints.original_value == elem.text_content) {
      out_ += *hints.original_text;
      return;
    }
    if (block) {
      out_ += options_.new_line;
      indent(depth);
    }
    out_ += escape_text(*elem.text_content);
  }

  void property_element(
    const Property & prop, size_t depth, const std::optional<std::string> & in_scope_default)
  {
    leading(prop.hints, depth);
    // Property elements share the prefix of an owner that moved into the default namespace
    const Element * owner = prop.owner_element();
    const bool follows_owner =
      owner && prop.prefix == owner->prefix && override_in_effect(*owner).has_value();
    const std::string name =
      qualified(follows_owner ? std::string() : prop.prefix, prop.full_name());
    out_ += '<';
    out_ += name;

    if (prop.literal() || prop.markup_extension()) {
      const std::string value = attribute_value(prop);
      const FormattingHints & hints = prop.hints;
      out_ += options_.preserve_formatting ? hints.tag_end_whitespace.value_or("") : "";
      out_ += '>';
      if (options_.preserve_formatting && hints.original_text && hints.original_value == value) {
        out_ += *hints.original_text;
      } else {
        out_ += escape_text(value);
      }
      if (options_.preserve_formatting && hints.closing_whitespace) out_ += *hints.closing_whitespace;
      out_ += "</" + name + ">";
      return;
    }

    close_start_and_content(prop.hints, name, content_of(prop), depth, in_scope_default);
  }

  void comment(const Comment & c, size_t depth)
  {
    if (!emits_comment(c)) return;
    leading(c.hints, depth);
    const std::string rendered = "<!--" + c.text + "-->";
    if (options_.preserve_formatting && c.hints.original_text == rendered) {
      out_ += *c.hints.original_text;
    } else {
      out_ += "<!--" + sanitize_comment(c.text) + "-->";
    }
  }

  void annotation(const std::string & body)
  {
    out_ += options_.new_line;
    out_ += "<!--" + body + "-->";
  }

  void transformation_comment(const Element & elem, size_t depth)
  {
    if (trace_.empty()) return;
    std::vector<std::string> lines;
    auto collect = [&](uint64_t id) {
      const auto it = trace_.find(id);
      if (it == trace_.end()) return;
      for (const auto * record : it->second) {
        lines.push_back(record->rule_name + ": " + record->description);
      }
    };
    collect(elem.id());
    for (const auto & p : elem.properties()) {
      if (!written_as_property_element(*p)) collect(p->id());
    }
    if (lines.empty()) return;

    leading(elem.hints, depth);
    out_ += "<!-- Transformed by " + sanitize_comment(fmt::format("{}", fmt::join(lines, "; "))) + " -->";
  }

  const XamlWriterOptions & options_;
  const Document * doc_;
  std::optional<std::string> document_default_;
  std::string target_namespace_;
  std::map<uint64_t, std::vector<const TransformationRecord *>> trace_;
  std::string out_;
};

}  // namespace

// ============================================================================
// XamlWriter
// ============================================================================

XamlWriter::XamlWriter(XamlWriterOptions options) : options_(std::move(options)) {}

std::string XamlWriter::write(const Document & doc) const
{
  return TextEmitter(options_, &doc).document();
}

std::string XamlWriter::write(const Element & elem) const
{
  return TextEmitter(options_, nullptr).subtree(elem);
}

std::string target_namespace_for(const Document & doc, const XamlWriterOptions & options)
{
  if (options.target_namespace) return *options.target_namespace;
  if (doc.metadata.transformed_namespace) return *doc.metadata.transformed_namespace;
  return k_avalonia_namespace;
}

std::optional<std::string> review_annotation(
  const DiagnosticBag & diags, size_t cap, const std::string & new_line)
{
  const auto errors = diags.errors();
  const auto warnings = diags.warnings();
  if (errors.empty() && warnings.empty()) return std::nullopt;

  const std::string rule(70, '=');
  std::string body = new_line + "WPF to Avalonia Conversion - Manual Review Required:" + new_line +
                     rule + new_line;

  auto section = [&](const std::vector<Diagnostic> & list, std::string_view title,
                     std::string_view noun) {
    if (list.empty()) return;
    body += new_line + fmt::format("{} ({}):", title, list.size()) + new_line;
    for (size_t i = 0; i < list.size() && i < cap; ++i) {
      body += sanitize_comment(
                fmt::format("  [{}] Line {}: {}", list[i].code, list[i].line, list[i].message)) +
              new_line;
    }
    if (list.size() > cap) {
      body += fmt::format("  ... and {} more {}", list.size() - cap, noun) + new_line;
    }
  };
  section(errors, "ERRORS", "errors");
  section(warnings, "WARNINGS", "warnings");

  body += new_line + "Please review and address these issues manually." + new_line + rule + new_line;
  return body;
}

bool attach_review_annotation(Document & doc, size_t cap, const std::string & new_line)
{
  auto & trailing = doc.trailing_comments;
  trailing.erase(
    std::remove_if(
      trailing.begin(), trailing.end(), [](const auto & c) { return is_review_annotation(*c); }),
    trailing.end());

  auto body = review_annotation(doc.collect_all_diagnostics(), cap, new_line);
  if (!body) return false;

  auto comment = std::make_unique<Comment>(std::move(*body), false);
  comment->placement = CommentPlacement::Standalone;
  trailing.insert(trailing.begin(), std::move(comment));
  return true;
}

}  // namespace xaml_bridge
