// xaml_bridge/ast/unified_ast.cpp - Unified markup AST implementation
//
#include "xaml_bridge/ast/unified_ast.hpp"

#include <algorithm>
#include <atomic>
#include <utility>

#include "xaml_bridge/basic/casting.hpp"

namespace xaml_bridge
{

namespace
{

uint64_t next_node_id() noexcept
{
  static std::atomic<uint64_t> counter{1};
  return counter.fetch_add(1, std::memory_order_relaxed);
}

std::string_view strip_prefix(std::string_view name) noexcept
{
  const auto colon = name.find(':');
  return colon == std::string_view::npos ? name : name.substr(colon + 1);
}

bool needs_quoting(std::string_view value) noexcept
{
  if (value.empty()) return true;
  if (value.rfind("{}", 0) == 0) return false;
  if (value.front() == ' ' || value.back() == ' ') return true;
  return value.find_first_of(",{}='\"\\") != std::string_view::npos;
}

std::string quote_value(std::string_view value, char quote)
{
  std::string out;
  out.reserve(value.size() + 2);
  out.push_back(quote);
  for (const char c : value) {
    if (c == quote || c == '\\') out.push_back('\\');
    out.push_back(c);
  }
  out.push_back(quote);
  return out;
}

std::string argument_text(const MarkupExtensionArgument & arg)
{
  if (const auto * nested = arg.nested()) return nested->to_string();
  const std::string & value = *arg.literal();
  if (arg.quote != 0) return quote_value(value, arg.quote);
  if (needs_quoting(value)) return quote_value(value, '\'');
  return value;
}

/// Literal or canonical nested text, used for payload fields
std::string argument_value(const MarkupExtensionArgument & arg)
{
  if (const auto * nested = arg.nested()) return nested->to_string();
  return *arg.literal();
}

template <typename T>
void reindex(std::vector<std::unique_ptr<T>> & items, UnifiedNode * parent)
{
  for (size_t i = 0; i < items.size(); ++i) {
    items[i]->set_parent(parent, i);
  }
}

void collect_extension_diagnostics(const MarkupExtension & ext, DiagnosticBag & bag);

void collect_property_diagnostics(const Property & prop, DiagnosticBag & bag);

void collect_element_diagnostics(const Element & elem, DiagnosticBag & bag)
{
  for (const auto & d : elem.diagnostics) bag.add(d);
  for (const auto & c : elem.comments) {
    for (const auto & d : c->diagnostics) bag.add(d);
  }
  for (const auto & p : elem.properties()) collect_property_diagnostics(*p, bag);
  for (const auto & child : elem.children()) collect_element_diagnostics(*child, bag);
}

void collect_property_diagnostics(const Property & prop, DiagnosticBag & bag)
{
  for (const auto & d : prop.diagnostics) bag.add(d);
  if (const auto * e = prop.element()) collect_element_diagnostics(*e, bag);
  if (const auto * m = prop.markup_extension()) collect_extension_diagnostics(*m, bag);
}

void collect_extension_diagnostics(const MarkupExtension & ext, DiagnosticBag & bag)
{
  for (const auto & d : ext.diagnostics) bag.add(d);
  if (ext.positional) {
    if (const auto * n = ext.positional->nested()) collect_extension_diagnostics(*n, bag);
  }
  for (const auto & arg : ext.parameters) {
    if (const auto * n = arg.nested()) collect_extension_diagnostics(*n, bag);
  }
}

void collect_descendants(const Element & elem, std::vector<Element *> & out)
{
  for (const auto & p : elem.properties()) {
    if (auto * value = p->element()) {
      out.push_back(value);
      collect_descendants(*value, out);
    }
  }
  for (const auto & child : elem.children()) {
    out.push_back(child.get());
    collect_descendants(*child, out);
  }
}

}  // namespace

std::string_view to_string(NodeKind kind) noexcept
{
  switch (kind) {
    case NodeKind::Element:
      return "Element";
    case NodeKind::Property:
      return "Property";
    case NodeKind::MarkupExtension:
      return "MarkupExtension";
    case NodeKind::Comment:
      return "Comment";
  }
  return "Unknown";
}

// ============================================================================
// UnifiedNode
// ============================================================================

UnifiedNode::UnifiedNode(NodeKind k) : kind_(k), id_(next_node_id()) {}

Element * UnifiedNode::enclosing_element() const noexcept
{
  for (UnifiedNode * p = parent_; p != nullptr; p = p->parent()) {
    if (auto * e = dyn_cast<Element>(p)) return e;
  }
  return nullptr;
}

void UnifiedNode::add_diagnostic(Severity severity, std::string code, std::string message)
{
  Diagnostic d;
  d.severity = severity;
  d.code = std::move(code);
  d.message = std::move(message);
  d.line = location.line;
  d.column = location.column;
  diagnostics.push_back(std::move(d));
}

void UnifiedNode::copy_base_into(UnifiedNode & target) const
{
  target.location = location;
  target.hints = hints;
  target.diagnostics = diagnostics;
  target.state = state;
}

// ============================================================================
// Comment
// ============================================================================

std::unique_ptr<Comment> Comment::clone() const
{
  auto out = std::make_unique<Comment>(text, preserve);
  out->placement = placement;
  copy_base_into(*out);
  return out;
}

// ============================================================================
// MarkupExtension
// ============================================================================

MarkupExtension * MarkupExtensionArgument::nested() const noexcept
{
  const auto * p = std::get_if<std::unique_ptr<MarkupExtension>>(&value);
  return p ? p->get() : nullptr;
}

MarkupExtensionArgument MarkupExtensionArgument::clone() const
{
  MarkupExtensionArgument out;
  out.name = name;
  out.quote = quote;
  if (const auto * n = nested()) {
    out.value = n->clone();
  } else {
    out.value = *literal();
  }
  return out;
}

MarkupExtensionKind classify_markup_extension(std::string_view name) noexcept
{
  std::string_view local = strip_prefix(name);
  constexpr std::string_view suffix = "Extension";
  if (local.size() > suffix.size() && local.substr(local.size() - suffix.size()) == suffix) {
    local.remove_suffix(suffix.size());
  }

  if (local == "Binding" || local == "MultiBinding" || local == "PriorityBinding") {
    return MarkupExtensionKind::Binding;
  }
  if (local == "TemplateBinding") return MarkupExtensionKind::TemplateBinding;
  if (local == "StaticResource") return MarkupExtensionKind::StaticResource;
  if (local == "DynamicResource") return MarkupExtensionKind::DynamicResource;
  if (local == "RelativeSource") return MarkupExtensionKind::RelativeSource;
  if (local == "Type") return MarkupExtensionKind::Type;
  if (local == "Static") return MarkupExtensionKind::Static;
  if (local == "Null") return MarkupExtensionKind::Null;
  return MarkupExtensionKind::Custom;
}

MarkupExtensionKind MarkupExtension::extension_kind() const noexcept
{
  return classify_markup_extension(name);
}

std::string_view MarkupExtension::local_name() const noexcept { return strip_prefix(name); }

const MarkupExtensionArgument * MarkupExtension::find_parameter(std::string_view key) const
{
  for (const auto & arg : parameters) {
    if (arg.name == key) return &arg;
  }
  return nullptr;
}

MarkupExtensionArgument * MarkupExtension::find_parameter(std::string_view key)
{
  for (auto & arg : parameters) {
    if (arg.name == key) return &arg;
  }
  return nullptr;
}

std::optional<std::string> MarkupExtension::literal_parameter(std::string_view key) const
{
  const MarkupExtensionArgument * arg =
    key.empty() ? (positional ? &*positional : nullptr) : find_parameter(key);
  if (!arg || !arg->literal()) return std::nullopt;
  return *arg->literal();
}

void MarkupExtension::set_positional(std::string value, char quote)
{
  MarkupExtensionArgument arg;
  arg.value = std::move(value);
  arg.quote = quote;
  positional = std::move(arg);
  refresh_payload();
}

void MarkupExtension::set_parameter(std::string key, std::string value, char quote)
{
  if (auto * existing = find_parameter(key)) {
    existing->value = std::move(value);
    existing->quote = quote;
  } else {
    MarkupExtensionArgument arg;
    arg.name = std::move(key);
    arg.value = std::move(value);
    arg.quote = quote;
    parameters.push_back(std::move(arg));
  }
  refresh_payload();
}

void MarkupExtension::set_parameter(std::string key, std::unique_ptr<MarkupExtension> value)
{
  if (auto * existing = find_parameter(key)) {
    existing->value = std::move(value);
    existing->quote = 0;
  } else {
    MarkupExtensionArgument arg;
    arg.name = std::move(key);
    arg.value = std::move(value);
    parameters.push_back(std::move(arg));
  }
  adopt_arguments();
  refresh_payload();
}

bool MarkupExtension::remove_parameter(std::string_view key)
{
  const auto it = std::find_if(
    parameters.begin(), parameters.end(), [&](const auto & a) { return a.name == key; });
  if (it == parameters.end()) return false;
  parameters.erase(it);
  adopt_arguments();
  refresh_payload();
  return true;
}

void MarkupExtension::adopt_arguments()
{
  if (positional) {
    if (auto * n = positional->nested()) n->set_parent(this, 0);
  }
  for (size_t i = 0; i < parameters.size(); ++i) {
    if (auto * n = parameters[i].nested()) n->set_parent(this, i + 1);
  }
}

void MarkupExtension::refresh_payload()
{
  auto value_of = [&](std::string_view key) -> std::optional<std::string> {
    if (const auto * arg = find_parameter(key)) return argument_value(*arg);
    return std::nullopt;
  };
  auto positional_or = [&](std::string_view key) -> std::optional<std::string> {
    if (positional) return argument_value(*positional);
    return value_of(key);
  };

  switch (extension_kind()) {
    case MarkupExtensionKind::Binding:
    case MarkupExtensionKind::TemplateBinding: {
      BindingPayload b;
      b.path = positional_or(
        extension_kind() == MarkupExtensionKind::TemplateBinding ? "Property" : "Path");
      b.mode = value_of("Mode");
      b.update_source_trigger = value_of("UpdateSourceTrigger");
      b.converter = value_of("Converter");
      b.converter_parameter = value_of("ConverterParameter");
      b.string_format = value_of("StringFormat");
      b.element_name = value_of("ElementName");
      b.relative_source = value_of("RelativeSource");
      b.source = value_of("Source");
      b.fallback_value = value_of("FallbackValue");
      b.target_null_value = value_of("TargetNullValue");
      payload = std::move(b);
      break;
    }
    case MarkupExtensionKind::StaticResource:
    case MarkupExtensionKind::DynamicResource: {
      ResourcePayload r;
      r.resource_key = positional_or("ResourceKey").value_or("");
      r.is_dynamic = extension_kind() == MarkupExtensionKind::DynamicResource;
      payload = std::move(r);
      break;
    }
    case MarkupExtensionKind::Type: {
      TypeReferencePayload t;
      const std::string full = positional_or("TypeName").value_or("");
      const auto colon = full.find(':');
      if (colon != std::string::npos) {
        t.prefix = full.substr(0, colon);
        t.type_name = full.substr(colon + 1);
      } else {
        t.type_name = full;
      }
      payload = std::move(t);
      break;
    }
    case MarkupExtensionKind::Static: {
      StaticMemberPayload s;
      s.member = positional_or("Member").value_or("");
      const auto dot = s.member.rfind('.');
      if (dot != std::string::npos) {
        s.owner_type = s.member.substr(0, dot);
        s.member_name = s.member.substr(dot + 1);
      } else {
        s.member_name = s.member;
      }
      payload = std::move(s);
      break;
    }
    default:
      payload = std::monostate{};
      break;
  }
}

std::string MarkupExtension::to_string() const
{
  std::string out = "{" + name;
  bool first = true;
  if (positional) {
    out += ' ';
    out += argument_text(*positional);
    first = false;
  }
  for (const auto & arg : parameters) {
    out += first ? " " : ", ";
    first = false;
    out += arg.name;
    out += '=';
    out += argument_text(arg);
  }
  out += '}';
  return out;
}

std::unique_ptr<MarkupExtension> MarkupExtension::clone() const
{
  auto out = std::make_unique<MarkupExtension>(name);
  if (positional) out->positional = positional->clone();
  out->parameters.reserve(parameters.size());
  for (const auto & arg : parameters) out->parameters.push_back(arg.clone());
  out->payload = payload;
  out->resolved_type = resolved_type;
  copy_base_into(*out);
  out->adopt_arguments();
  return out;
}

// ============================================================================
// Property
// ============================================================================

Property::Property() = default;

Property::Property(std::string n, std::string literal_value, PropertyKind k)
: name(std::move(n)), kind(k), value_(std::move(literal_value))
{
}

Property::~Property() = default;

Element * Property::element() const noexcept
{
  const auto * p = std::get_if<std::unique_ptr<Element>>(&value_);
  return p ? p->get() : nullptr;
}

MarkupExtension * Property::markup_extension() const noexcept
{
  const auto * p = std::get_if<std::unique_ptr<MarkupExtension>>(&value_);
  return p ? p->get() : nullptr;
}

void Property::set_value(std::string literal_value) { value_ = std::move(literal_value); }

void Property::set_value(std::unique_ptr<Element> element_value)
{
  if (element_value) element_value->set_parent(this, 0);
  value_ = std::move(element_value);
}

void Property::set_value(std::unique_ptr<MarkupExtension> extension_value)
{
  if (extension_value) extension_value->set_parent(this, 0);
  value_ = std::move(extension_value);
}

void Property::clear_value() { value_ = std::monostate{}; }

std::unique_ptr<Element> Property::take_element()
{
  auto * slot = std::get_if<std::unique_ptr<Element>>(&value_);
  if (!slot) return nullptr;
  auto out = std::move(*slot);
  value_ = std::monostate{};
  if (out) out->set_parent(nullptr);
  return out;
}

std::unique_ptr<MarkupExtension> Property::take_markup_extension()
{
  auto * slot = std::get_if<std::unique_ptr<MarkupExtension>>(&value_);
  if (!slot) return nullptr;
  auto out = std::move(*slot);
  value_ = std::monostate{};
  if (out) out->set_parent(nullptr);
  return out;
}

Element * Property::owner_element() const noexcept { return dyn_cast<Element>(parent()); }

std::string Property::full_name() const
{
  if (attached_owner_type) return *attached_owner_type + "." + name;
  if (kind == PropertyKind::PropertyElement) {
    if (const auto * owner = owner_element()) return owner->type_name + "." + name;
  }
  return name;
}

std::string Property::attribute_name() const
{
  std::string out;
  if (!prefix.empty()) out = prefix + ":";
  if (attached_owner_type) out += *attached_owner_type + ".";
  out += name;
  return out;
}

void Property::add_comment(std::unique_ptr<Comment> comment)
{
  comment->set_parent(this, comments.size());
  comments.push_back(std::move(comment));
}

std::unique_ptr<Property> Property::clone() const
{
  auto out = std::make_unique<Property>();
  out->name = name;
  out->kind = kind;
  out->attached_owner_type = attached_owner_type;
  out->prefix = prefix;
  out->resolved_property = resolved_property;
  copy_base_into(*out);
  for (const auto & c : comments) out->add_comment(c->clone());
  if (const auto * s = literal()) {
    out->set_value(*s);
  } else if (const auto * e = element()) {
    out->set_value(e->clone());
  } else if (const auto * m = markup_extension()) {
    out->set_value(m->clone());
  }
  return out;
}

// ============================================================================
// Element
// ============================================================================

Element::Element() = default;

Element::Element(std::string type, std::optional<std::string> ns)
: type_name(std::move(type)), xml_namespace(std::move(ns))
{
}

Element::~Element() = default;

Property & Element::add_property(std::unique_ptr<Property> property)
{
  property->set_parent(this, properties_.size());
  properties_.push_back(std::move(property));
  return *properties_.back();
}

Property & Element::add_property(std::string name, std::string value)
{
  return add_property(std::make_unique<Property>(std::move(name), std::move(value)));
}

Property & Element::insert_property(size_t index, std::unique_ptr<Property> property)
{
  index = std::min(index, properties_.size());
  auto it = properties_.insert(properties_.begin() + static_cast<ptrdiff_t>(index), std::move(property));
  reindex_properties();
  return **it;
}

std::unique_ptr<Property> Element::remove_property(size_t index)
{
  if (index >= properties_.size()) return nullptr;
  auto out = std::move(properties_[index]);
  properties_.erase(properties_.begin() + static_cast<ptrdiff_t>(index));
  reindex_properties();
  out->set_parent(nullptr);
  return out;
}

Property * Element::find_property(std::string_view name) const
{
  for (const auto & p : properties_) {
    if (p->name == name) return p.get();
  }
  return nullptr;
}

Property * Element::find_property_by_full_name(std::string_view full_name) const
{
  for (const auto & p : properties_) {
    if (p->full_name() == full_name) return p.get();
  }
  return nullptr;
}

std::vector<std::unique_ptr<Property>> Element::release_properties()
{
  auto out = std::move(properties_);
  properties_.clear();
  for (auto & p : out) p->set_parent(nullptr);
  return out;
}

Element & Element::add_child(std::unique_ptr<Element> child)
{
  child->set_parent(this, children_.size());
  children_.push_back(std::move(child));
  return *children_.back();
}

Element & Element::insert_child(size_t index, std::unique_ptr<Element> child)
{
  index = std::min(index, children_.size());
  auto it = children_.insert(children_.begin() + static_cast<ptrdiff_t>(index), std::move(child));
  reindex_children();
  return **it;
}

std::unique_ptr<Element> Element::remove_child(size_t index)
{
  if (index >= children_.size()) return nullptr;
  auto out = std::move(children_[index]);
  children_.erase(children_.begin() + static_cast<ptrdiff_t>(index));
  reindex_children();
  out->set_parent(nullptr);
  return out;
}

std::unique_ptr<Element> Element::replace_child(size_t index, std::unique_ptr<Element> child)
{
  if (index >= children_.size()) return child;
  auto out = std::move(children_[index]);
  child->set_parent(this, index);
  children_[index] = std::move(child);
  out->set_parent(nullptr);
  return out;
}

std::vector<std::unique_ptr<Element>> Element::release_children()
{
  auto out = std::move(children_);
  children_.clear();
  for (auto & c : out) c->set_parent(nullptr);
  return out;
}

void Element::add_comment(std::unique_ptr<Comment> comment)
{
  comment->set_parent(this, comments.size());
  comments.push_back(std::move(comment));
}

std::vector<Element *> Element::descendants() const
{
  std::vector<Element *> out;
  collect_descendants(*this, out);
  return out;
}

std::vector<Element *> Element::descendants_and_self()
{
  std::vector<Element *> out{this};
  collect_descendants(*this, out);
  return out;
}

std::string Element::full_type_name() const
{
  constexpr std::string_view clr_prefix = "clr-namespace:";
  if (xml_namespace && xml_namespace->rfind(clr_prefix, 0) == 0) {
    std::string ns = xml_namespace->substr(clr_prefix.size());
    const auto semi = ns.find(';');
    if (semi != std::string::npos) ns.resize(semi);
    if (!ns.empty()) return ns + "." + type_name;
  }
  if (resolved_type && !resolved_type->clr_name.empty()) return resolved_type->clr_name;
  return type_name;
}

bool Element::has_content() const
{
  if (!children_.empty() || !comments.empty()) return true;
  if (text_content && !text_content->empty()) return true;
  return std::any_of(properties_.begin(), properties_.end(), [](const auto & p) {
    return p->kind == PropertyKind::PropertyElement;
  });
}

void Element::reindex_properties() { reindex(properties_, this); }

void Element::reindex_children() { reindex(children_, this); }

std::unique_ptr<Element> Element::clone() const
{
  auto out = std::make_unique<Element>(type_name, xml_namespace);
  out->prefix = prefix;
  out->text_content = text_content;
  out->text_hints = text_hints;
  out->resolved_type = resolved_type;
  out->x_name = x_name;
  out->x_key = x_key;
  out->x_class = x_class;
  out->x_field_modifier = x_field_modifier;
  out->x_shared = x_shared;
  out->directive_prefix = directive_prefix;
  out->directive_hints = directive_hints;
  out->namespace_declarations = namespace_declarations;
  out->override_namespace = override_namespace;
  out->synthetic_collection = synthetic_collection;
  copy_base_into(*out);
  for (const auto & c : comments) out->add_comment(c->clone());
  for (const auto & p : properties_) out->add_property(p->clone());
  for (const auto & child : children_) out->add_child(child->clone());
  return out;
}

// ============================================================================
// Document
// ============================================================================

Document::Document() = default;

Document::~Document() = default;

void Document::set_root(std::unique_ptr<Element> root)
{
  root_ = std::move(root);
  if (root_) root_->set_parent(nullptr);
}

std::unique_ptr<Element> Document::take_root() { return std::move(root_); }

std::vector<Element *> Document::named_elements() const
{
  std::vector<Element *> out;
  if (!root_) return out;
  for (auto * e : root_->descendants_and_self()) {
    if (e->x_name) out.push_back(e);
  }
  return out;
}

std::vector<Element *> Document::elements_by_type(std::string_view type_name) const
{
  std::vector<Element *> out;
  if (!root_) return out;
  for (auto * e : root_->descendants_and_self()) {
    if (e->type_name == type_name) out.push_back(e);
  }
  return out;
}

Element * Document::find_element_by_name(std::string_view name) const
{
  if (!root_) return nullptr;
  for (auto * e : root_->descendants_and_self()) {
    if (e->x_name && *e->x_name == name) return e;
  }
  return nullptr;
}

DiagnosticBag Document::collect_all_diagnostics() const
{
  DiagnosticBag bag = diagnostics;
  if (root_) collect_element_diagnostics(*root_, bag);
  return bag;
}

void Document::refresh_symbols() { symbols.rebuild(root_.get()); }

std::unique_ptr<Document> Document::clone() const
{
  auto out = std::make_unique<Document>();
  out->file_path = file_path;
  out->declaration = declaration;
  out->has_bom = has_bom;
  out->encoding = encoding;
  for (const auto & c : leading_comments) out->leading_comments.push_back(c->clone());
  for (const auto & c : trailing_comments) out->trailing_comments.push_back(c->clone());
  out->trailing_whitespace = trailing_whitespace;
  out->metadata = metadata;
  out->transformation_trace = transformation_trace;
  out->diagnostics = diagnostics;
  if (root_) out->set_root(root_->clone());
  out->symbols = symbols;
  out->refresh_symbols();
  return out;
}

}  // namespace xaml_bridge
