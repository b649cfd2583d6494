// xaml_bridge/ast/json_dump.cpp - JSON rendering of the Unified AST
//
#include "xaml_bridge/ast/json_dump.hpp"

#include <string>
#include <variant>

#include "xaml_bridge/basic/casting.hpp"

namespace xaml_bridge
{
namespace
{

using nlohmann::json;

json j_location(const Location & loc)
{
  if (!loc.is_valid()) return nullptr;
  return json{{"line", loc.line}, {"column", loc.column}};
}

template <typename T>
json j_optional(const std::optional<T> & value)
{
  if (!value) return nullptr;
  return json(*value);
}

const char * property_kind_name(PropertyKind kind) noexcept
{
  switch (kind) {
    case PropertyKind::Attribute:
      return "Attribute";
    case PropertyKind::PropertyElement:
      return "PropertyElement";
    case PropertyKind::AttachedProperty:
      return "AttachedProperty";
  }
  return "Attribute";
}

const char * state_name(TransformationState state) noexcept
{
  switch (state) {
    case TransformationState::Unanalyzed:
      return "Unanalyzed";
    case TransformationState::Analyzed:
      return "Analyzed";
    case TransformationState::Transformed:
      return "Transformed";
    case TransformationState::Skipped:
      return "Skipped";
    case TransformationState::Failed:
      return "Failed";
    case TransformationState::RequiresManualReview:
      return "RequiresManualReview";
  }
  return "Unanalyzed";
}

json j_resolved_type(const std::optional<ResolvedType> & rt)
{
  if (!rt) return nullptr;
  return json{
    {"name", rt->name},
    {"clrName", rt->clr_name},
    {"baseType", j_optional(rt->base_type)},
    {"contentProperty", j_optional(rt->content_property)}};
}

json j_argument(const MarkupExtensionArgument & arg)
{
  json out{{"name", arg.name}};
  if (const auto * nested = arg.nested()) {
    out["value"] = to_json(nested);
  } else {
    out["value"] = *arg.literal();
  }
  return out;
}

json j_extension(const MarkupExtension & ext)
{
  json params = json::array();
  for (const auto & p : ext.parameters) params.push_back(j_argument(p));
  return json{
    {"type", "MarkupExtension"},
    {"name", ext.name},
    {"positional", ext.positional ? j_argument(*ext.positional) : json(nullptr)},
    {"parameters", params},
    {"text", ext.to_string()},
    {"resolvedType", j_resolved_type(ext.resolved_type)}};
}

json j_comment(const Comment & c)
{
  return json{
    {"type", "Comment"},
    {"text", c.text},
    {"preserve", c.preserve},
    {"location", j_location(c.location)}};
}

json j_property(const Property & p)
{
  json value = nullptr;
  if (const auto * literal = p.literal()) {
    value = *literal;
  } else if (const auto * ext = p.markup_extension()) {
    value = j_extension(*ext);
  } else if (const auto * elem = p.element()) {
    value = to_json(elem);
  }

  json out{
    {"type", "Property"},
    {"name", p.name},
    {"fullName", p.full_name()},
    {"kind", property_kind_name(p.kind)},
    {"value", value},
    {"location", j_location(p.location)},
    {"state", state_name(p.state)}};
  if (!p.prefix.empty()) out["prefix"] = p.prefix;
  if (p.resolved_property) {
    out["resolvedProperty"] = json{
      {"declaringType", p.resolved_property->declaring_type},
      {"propertyType", p.resolved_property->property_type},
      {"isAttached", p.resolved_property->is_attached}};
  }
  if (!p.comments.empty()) {
    json comments = json::array();
    for (const auto & c : p.comments) comments.push_back(j_comment(*c));
    out["comments"] = comments;
  }
  return out;
}

json j_element(const Element & e)
{
  json props = json::array();
  for (const auto & p : e.properties()) props.push_back(j_property(*p));
  json children = json::array();
  for (const auto & c : e.children()) children.push_back(j_element(*c));

  json out{
    {"type", "Element"},
    {"typeName", e.type_name},
    {"namespace", j_optional(e.xml_namespace)},
    {"properties", props},
    {"children", children},
    {"location", j_location(e.location)},
    {"state", state_name(e.state)}};

  if (!e.prefix.empty()) out["prefix"] = e.prefix;
  if (e.override_namespace) out["overrideNamespace"] = *e.override_namespace;
  if (e.synthetic_collection) out["syntheticCollection"] = true;
  if (e.text_content) out["text"] = *e.text_content;
  if (e.resolved_type) out["resolvedType"] = j_resolved_type(e.resolved_type);

  json directives = json::object();
  if (e.x_name) directives["Name"] = *e.x_name;
  if (e.x_key) directives["Key"] = *e.x_key;
  if (e.x_class) directives["Class"] = *e.x_class;
  if (e.x_field_modifier) directives["FieldModifier"] = *e.x_field_modifier;
  if (e.x_shared) directives["Shared"] = *e.x_shared;
  if (!directives.empty()) out["directives"] = directives;

  if (!e.namespace_declarations.empty()) {
    json decls = json::object();
    for (const auto & d : e.namespace_declarations) decls[d.prefix] = d.uri;
    out["namespaceDeclarations"] = decls;
  }
  if (!e.comments.empty()) {
    json comments = json::array();
    for (const auto & c : e.comments) comments.push_back(j_comment(*c));
    out["comments"] = comments;
  }
  return out;
}

}  // namespace

json to_json(const UnifiedNode * node)
{
  if (!node) return nullptr;
  if (const auto * e = dyn_cast<Element>(node)) return j_element(*e);
  if (const auto * p = dyn_cast<Property>(node)) return j_property(*p);
  if (const auto * m = dyn_cast<MarkupExtension>(node)) return j_extension(*m);
  return j_comment(*cast<Comment>(node));
}

json to_json(const Document & doc)
{
  json out{
    {"type", "Document"},
    {"filePath", doc.file_path},
    {"encoding", doc.encoding},
    {"hasDeclaration", doc.has_declaration()},
    {"hasBom", doc.has_bom},
    {"root", to_json(doc.root())}};

  json leading = json::array();
  for (const auto & c : doc.leading_comments) leading.push_back(j_comment(*c));
  json trailing = json::array();
  for (const auto & c : doc.trailing_comments) trailing.push_back(j_comment(*c));
  out["leadingComments"] = leading;
  out["trailingComments"] = trailing;

  if (doc.metadata.transformed_namespace) {
    out["transformedNamespace"] = *doc.metadata.transformed_namespace;
  }
  if (doc.metadata.companion_class) {
    out["companionClass"] = doc.metadata.companion_class->qualified_name;
  }

  json trace = json::array();
  for (const auto & r : doc.transformation_trace) {
    trace.push_back(json{
      {"rule", r.rule_name}, {"kind", r.node_kind}, {"description", r.description}, {"line", r.line}});
  }
  out["transformations"] = trace;
  return out;
}

json to_json(const DiagnosticBag & diags)
{
  json out = json::array();
  for (const auto & d : diags) {
    json entry{
      {"severity", std::string(to_string(d.severity))}, {"code", d.code}, {"message", d.message}};
    if (d.file_path) entry["file"] = *d.file_path;
    if (d.has_location()) {
      entry["line"] = d.line;
      entry["column"] = d.column;
    }
    out.push_back(entry);
  }
  return out;
}

}  // namespace xaml_bridge
