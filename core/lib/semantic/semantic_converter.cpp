// xaml_bridge/semantic/semantic_converter.cpp - Object graph to Unified AST bridge
//
#include "xaml_bridge/semantic/semantic_converter.hpp"

#include <fmt/format.h>

#include <algorithm>

#include "xaml_bridge/basic/diagnostic_codes.hpp"
#include "xaml_bridge/basic/logging.hpp"

namespace xaml_bridge
{

namespace
{

const ObjectNode * object_of(const ObjectValue & value) noexcept
{
  const auto * p = std::get_if<std::unique_ptr<ObjectNode>>(&value);
  return p ? p->get() : nullptr;
}

void report_mismatch(
  DiagnosticBag & diags, const Element & element, const std::string & file_path,
  const std::string & detail)
{
  auto builder = diags.report_warning(
    codes::k_semantic_child_mismatch,
    fmt::format(
      "Semantic view of <{}> disagrees with the markup ({}); subtree left unenriched",
      element.type_name, detail));
  builder.at(element.location.line, element.location.column);
  if (!file_path.empty()) builder.with_file(file_path);
}

}  // namespace

// ============================================================================
// Fresh conversion
// ============================================================================

std::unique_ptr<Document> SemanticConverter::convert(const ObjectNode & root) const
{
  auto doc = std::make_unique<Document>();
  doc->set_root(convert_object(root));
  doc->refresh_symbols();
  return doc;
}

std::unique_ptr<Element> SemanticConverter::convert_object(const ObjectNode & node) const
{
  auto elem = std::make_unique<Element>(
    node.type_name,
    node.xml_namespace.empty() ? std::nullopt : std::optional<std::string>(node.xml_namespace));
  elem->prefix = node.prefix;
  elem->resolved_type = node.resolved;
  elem->location.line = node.line;
  if (node.resolved) elem->state = TransformationState::Analyzed;

  for (const auto & member : node.members) elem->add_property(convert_member(member, node));
  for (const auto & child : node.children) elem->add_child(convert_object(*child));
  return elem;
}

std::unique_ptr<MarkupExtension> SemanticConverter::convert_extension(const ObjectNode & node) const
{
  auto ext = std::make_unique<MarkupExtension>(node.extension_name());
  ext->resolved_type = node.resolved;
  ext->location.line = node.line;
  if (node.positional) ext->set_positional(*node.positional);
  for (const auto & member : node.members) {
    if (member.values.empty()) continue;
    if (const auto * obj = object_of(member.values.front())) {
      ext->set_parameter(member.name, convert_extension(*obj));
    } else {
      ext->set_parameter(member.name, std::get<std::string>(member.values.front()));
    }
  }
  ext->refresh_payload();
  return ext;
}

std::unique_ptr<Property> SemanticConverter::convert_member(
  const PropertyValueNode & member, const ObjectNode & owner) const
{
  auto prop = std::make_unique<Property>();
  prop->name = member.name;
  prop->resolved_property = member.resolved;
  prop->location.line = member.line;
  if (member.is_property_element) {
    prop->kind = PropertyKind::PropertyElement;
    if (member.owner_type && *member.owner_type != owner.type_name) {
      prop->attached_owner_type = member.owner_type;
    }
  } else if (member.owner_type) {
    prop->kind = PropertyKind::AttachedProperty;
    prop->attached_owner_type = member.owner_type;
  }

  if (member.values.size() == 1) {
    if (const auto * obj = object_of(member.values.front())) {
      if (obj->is_markup_extension()) {
        prop->set_value(convert_extension(*obj));
      } else {
        prop->set_value(convert_object(*obj));
      }
    } else {
      prop->set_value(std::get<std::string>(member.values.front()));
    }
  } else if (member.values.size() > 1) {
    auto collection = std::make_unique<Element>(
      member.full_name(),
      owner.xml_namespace.empty() ? std::nullopt : std::optional<std::string>(owner.xml_namespace));
    collection->synthetic_collection = true;
    for (const auto & value : member.values) {
      if (const auto * obj = object_of(value)) collection->add_child(convert_object(*obj));
    }
    prop->set_value(std::move(collection));
  }
  return prop;
}

// ============================================================================
// Enrichment
// ============================================================================

size_t SemanticConverter::enrich(
  const ObjectNode & root, Document & document, DiagnosticBag & diags) const
{
  if (!document.root()) return 0;
  const size_t enriched = enrich_element(root, *document.root(), document.file_path, diags);
  log_debug("semantic enrichment: {} elements enriched", enriched);
  return enriched;
}

size_t SemanticConverter::enrich_element(
  const ObjectNode & node, Element & element, const std::string & file_path,
  DiagnosticBag & diags) const
{
  if (node.type_name != element.type_name) {
    report_mismatch(
      diags, element, file_path, fmt::format("semantic type '{}'", node.type_name));
    return 0;
  }
  if (node.children.size() != element.children().size()) {
    report_mismatch(
      diags, element, file_path,
      fmt::format("{} semantic children vs {} in markup", node.children.size(),
                  element.children().size()));
    return 0;
  }

  size_t enriched = 1;
  element.resolved_type = node.resolved;
  if (node.resolved) element.state = TransformationState::Analyzed;

  for (size_t slot = 0; slot < node.members.size(); ++slot) {
    const auto & member = node.members[slot];
    // Property elements of the owner's own type report `Owner.Name` as well
    const std::string name = member.full_name();
    Property * prop = element.find_property_by_full_name(name);
    if (!prop) {
      element.insert_property(
        std::min(slot, element.properties().size()), convert_member(member, node));
      log_debug("enrichment created property '{}' on <{}>", name, element.type_name);
      continue;
    }
    enrich_property(member, *prop, file_path, diags, enriched);
  }

  for (size_t i = 0; i < node.children.size(); ++i) {
    enriched += enrich_element(*node.children[i], *element.children()[i], file_path, diags);
  }
  return enriched;
}

void SemanticConverter::enrich_property(
  const PropertyValueNode & member, Property & property, const std::string & file_path,
  DiagnosticBag & diags, size_t & enriched) const
{
  property.resolved_property = member.resolved;
  if (member.resolved) property.state = TransformationState::Analyzed;
  if (member.values.empty()) return;

  Element * value_element = property.element();
  if (member.values.size() == 1) {
    const ObjectNode * obj = object_of(member.values.front());
    if (!obj) return;
    if (obj->is_markup_extension()) {
      if (auto * ext = property.markup_extension()) augment_extension(*obj, *ext);
      return;
    }
    if (value_element && !value_element->synthetic_collection) {
      enriched += enrich_element(*obj, *value_element, file_path, diags);
    }
    return;
  }

  if (!value_element || !value_element->synthetic_collection) return;
  if (value_element->children().size() != member.values.size()) {
    report_mismatch(
      diags, *value_element, file_path,
      fmt::format("{} semantic values vs {} in markup", member.values.size(),
                  value_element->children().size()));
    return;
  }
  for (size_t i = 0; i < member.values.size(); ++i) {
    if (const auto * obj = object_of(member.values[i])) {
      enriched += enrich_element(*obj, *value_element->children()[i], file_path, diags);
    }
  }
}

void SemanticConverter::augment_extension(const ObjectNode & node, MarkupExtension & extension) const
{
  extension.resolved_type = node.resolved;
  extension.state = TransformationState::Analyzed;

  // The positional argument, when the catalog names it, is the first member
  bool positional_pending = extension.positional.has_value();
  for (const auto & member : node.members) {
    if (member.values.empty()) continue;
    MarkupExtensionArgument * arg = extension.find_parameter(member.name);
    if (!arg && positional_pending) {
      arg = &*extension.positional;
      positional_pending = false;
    }
    const ObjectNode * obj = object_of(member.values.front());
    if (arg) {
      if (obj && arg->nested()) augment_extension(*obj, *arg->nested());
      continue;
    }
    if (obj) {
      extension.set_parameter(member.name, convert_extension(*obj));
    } else {
      extension.set_parameter(member.name, std::get<std::string>(member.values.front()));
    }
  }
}

}  // namespace xaml_bridge
