// xaml_bridge/transform/rules.cpp - Built-in transformation rules
//
#include "xaml_bridge/transform/rules.hpp"

#include <utility>

#include <fmt/format.h>

#include "xaml_bridge/basic/diagnostic_codes.hpp"
#include "xaml_bridge/transform/transformation_context.hpp"

namespace xaml_bridge
{

namespace
{

/// Type name the element had in the source, before any rename
std::string_view source_type_name(const Element & elem)
{
  return elem.hints.original_name ? std::string_view(*elem.hints.original_name)
                                  : std::string_view(elem.type_name);
}

void rename_element(Element & elem, std::string target)
{
  if (!elem.hints.original_name) elem.hints.original_name = elem.type_name;
  elem.type_name = std::move(target);
  elem.state = TransformationState::Transformed;
}

/// Nearest node (self included) that carries a source position
const UnifiedNode & located(const UnifiedNode & node)
{
  const UnifiedNode * cur = &node;
  while (!cur->location.is_valid() && cur->parent()) cur = cur->parent();
  return cur->location.is_valid() ? *cur : node;
}

/// Target name as written in markup (last segment of a qualified target type)
std::string markup_type_name(const TypeMapping & mapping)
{
  const std::string & target = mapping.target_type;
  const auto dot = target.rfind('.');
  return dot == std::string::npos ? target : target.substr(dot + 1);
}

/// Owner type used for mapping lookups
std::optional<std::string> property_owner_type(const Property & prop)
{
  if (prop.attached_owner_type) return *prop.attached_owner_type;
  if (const Element * owner = prop.owner_element()) return std::string(source_type_name(*owner));
  return std::nullopt;
}

}  // namespace

// ============================================================================
// SimpleTypeRenameRule
// ============================================================================

SimpleTypeRenameRule::SimpleTypeRenameRule(
  std::string source_type, std::string target_type, std::optional<std::string> source_namespace,
  std::optional<std::string> target_namespace, int priority)
: source_type_(std::move(source_type)),
  target_type_(std::move(target_type)),
  source_namespace_(std::move(source_namespace)),
  target_namespace_(std::move(target_namespace)),
  priority_(priority),
  name_(fmt::format("TypeRename({}->{})", source_type_, target_type_))
{
}

bool SimpleTypeRenameRule::can_apply(const Element & elem) const
{
  if (elem.synthetic_collection || elem.type_name != source_type_) return false;
  return !source_namespace_ || elem.effective_namespace() == source_namespace_;
}

std::unique_ptr<Element> SimpleTypeRenameRule::apply(
  std::unique_ptr<Element> elem, TransformationContext & ctx)
{
  rename_element(*elem, target_type_);
  if (target_namespace_ && elem->xml_namespace != target_namespace_) {
    elem->override_namespace = target_namespace_;
  }
  rewrite_properties(*elem, ctx);
  ctx.record_transformation(
    name_, "Element", fmt::format("Renamed {} to {}", source_type_, target_type_), elem.get());
  return elem;
}

// ============================================================================
// PropertyRenameRule
// ============================================================================

PropertyRenameRule::PropertyRenameRule(
  std::string source_property, std::string target_property,
  std::optional<std::string> element_scope, int priority)
: source_property_(std::move(source_property)),
  target_property_(std::move(target_property)),
  element_scope_(std::move(element_scope)),
  priority_(priority),
  name_(fmt::format("PropertyRename({}->{})", source_property_, target_property_))
{
}

bool PropertyRenameRule::can_apply(const Property & prop) const
{
  if (prop.name != source_property_) return false;
  if (!element_scope_) return true;
  const Element * owner = prop.owner_element();
  return owner && (owner->type_name == *element_scope_ || source_type_name(*owner) == *element_scope_);
}

std::unique_ptr<Property> PropertyRenameRule::apply(
  std::unique_ptr<Property> prop, TransformationContext & ctx)
{
  prop->name = target_property_;
  if (const std::string * value = prop->literal()) {
    std::string converted = convert_value(*value);
    if (converted != *value) prop->set_value(std::move(converted));
  }
  prop->state = TransformationState::Transformed;
  ctx.record_transformation(
    name_, "Property", fmt::format("Renamed {} to {}", source_property_, target_property_),
    prop.get());
  return prop;
}

// ============================================================================
// MappedElementRule
// ============================================================================

bool MappedElementRule::can_apply(const Element & elem) const
{
  if (elem.synthetic_collection) return false;
  return elem.xml_namespace != std::optional<std::string>(k_xaml_language_namespace);
}

std::unique_ptr<Element> MappedElementRule::apply(
  std::unique_ptr<Element> elem, TransformationContext & ctx)
{
  const MappingRepository & repo = ctx.mappings();
  const TypeMapping * mapping = repo.find_type_mapping(elem->full_type_name());
  if (!mapping) mapping = repo.find_type_mapping(elem->type_name);

  if (!mapping) {
    if (ctx.options().report_unmapped_types) {
      ctx.info(
        codes::k_type_mapping_not_found,
        fmt::format("No type mapping found for '{}'", elem->type_name), *elem);
    }
    elem->state = TransformationState::Skipped;
    return elem;
  }

  if (mapping->requires_manual_review) {
    ctx.warning(
      codes::k_type_requires_review,
      fmt::format(
        "Type '{}' requires manual review{}", elem->type_name,
        mapping->notes ? ": " + *mapping->notes : std::string()),
      *elem);
    elem->state = TransformationState::RequiresManualReview;
  }

  std::string target_name = markup_type_name(*mapping);

  if (target_name != elem->type_name) {
    const std::string from = elem->type_name;
    const bool review = elem->state == TransformationState::RequiresManualReview;
    rename_element(*elem, target_name);
    if (review) elem->state = TransformationState::RequiresManualReview;
    ctx.record_transformation(
      name(), "Element", fmt::format("Renamed {} to {}", from, target_name), elem.get());
  } else if (elem->state != TransformationState::RequiresManualReview) {
    elem->state = TransformationState::Transformed;
  }
  return elem;
}

// ============================================================================
// MappedPropertyRule
// ============================================================================

bool MappedPropertyRule::can_apply(const Property & prop) const
{
  return prop.prefix.empty() || prop.attached_owner_type.has_value();
}

std::unique_ptr<Property> MappedPropertyRule::apply(
  std::unique_ptr<Property> prop, TransformationContext & ctx)
{
  const MappingRepository & repo = ctx.mappings();
  const std::optional<std::string> owner = property_owner_type(*prop);
  const std::optional<std::string_view> owner_view =
    owner ? std::optional<std::string_view>(*owner) : std::nullopt;

  // Attached owners follow their type mapping (DockPanel.Dock keeps DockPanel)
  if (prop->attached_owner_type) {
    if (const TypeMapping * owner_mapping = repo.find_type_mapping(*prop->attached_owner_type)) {
      std::string simple = markup_type_name(*owner_mapping);
      if (simple != *prop->attached_owner_type) {
        ctx.record_transformation(
          name(), "Property",
          fmt::format(
            "Renamed attached owner of {} from {} to {}", prop->name, *prop->attached_owner_type,
            simple),
          prop.get());
        prop->attached_owner_type = std::move(simple);
        prop->state = TransformationState::Transformed;
      }
    }
  }

  const PropertyMapping * mapping = repo.find_property_mapping(prop->name, owner_view);
  if (!mapping) {
    if (const EventMapping * event = repo.find_event_mapping(prop->name, owner_view)) {
      if (event->requires_manual_review) {
        ctx.warning(
          codes::k_event_requires_review,
          fmt::format(
            "Event '{}' requires manual review{}", prop->name,
            event->notes ? ": " + *event->notes : std::string()),
          *prop);
      }
      if (event->target_event != prop->name) {
        ctx.record_transformation(
          name(), "Event", fmt::format("Renamed {} to {}", prop->name, event->target_event),
          prop.get());
        prop->name = event->target_event;
        prop->state = TransformationState::Transformed;
      }
      return prop;
    }
    if (ctx.options().report_unmapped_properties) {
      ctx.info(
        codes::k_property_mapping_not_found,
        fmt::format("No property mapping found for '{}'", prop->full_name()), *prop);
    }
    return prop;
  }

  if (mapping->requires_manual_review) {
    ctx.warning(
      codes::k_property_requires_review,
      fmt::format(
        "Property '{}' requires manual review{}", prop->name,
        mapping->notes ? ": " + *mapping->notes : std::string()),
      *prop);
    prop->state = TransformationState::RequiresManualReview;
  }

  if (mapping->target_property != prop->name) {
    ctx.record_transformation(
      name(), "Property",
      fmt::format("Renamed {} to {}", prop->name, mapping->target_property), prop.get());
    prop->name = mapping->target_property;
    if (prop->state != TransformationState::RequiresManualReview) {
      prop->state = TransformationState::Transformed;
    }
  }

  if (mapping->value_conversion_rule) {
    const std::string & tag = *mapping->value_conversion_rule;
    if (const std::string * value = prop->literal()) {
      auto converted = ctx.converters().convert(tag, *value);
      if (!converted) {
        ctx.warning(
          codes::k_value_conversion_unknown,
          fmt::format("Unknown value conversion rule '{}' for '{}'", tag, prop->name), *prop);
      } else {
        if (converted->value != *value) {
          ctx.record_transformation(
            name(), "Property",
            fmt::format("Converted {} value '{}' to '{}'", prop->name, *value, converted->value),
            prop.get());
          prop->set_value(std::move(converted->value));
        }
        if (converted->warning) {
          ctx.warning(codes::k_value_conversion_review, *converted->warning, *prop);
        }
      }
    } else if (prop->has_value()) {
      ctx.warning(
        codes::k_value_conversion_review,
        fmt::format(
          "Value of '{}' is not a literal; conversion '{}' must be applied manually", prop->name,
          tag),
        *prop);
    }
  } else if (mapping->type_changed) {
    ctx.warning(
      codes::k_property_type_changed,
      fmt::format(
        "Property '{}' changes type from {} to {}", prop->name,
        mapping->source_property_type.value_or("?"), mapping->target_property_type.value_or("?")),
      *prop);
  }
  return prop;
}

// ============================================================================
// NamespaceRewriteRule
// ============================================================================

bool NamespaceRewriteRule::can_apply(const Element & elem) const
{
  return !elem.namespace_declarations.empty();
}

std::unique_ptr<Element> NamespaceRewriteRule::apply(
  std::unique_ptr<Element> elem, TransformationContext & ctx)
{
  const bool is_root = elem->parent() == nullptr;

  for (auto & decl : elem->namespace_declarations) {
    const NamespaceMapping * mapping = ctx.mappings().find_namespace_mapping(decl.uri);
    if (!mapping) continue;

    if (mapping->requires_manual_review) {
      ctx.warning(
        codes::k_namespace_requires_review,
        fmt::format(
          "Namespace '{}' requires manual review{}", decl.uri,
          mapping->notes ? ": " + *mapping->notes : std::string()),
        *elem);
    }
    if (mapping->target_namespace == decl.uri) continue;

    const std::string from = decl.uri;
    decl.uri = mapping->target_namespace;
    decl.original_text.reset();

    for (Element * e : elem->descendants_and_self()) {
      if (e->xml_namespace == from) e->xml_namespace = mapping->target_namespace;
    }
    if (is_root && decl.prefix.empty()) {
      ctx.document().metadata.transformed_namespace = mapping->target_namespace;
    }
    ctx.record_transformation(
      name(), "Namespace",
      fmt::format("Rewrote {} from {} to {}", decl.attribute_name(), from, decl.uri), elem.get());
  }
  return elem;
}

// ============================================================================
// UnsupportedBindingParameterRule
// ============================================================================

UnsupportedBindingParameterRule::UnsupportedBindingParameterRule()
: removed_{"UpdateSourceTrigger",   "IsAsync",  "AsyncState",
           "NotifyOnSourceUpdated", "NotifyOnTargetUpdated", "BindsDirectlyToSource",
           "XPath",                 "UpdateSourceExceptionFilter"},
  validation_flags_{"NotifyOnValidationError", "ValidatesOnDataErrors", "ValidatesOnExceptions",
                    "ValidatesOnNotifyDataErrors"}
{
}

bool UnsupportedBindingParameterRule::can_apply(const MarkupExtension & ext) const
{
  if (ext.local_name() != "Binding") return false;
  for (const auto & arg : ext.parameters) {
    if (removed_.count(arg.name) || validation_flags_.count(arg.name)) return true;
  }
  return false;
}

std::unique_ptr<MarkupExtension> UnsupportedBindingParameterRule::apply(
  std::unique_ptr<MarkupExtension> ext, TransformationContext & ctx)
{
  bool enable_validation = false;
  std::vector<std::string> dropped;
  for (const auto & arg : ext->parameters) {
    if (validation_flags_.count(arg.name)) {
      const std::string * literal = arg.literal();
      if (literal && (*literal == "True" || *literal == "true")) enable_validation = true;
      dropped.push_back(arg.name);
    } else if (removed_.count(arg.name)) {
      dropped.push_back(arg.name);
    }
  }

  const UnifiedNode & where = located(*ext);
  for (const auto & key : dropped) {
    ext->remove_parameter(key);
    if (!validation_flags_.count(key)) {
      ctx.warning(
        codes::k_binding_parameter_unsupported,
        fmt::format("Binding parameter '{}' is not supported and was removed", key), where);
    }
    ctx.record_transformation(
      name(), "Binding", fmt::format("Removed {} parameter", key), &where);
  }
  if (enable_validation && !ext->find_parameter("EnableDataValidation")) {
    ext->set_parameter("EnableDataValidation", "True");
    ctx.record_transformation(
      name(), "Binding", "Replaced validation flags with EnableDataValidation", &where);
  }
  ext->state = TransformationState::Transformed;
  return ext;
}

// ============================================================================
// Default rule set
// ============================================================================

std::vector<std::unique_ptr<TransformationRule>> default_rule_set()
{
  std::vector<std::unique_ptr<TransformationRule>> rules;
  rules.push_back(std::make_unique<MappedElementRule>());
  rules.push_back(std::make_unique<MappedPropertyRule>());
  rules.push_back(std::make_unique<UnsupportedBindingParameterRule>());
  return rules;
}

}  // namespace xaml_bridge
