// xaml_bridge/mapping/mapping_repository.cpp - Source to target identifier mappings
//
#include "xaml_bridge/mapping/mapping_repository.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <nlohmann/json.hpp>
#include <stdexcept>

#include "xaml_bridge/basic/logging.hpp"

namespace xaml_bridge
{

namespace
{

using nlohmann::json;

template <typename Record, typename Key>
const Record * find_owner_first(
  const std::vector<Record> & records, std::string_view name,
  std::optional<std::string_view> owner, Key key)
{
  if (owner && !owner->empty()) {
    for (const auto & r : records) {
      if (key(r) == name && r.owner_type && *r.owner_type == *owner) return &r;
    }
  }
  for (const auto & r : records) {
    if (key(r) == name && !r.owner_type) return &r;
  }
  return nullptr;
}

bool iequals(std::string_view a, std::string_view b) noexcept
{
  return a.size() == b.size() && std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
           return std::tolower(static_cast<unsigned char>(x)) ==
                  std::tolower(static_cast<unsigned char>(y));
         });
}

/// Case-insensitive member lookup
const json * field(const json & obj, std::string_view key)
{
  for (auto it = obj.begin(); it != obj.end(); ++it) {
    if (iequals(it.key(), key)) return &*it;
  }
  return nullptr;
}

std::string required_string(const json & obj, std::string_view key)
{
  const json * v = field(obj, key);
  if (!v || !v->is_string()) {
    throw std::invalid_argument("missing string field '" + std::string(key) + "'");
  }
  return v->get<std::string>();
}

std::optional<std::string> optional_string(const json & obj, std::string_view key)
{
  const json * v = field(obj, key);
  if (!v || v->is_null()) return std::nullopt;
  return v->get<std::string>();
}

bool flag(const json & obj, std::string_view key)
{
  const json * v = field(obj, key);
  return v && v->is_boolean() && v->get<bool>();
}

const json * array_section(const json & root, std::string_view key)
{
  const json * v = field(root, key);
  if (!v || v->is_null()) return nullptr;
  if (!v->is_array()) throw std::invalid_argument("'" + std::string(key) + "' must be an array");
  return v;
}

void put_optional(json & j, const char * key, const std::optional<std::string> & value)
{
  if (value) j[key] = *value;
}

}  // namespace

// ============================================================================
// InMemoryMappingRepository
// ============================================================================

void InMemoryMappingRepository::merge(const MappingRepository & other)
{
  for (const auto & m : other.all_namespace_mappings()) add(m);
  for (const auto & m : other.all_type_mappings()) add(m);
  for (const auto & m : other.all_property_mappings()) add(m);
  for (const auto & m : other.all_event_mappings()) add(m);
}

void InMemoryMappingRepository::clear()
{
  namespaces_.clear();
  types_.clear();
  properties_.clear();
  events_.clear();
}

const NamespaceMapping * InMemoryMappingRepository::find_namespace_mapping(
  std::string_view source_namespace) const
{
  for (const auto & m : namespaces_) {
    if (m.source_namespace == source_namespace) return &m;
  }
  return nullptr;
}

const TypeMapping * InMemoryMappingRepository::find_type_mapping(std::string_view source_type) const
{
  for (const auto & m : types_) {
    if (m.source_type == source_type) return &m;
  }
  for (const auto & m : types_) {
    if (!m.simple_type_name.empty() && m.simple_type_name == source_type) return &m;
  }
  return nullptr;
}

const PropertyMapping * InMemoryMappingRepository::find_property_mapping(
  std::string_view source_property, std::optional<std::string_view> owner_type) const
{
  return find_owner_first(properties_, source_property, owner_type, [](const PropertyMapping & m) {
    return std::string_view(m.source_property);
  });
}

const EventMapping * InMemoryMappingRepository::find_event_mapping(
  std::string_view source_event, std::optional<std::string_view> owner_type) const
{
  return find_owner_first(events_, source_event, owner_type, [](const EventMapping & m) {
    return std::string_view(m.source_event);
  });
}

// ============================================================================
// JsonMappingRepository
// ============================================================================

MappingLoadResult JsonMappingRepository::load(const std::filesystem::path & path)
{
  if (!std::filesystem::exists(path)) {
    log_info("mapping database '{}' not found; starting empty", path.string());
    clear();
    return MappingLoadResult::ok(0, version_);
  }

  std::ifstream in(path);
  if (!in) return MappingLoadResult::fail("cannot open mapping database: " + path.string());

  json root;
  try {
    root = json::parse(in);
  } catch (const json::parse_error & e) {
    return MappingLoadResult::fail("failed to parse " + path.string() + ": " + e.what());
  }
  return load_from_json(root);
}

MappingLoadResult JsonMappingRepository::load_from_json(const json & root)
{
  if (!root.is_object()) return MappingLoadResult::fail("mapping database must be a JSON object");

  clear();
  size_t count = 0;
  try {
    if (auto v = optional_string(root, "version")) version_ = *v;

    if (const json * section = array_section(root, "namespaceMappings")) {
      for (const auto & e : *section) {
        NamespaceMapping m;
        m.source_namespace = required_string(e, "wpfNamespace");
        m.target_namespace = required_string(e, "avaloniaNamespace");
        m.notes = optional_string(e, "notes");
        m.requires_manual_review = flag(e, "requiresManualReview");
        add(std::move(m));
        ++count;
      }
    }

    if (const json * section = array_section(root, "typeMappings")) {
      for (const auto & e : *section) {
        TypeMapping m;
        m.source_type = required_string(e, "wpfTypeName");
        m.target_type = required_string(e, "avaloniaTypeName");
        m.source_namespace = optional_string(e, "wpfNamespace").value_or("");
        m.target_namespace = optional_string(e, "avaloniaNamespace").value_or("");
        m.simple_type_name = optional_string(e, "simpleTypeName").value_or("");
        m.type_name_changed = flag(e, "typeNameChanged");
        m.category = optional_string(e, "category");
        m.notes = optional_string(e, "notes");
        m.requires_manual_review = flag(e, "requiresManualReview");
        add(std::move(m));
        ++count;
      }
    }

    if (const json * section = array_section(root, "propertyMappings")) {
      for (const auto & e : *section) {
        PropertyMapping m;
        m.source_property = required_string(e, "wpfPropertyName");
        m.target_property = required_string(e, "avaloniaPropertyName");
        m.owner_type = optional_string(e, "ownerTypeName");
        m.source_property_type = optional_string(e, "wpfPropertyType");
        m.target_property_type = optional_string(e, "avaloniaPropertyType");
        m.type_changed = flag(e, "typeChanged");
        m.is_attached = flag(e, "isAttachedProperty");
        m.value_conversion_rule = optional_string(e, "valueConversionRule");
        m.notes = optional_string(e, "notes");
        m.requires_manual_review = flag(e, "requiresManualReview");
        add(std::move(m));
        ++count;
      }
    }

    if (const json * section = array_section(root, "eventMappings")) {
      for (const auto & e : *section) {
        EventMapping m;
        m.source_event = required_string(e, "wpfEventName");
        m.target_event = required_string(e, "avaloniaEventName");
        m.owner_type = optional_string(e, "ownerTypeName");
        m.is_routed_event = flag(e, "isRoutedEvent");
        m.routing_strategy = optional_string(e, "routingStrategy");
        m.notes = optional_string(e, "notes");
        m.requires_manual_review = flag(e, "requiresManualReview");
        add(std::move(m));
        ++count;
      }
    }
  } catch (const std::exception & e) {
    clear();
    return MappingLoadResult::fail(std::string("invalid mapping database: ") + e.what());
  }

  log_debug("loaded {} mapping records (version {})", count, version_);
  return MappingLoadResult::ok(count, version_);
}

json JsonMappingRepository::to_json() const
{
  json root;
  root["version"] = version_;

  json namespaces = json::array();
  for (const auto & m : all_namespace_mappings()) {
    json j{{"wpfNamespace", m.source_namespace}, {"avaloniaNamespace", m.target_namespace}};
    put_optional(j, "notes", m.notes);
    j["requiresManualReview"] = m.requires_manual_review;
    namespaces.push_back(std::move(j));
  }
  root["namespaceMappings"] = std::move(namespaces);

  json types = json::array();
  for (const auto & m : all_type_mappings()) {
    json j{
      {"wpfTypeName", m.source_type},
      {"avaloniaTypeName", m.target_type},
      {"wpfNamespace", m.source_namespace},
      {"avaloniaNamespace", m.target_namespace},
      {"simpleTypeName", m.simple_type_name},
      {"typeNameChanged", m.type_name_changed}};
    put_optional(j, "category", m.category);
    put_optional(j, "notes", m.notes);
    j["requiresManualReview"] = m.requires_manual_review;
    types.push_back(std::move(j));
  }
  root["typeMappings"] = std::move(types);

  json properties = json::array();
  for (const auto & m : all_property_mappings()) {
    json j{
      {"wpfPropertyName", m.source_property},
      {"avaloniaPropertyName", m.target_property},
      {"typeChanged", m.type_changed},
      {"isAttachedProperty", m.is_attached}};
    put_optional(j, "ownerTypeName", m.owner_type);
    put_optional(j, "wpfPropertyType", m.source_property_type);
    put_optional(j, "avaloniaPropertyType", m.target_property_type);
    put_optional(j, "valueConversionRule", m.value_conversion_rule);
    put_optional(j, "notes", m.notes);
    j["requiresManualReview"] = m.requires_manual_review;
    properties.push_back(std::move(j));
  }
  root["propertyMappings"] = std::move(properties);

  json events = json::array();
  for (const auto & m : all_event_mappings()) {
    json j{
      {"wpfEventName", m.source_event},
      {"avaloniaEventName", m.target_event},
      {"isRoutedEvent", m.is_routed_event}};
    put_optional(j, "ownerTypeName", m.owner_type);
    put_optional(j, "routingStrategy", m.routing_strategy);
    put_optional(j, "notes", m.notes);
    j["requiresManualReview"] = m.requires_manual_review;
    events.push_back(std::move(j));
  }
  root["eventMappings"] = std::move(events);

  return root;
}

}  // namespace xaml_bridge
