// xaml_bridge/mapping/mapping_repository.hpp - Source to target identifier mappings
//
// Read-only lookup service consumed by the transformation rules. Repositories
// are filled once and never written during transformation, so concurrent
// readers need no locking.
//
#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json_fwd.hpp>

namespace xaml_bridge
{

// ============================================================================
// Mapping records
// ============================================================================

struct NamespaceMapping
{
  std::string source_namespace;
  std::string target_namespace;
  std::optional<std::string> notes;
  bool requires_manual_review = false;
};

struct TypeMapping
{
  /// Source type as written or CLR-qualified ("Button", "System.Windows.Controls.Button")
  std::string source_type;
  std::string target_type;
  std::string source_namespace;
  std::string target_namespace;

  /// Unqualified source name, matched when the qualified name is not
  std::string simple_type_name;

  bool type_name_changed = false;
  std::optional<std::string> category;
  std::optional<std::string> notes;
  bool requires_manual_review = false;
};

struct PropertyMapping
{
  std::string source_property;
  std::string target_property;

  /// Owner type for owner-specific mappings, unset for general ones
  std::optional<std::string> owner_type;

  std::optional<std::string> source_property_type;
  std::optional<std::string> target_property_type;
  bool type_changed = false;
  bool is_attached = false;

  /// Tag of a registered value converter (see ValueConverterRegistry)
  std::optional<std::string> value_conversion_rule;

  std::optional<std::string> notes;
  bool requires_manual_review = false;
};

struct EventMapping
{
  std::string source_event;
  std::string target_event;
  std::optional<std::string> owner_type;
  bool is_routed_event = false;
  std::optional<std::string> routing_strategy;
  std::optional<std::string> notes;
  bool requires_manual_review = false;
};

// ============================================================================
// MappingRepository
// ============================================================================

class MappingRepository
{
public:
  virtual ~MappingRepository() = default;

  [[nodiscard]] virtual const NamespaceMapping * find_namespace_mapping(
    std::string_view source_namespace) const = 0;

  [[nodiscard]] virtual const TypeMapping * find_type_mapping(
    std::string_view source_type) const = 0;

  /// Owner-specific mapping first, then the general mapping (no owner)
  [[nodiscard]] virtual const PropertyMapping * find_property_mapping(
    std::string_view source_property, std::optional<std::string_view> owner_type = {}) const = 0;

  /// Same owner-first policy as find_property_mapping()
  [[nodiscard]] virtual const EventMapping * find_event_mapping(
    std::string_view source_event, std::optional<std::string_view> owner_type = {}) const = 0;

  [[nodiscard]] virtual const std::vector<NamespaceMapping> & all_namespace_mappings() const = 0;
  [[nodiscard]] virtual const std::vector<TypeMapping> & all_type_mappings() const = 0;
  [[nodiscard]] virtual const std::vector<PropertyMapping> & all_property_mappings() const = 0;
  [[nodiscard]] virtual const std::vector<EventMapping> & all_event_mappings() const = 0;
};

/**
 * Vector-backed repository filled through the add_* calls.
 *
 * Lookups scan in insertion order, so the first matching record wins.
 */
class InMemoryMappingRepository : public MappingRepository
{
public:
  void add(NamespaceMapping mapping) { namespaces_.push_back(std::move(mapping)); }
  void add(TypeMapping mapping) { types_.push_back(std::move(mapping)); }
  void add(PropertyMapping mapping) { properties_.push_back(std::move(mapping)); }
  void add(EventMapping mapping) { events_.push_back(std::move(mapping)); }

  /// Append every record of `other`
  void merge(const MappingRepository & other);

  [[nodiscard]] const NamespaceMapping * find_namespace_mapping(
    std::string_view source_namespace) const override;
  [[nodiscard]] const TypeMapping * find_type_mapping(std::string_view source_type) const override;
  [[nodiscard]] const PropertyMapping * find_property_mapping(
    std::string_view source_property, std::optional<std::string_view> owner_type = {}) const override;
  [[nodiscard]] const EventMapping * find_event_mapping(
    std::string_view source_event, std::optional<std::string_view> owner_type = {}) const override;

  [[nodiscard]] const std::vector<NamespaceMapping> & all_namespace_mappings() const override
  {
    return namespaces_;
  }
  [[nodiscard]] const std::vector<TypeMapping> & all_type_mappings() const override
  {
    return types_;
  }
  [[nodiscard]] const std::vector<PropertyMapping> & all_property_mappings() const override
  {
    return properties_;
  }
  [[nodiscard]] const std::vector<EventMapping> & all_event_mappings() const override
  {
    return events_;
  }

  [[nodiscard]] bool empty() const noexcept
  {
    return namespaces_.empty() && types_.empty() && properties_.empty() && events_.empty();
  }

protected:
  void clear();

private:
  std::vector<NamespaceMapping> namespaces_;
  std::vector<TypeMapping> types_;
  std::vector<PropertyMapping> properties_;
  std::vector<EventMapping> events_;
};

/// WPF to Avalonia mappings every conversion starts from
void register_default_mappings(InMemoryMappingRepository & repository);

/**
 * Mapping database loading result.
 */
struct MappingLoadResult
{
  size_t records_loaded = 0;
  std::string version;
  bool success = false;
  std::string error;

  static MappingLoadResult ok(size_t count, std::string db_version)
  {
    MappingLoadResult r;
    r.records_loaded = count;
    r.version = std::move(db_version);
    r.success = true;
    return r;
  }

  static MappingLoadResult fail(std::string msg)
  {
    MappingLoadResult r;
    r.error = std::move(msg);
    return r;
  }
};

/**
 * Repository loaded from a JSON mapping database:
 *
 * @code
 *   { "version": "1.0.0",
 *     "namespaceMappings": [{"wpfNamespace", "avaloniaNamespace", "notes", "requiresManualReview"}],
 *     "typeMappings": [{"wpfTypeName", "avaloniaTypeName", "wpfNamespace", "avaloniaNamespace",
 *                       "simpleTypeName", "typeNameChanged", "category", ...}],
 *     "propertyMappings": [{"wpfPropertyName", "avaloniaPropertyName", "ownerTypeName",
 *                           "typeChanged", "isAttachedProperty", "valueConversionRule", ...}],
 *     "eventMappings": [{"wpfEventName", "avaloniaEventName", "ownerTypeName",
 *                        "isRoutedEvent", "routingStrategy", ...}] }
 * @endcode
 *
 * Keys are matched case-insensitively. A missing file loads as an empty
 * database.
 */
class JsonMappingRepository : public InMemoryMappingRepository
{
public:
  [[nodiscard]] MappingLoadResult load(const std::filesystem::path & path);
  [[nodiscard]] MappingLoadResult load_from_json(const nlohmann::json & root);

  /// Write the current records back in the same format
  [[nodiscard]] nlohmann::json to_json() const;

  [[nodiscard]] const std::string & version() const noexcept { return version_; }

private:
  std::string version_ = "1.0.0";
};

}  // namespace xaml_bridge
