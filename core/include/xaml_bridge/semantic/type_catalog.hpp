// xaml_bridge/semantic/type_catalog.hpp - Known markup types for the semantic layer
//
// The catalog resolves only what mapping-driven rewriting needs: type
// identity, base type chain, content property, markup-extension positional
// parameters and property owners. It is not a full type system.
//
#pragma once

#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json_fwd.hpp>

#include "xaml_bridge/ast/unified_ast.hpp"

namespace xaml_bridge
{

struct PropertyDescriptor
{
  std::string name;
  std::string type;
  bool is_attached = false;
};

struct TypeDescriptor
{
  std::string name;
  std::string xml_namespace;
  std::string clr_namespace;
  std::optional<std::string> base_type;
  std::optional<std::string> content_property;
  bool is_markup_extension = false;

  /// Parameter that receives the positional argument of a markup extension
  std::optional<std::string> positional_parameter;

  std::vector<PropertyDescriptor> properties;

  [[nodiscard]] std::string clr_name() const
  {
    return clr_namespace.empty() ? name : clr_namespace + "." + name;
  }
};

/**
 * Result of loading catalog entries from JSON.
 */
struct CatalogLoadResult
{
  size_t types_loaded = 0;
  bool success = false;
  std::string error;

  static CatalogLoadResult ok(size_t count)
  {
    CatalogLoadResult r;
    r.types_loaded = count;
    r.success = true;
    return r;
  }

  static CatalogLoadResult fail(std::string msg)
  {
    CatalogLoadResult r;
    r.error = std::move(msg);
    return r;
  }
};

class TypeCatalog
{
public:
  void register_type(TypeDescriptor type);

  /// Common WPF presentation types and XAML language markup extensions
  void register_builtins();

  /**
   * Add types from a JSON file:
   * `{"types": [{"name", "xmlNamespace", "clrNamespace", "baseType",
   *   "contentProperty", "isMarkupExtension", "positionalParameter",
   *   "properties": [{"name", "type", "isAttached"}]}]}`
   */
  [[nodiscard]] CatalogLoadResult load_json(const std::filesystem::path & path);
  [[nodiscard]] CatalogLoadResult merge_json(const nlohmann::json & root);

  [[nodiscard]] const TypeDescriptor * find_type(
    std::string_view xml_namespace, std::string_view name) const;

  /// First type with this name in any namespace
  [[nodiscard]] const TypeDescriptor * find_type(std::string_view name) const;

  /// Extension type for `{Name}`: tries `NameExtension`, then `Name`
  [[nodiscard]] const TypeDescriptor * find_markup_extension(
    std::string_view xml_namespace, std::string_view name) const;

  /// Property lookup walking the base type chain
  [[nodiscard]] std::optional<ResolvedProperty> resolve_property(
    const TypeDescriptor & type, std::string_view property_name) const;

  /// Content property, inherited from base types when not declared
  [[nodiscard]] std::optional<std::string> content_property(const TypeDescriptor & type) const;

  [[nodiscard]] ResolvedType to_resolved(const TypeDescriptor & type) const;

  [[nodiscard]] size_t size() const noexcept { return types_.size(); }

private:
  [[nodiscard]] const TypeDescriptor * base_of(const TypeDescriptor & type) const;

  /// Keyed by (xml namespace, name)
  std::map<std::pair<std::string, std::string>, TypeDescriptor> types_;
};

}  // namespace xaml_bridge
