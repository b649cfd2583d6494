// xaml_bridge/semantic/semantic_parser.hpp - Type-resolving parse into an object graph
#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "xaml_bridge/ast/unified_ast.hpp"
#include "xaml_bridge/basic/diagnostic.hpp"
#include "xaml_bridge/semantic/type_catalog.hpp"

namespace xaml_bridge
{

class SemanticParseError : public std::runtime_error
{
public:
  SemanticParseError(const std::string & message, uint32_t line)
  : std::runtime_error(message), line_(line)
  {
  }

  [[nodiscard]] uint32_t line() const noexcept { return line_; }

private:
  uint32_t line_;
};

struct ObjectNode;

using ObjectValue = std::variant<std::string, std::unique_ptr<ObjectNode>>;

/// One member assignment of an object (attribute or property element)
struct PropertyValueNode
{
  std::string name;
  std::optional<std::string> owner_type;
  bool is_property_element = false;
  std::optional<ResolvedProperty> resolved;
  std::vector<ObjectValue> values;
  uint32_t line = 0;

  /// `Owner.Name` when an owner is present, `Name` otherwise
  [[nodiscard]] std::string full_name() const
  {
    return owner_type ? *owner_type + "." + name : name;
  }
};

/// One object of the semantic graph (element or markup extension instance)
struct ObjectNode
{
  std::string type_name;  ///< `BindingExtension` for `{Binding}`
  std::string xml_namespace;
  std::string prefix;
  std::optional<ResolvedType> resolved;

  std::vector<PropertyValueNode> members;
  std::vector<std::unique_ptr<ObjectNode>> children;

  /// Positional argument of an extension the catalog could not name
  std::optional<std::string> positional;

  uint32_t line = 0;

  [[nodiscard]] bool is_markup_extension() const noexcept;

  /// `Binding` for `BindingExtension`
  [[nodiscard]] std::string extension_name() const;

  [[nodiscard]] const PropertyValueNode * find_member(std::string_view full_name) const;
};

/**
 * Independent tinyxml2 parse that resolves element types and member owners
 * against a TypeCatalog.
 *
 * Throws SemanticParseError on malformed XML or undeclared prefixes.
 * Unresolved types are reported as warnings and parsing continues.
 */
class SemanticParser
{
public:
  SemanticParser(const TypeCatalog & catalog, DiagnosticBag & diags)
  : catalog_(catalog), diags_(diags)
  {
  }

  [[nodiscard]] std::unique_ptr<ObjectNode> parse(
    std::string_view text, const std::string & file_path = {});

private:
  const TypeCatalog & catalog_;
  DiagnosticBag & diags_;
};

}  // namespace xaml_bridge
