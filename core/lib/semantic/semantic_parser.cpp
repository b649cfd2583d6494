// xaml_bridge/semantic/semantic_parser.cpp - Type-resolving parse into an object graph
//
#include "xaml_bridge/semantic/semantic_parser.hpp"

#include <fmt/format.h>

#include <map>

#include "tinyxml2.h"
#include "xaml_bridge/basic/diagnostic_codes.hpp"
#include "xaml_bridge/basic/logging.hpp"
#include "xaml_bridge/formatting/whitespace_extractor.hpp"
#include "xaml_bridge/parser/markup_extension_parser.hpp"

namespace xaml_bridge
{

namespace
{

constexpr std::string_view k_extension_suffix = "Extension";

using Scope = std::map<std::string, std::string, std::less<>>;

std::pair<std::string, std::string> split_name(std::string_view name)
{
  const auto colon = name.find(':');
  if (colon == std::string_view::npos) return {{}, std::string(name)};
  return {std::string(name.substr(0, colon)), std::string(name.substr(colon + 1))};
}

std::string trim_copy(std::string_view s)
{
  while (!s.empty() && WhitespaceExtractor::is_whitespace(s.front())) s.remove_prefix(1);
  while (!s.empty() && WhitespaceExtractor::is_whitespace(s.back())) s.remove_suffix(1);
  return std::string(s);
}

class GraphBuilder
{
public:
  GraphBuilder(const TypeCatalog & catalog, DiagnosticBag & diags, const std::string & file_path)
  : catalog_(catalog), diags_(diags), file_path_(file_path)
  {
  }

  std::unique_ptr<ObjectNode> build_object(const tinyxml2::XMLElement & xe, const Scope & parent);

private:
  std::unique_ptr<ObjectNode> from_extension(
    const MarkupExtension & ext, const Scope & scope, uint32_t line);
  ObjectValue convert_value(const std::string & value, const Scope & scope, uint32_t line);
  void resolve_type(ObjectNode & node);
  std::optional<ResolvedProperty> resolve_member(
    const ObjectNode & owner, const std::string & owner_namespace,
    const PropertyValueNode & member) const;
  std::string lookup(const Scope & scope, const std::string & prefix, uint32_t line) const;
  void report_unresolved(const ObjectNode & node);

  const TypeCatalog & catalog_;
  DiagnosticBag & diags_;
  const std::string & file_path_;
};

std::string GraphBuilder::lookup(const Scope & scope, const std::string & prefix, uint32_t line) const
{
  auto it = scope.find(prefix);
  if (it != scope.end()) return it->second;
  if (prefix.empty()) return {};
  throw SemanticParseError(
    fmt::format("Undeclared namespace prefix '{}' at line {}", prefix, line), line);
}

void GraphBuilder::report_unresolved(const ObjectNode & node)
{
  const std::string shown = node.prefix.empty() ? node.type_name : node.prefix + ":" + node.type_name;
  auto builder = diags_.report_warning(
    codes::k_semantic_type_unresolved,
    fmt::format("Unable to resolve type '{}' in namespace '{}'", shown, node.xml_namespace));
  builder.at(node.line, 0);
  if (!file_path_.empty()) builder.with_file(file_path_);
}

void GraphBuilder::resolve_type(ObjectNode & node)
{
  if (const auto * type = catalog_.find_type(node.xml_namespace, node.type_name)) {
    node.resolved = catalog_.to_resolved(*type);
    return;
  }
  report_unresolved(node);
}

std::optional<ResolvedProperty> GraphBuilder::resolve_member(
  const ObjectNode & owner, const std::string & owner_namespace,
  const PropertyValueNode & member) const
{
  const TypeDescriptor * type = nullptr;
  if (member.owner_type) {
    type = catalog_.find_type(owner_namespace, *member.owner_type);
    if (!type) type = catalog_.find_type(*member.owner_type);
  } else if (owner.resolved) {
    type = catalog_.find_type(owner.resolved->xml_namespace, owner.resolved->name);
  }
  if (!type) return std::nullopt;
  return catalog_.resolve_property(*type, member.name);
}

ObjectValue GraphBuilder::convert_value(const std::string & value, const Scope & scope, uint32_t line)
{
  if (!MarkupExtensionParser::is_markup_extension(value)) return value;
  std::unique_ptr<MarkupExtension> ext;
  try {
    MarkupExtensionParser parser;
    ext = parser.parse(value);
  } catch (const MarkupExtensionParseError & e) {
    log_debug("semantic layer keeps malformed extension as literal: {}", e.what());
    return value;
  }
  return from_extension(*ext, scope, line);
}

std::unique_ptr<ObjectNode> GraphBuilder::from_extension(
  const MarkupExtension & ext, const Scope & scope, uint32_t line)
{
  auto node = std::make_unique<ObjectNode>();
  node->line = line;
  auto [prefix, local] = split_name(ext.name);
  node->prefix = prefix;
  node->xml_namespace = lookup(scope, prefix, line);

  const TypeDescriptor * type = catalog_.find_markup_extension(node->xml_namespace, local);
  if (type) {
    node->type_name = type->name;
    node->resolved = catalog_.to_resolved(*type);
  } else {
    node->type_name = local + std::string(k_extension_suffix);
    report_unresolved(*node);
  }

  auto to_value = [&](const MarkupExtensionArgument & arg) -> ObjectValue {
    if (const auto * nested = arg.nested()) return from_extension(*nested, scope, line);
    return *arg.literal();
  };

  if (ext.positional) {
    if (type && type->positional_parameter) {
      PropertyValueNode member;
      member.name = *type->positional_parameter;
      member.line = line;
      member.resolved = catalog_.resolve_property(*type, member.name);
      member.values.push_back(to_value(*ext.positional));
      node->members.push_back(std::move(member));
    } else {
      const auto * nested = ext.positional->nested();
      node->positional = nested ? nested->to_string() : *ext.positional->literal();
    }
  }
  for (const auto & arg : ext.parameters) {
    PropertyValueNode member;
    member.name = arg.name;
    member.line = line;
    if (type) member.resolved = catalog_.resolve_property(*type, member.name);
    member.values.push_back(to_value(arg));
    node->members.push_back(std::move(member));
  }
  return node;
}

std::unique_ptr<ObjectNode> GraphBuilder::build_object(
  const tinyxml2::XMLElement & xe, const Scope & parent)
{
  auto node = std::make_unique<ObjectNode>();
  node->line = static_cast<uint32_t>(xe.GetLineNum());

  Scope scope = parent;
  for (const auto * a = xe.FirstAttribute(); a; a = a->Next()) {
    const std::string_view name = a->Name();
    if (name == "xmlns") {
      scope[""] = a->Value();
    } else if (name.rfind("xmlns:", 0) == 0) {
      scope[std::string(name.substr(6))] = a->Value();
    }
  }

  auto [prefix, local] = split_name(xe.Name());
  node->prefix = prefix;
  node->xml_namespace = lookup(scope, prefix, node->line);
  node->type_name = local;
  resolve_type(*node);

  for (const auto * a = xe.FirstAttribute(); a; a = a->Next()) {
    const std::string_view raw = a->Name();
    if (raw == "xmlns" || raw.rfind("xmlns:", 0) == 0) continue;
    auto [attr_prefix, attr_local] = split_name(raw);
    std::string owner_namespace = node->xml_namespace;
    const auto dot = attr_local.find('.');
    const bool dotted = dot != std::string::npos && dot > 0 && dot + 1 < attr_local.size();
    if (!attr_prefix.empty()) {
      owner_namespace = lookup(scope, attr_prefix, node->line);
      // Namespace-qualified attributes are members only in attached form
      if (!dotted || owner_namespace == k_xaml_language_namespace) continue;
    }

    PropertyValueNode member;
    member.line = node->line;
    if (dotted) {
      member.owner_type = attr_local.substr(0, dot);
      member.name = attr_local.substr(dot + 1);
    } else {
      member.name = attr_local;
    }
    member.resolved = resolve_member(*node, owner_namespace, member);
    member.values.push_back(convert_value(a->Value(), scope, node->line));
    node->members.push_back(std::move(member));
  }

  for (const auto * child = xe.FirstChildElement(); child; child = child->NextSiblingElement()) {
    auto [child_prefix, child_local] = split_name(child->Name());
    const auto dot = child_local.find('.');
    if (dot == std::string::npos) {
      node->children.push_back(build_object(*child, scope));
      continue;
    }

    PropertyValueNode member;
    member.is_property_element = true;
    member.line = static_cast<uint32_t>(child->GetLineNum());
    member.owner_type = child_local.substr(0, dot);
    member.name = child_local.substr(dot + 1);
    member.resolved = resolve_member(*node, lookup(scope, child_prefix, member.line), member);

    for (const auto * v = child->FirstChildElement(); v; v = v->NextSiblingElement()) {
      member.values.push_back(build_object(*v, scope));
    }
    if (member.values.empty() && child->GetText()) {
      const std::string text = trim_copy(child->GetText());
      if (!text.empty()) member.values.push_back(convert_value(text, scope, member.line));
    }
    node->members.push_back(std::move(member));
  }
  return node;
}

}  // namespace

// ============================================================================
// ObjectNode
// ============================================================================

bool ObjectNode::is_markup_extension() const noexcept
{
  return type_name.size() > k_extension_suffix.size() &&
         std::string_view(type_name).substr(type_name.size() - k_extension_suffix.size()) ==
           k_extension_suffix;
}

std::string ObjectNode::extension_name() const
{
  std::string local = type_name;
  if (is_markup_extension()) local.resize(local.size() - k_extension_suffix.size());
  return prefix.empty() ? local : prefix + ":" + local;
}

const PropertyValueNode * ObjectNode::find_member(std::string_view full_name) const
{
  for (const auto & m : members) {
    if (m.full_name() == full_name) return &m;
  }
  return nullptr;
}

// ============================================================================
// SemanticParser
// ============================================================================

std::unique_ptr<ObjectNode> SemanticParser::parse(
  std::string_view text, const std::string & file_path)
{
  tinyxml2::XMLDocument xml;
  if (xml.Parse(text.data(), text.size()) != tinyxml2::XML_SUCCESS) {
    const auto line = static_cast<uint32_t>(xml.ErrorLineNum());
    throw SemanticParseError(
      fmt::format("XML error at line {}: {}", line, xml.ErrorStr() ? xml.ErrorStr() : ""), line);
  }
  const tinyxml2::XMLElement * root = xml.RootElement();
  if (!root) throw SemanticParseError("Document has no root element", 0);

  GraphBuilder builder(catalog_, diags_, file_path);
  const Scope base{{"xml", "http://www.w3.org/XML/1998/namespace"}};
  auto graph = builder.build_object(*root, base);
  log_debug("semantic graph built for '{}'", file_path.empty() ? "<input>" : file_path);
  return graph;
}

}  // namespace xaml_bridge
