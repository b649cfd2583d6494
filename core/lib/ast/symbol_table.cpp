// xaml_bridge/ast/symbol_table.cpp - Per-document name/namespace/type index
//
#include "xaml_bridge/ast/symbol_table.hpp"

#include "xaml_bridge/ast/unified_ast.hpp"

namespace xaml_bridge
{

void SymbolTable::clear()
{
  named_.clear();
  namespaces_.clear();
  types_.clear();
}

void SymbolTable::rebuild(Element * root)
{
  named_.clear();
  types_.clear();
  if (root) register_subtree(*root);
}

void SymbolTable::register_subtree(Element & elem)
{
  // Post-order: property values, then children, then the element itself
  for (const auto & p : elem.properties()) {
    if (auto * value = p->element()) register_subtree(*value);
  }
  for (const auto & child : elem.children()) register_subtree(*child);

  if (elem.synthetic_collection) return;
  if (elem.x_name && !elem.x_name->empty()) register_named(*elem.x_name, &elem);
  register_type_usage(elem.type_name, &elem);
}

void SymbolTable::register_namespace(std::string prefix, std::string uri)
{
  namespaces_[std::move(prefix)] = std::move(uri);
}

bool SymbolTable::register_named(const std::string & name, Element * element)
{
  auto [it, inserted] = named_.try_emplace(name, element);
  return inserted || it->second == element;
}

void SymbolTable::register_type_usage(const std::string & type_name, Element * element)
{
  types_[type_name].push_back(element);
}

Element * SymbolTable::find_named(std::string_view name) const
{
  auto it = named_.find(name);
  return it == named_.end() ? nullptr : it->second;
}

std::optional<std::string> SymbolTable::namespace_for_prefix(std::string_view prefix) const
{
  auto it = namespaces_.find(prefix);
  if (it == namespaces_.end()) return std::nullopt;
  return it->second;
}

std::optional<std::string> SymbolTable::prefix_for_namespace(std::string_view uri) const
{
  for (const auto & [prefix, ns] : namespaces_) {
    if (ns == uri) return prefix;
  }
  return std::nullopt;
}

std::vector<Element *> SymbolTable::type_usages(std::string_view type_name) const
{
  auto it = types_.find(type_name);
  if (it == types_.end()) return {};
  return it->second;
}

}  // namespace xaml_bridge
