// xaml_bridge/ast/symbol_table.hpp - Per-document name/namespace/type index
#pragma once

#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace xaml_bridge
{

class Element;

/**
 * Derived index over one document tree.
 *
 * Filled once after structural conversion by a single post-order walk
 * (property values and children before their element), so a name taken by
 * a nested element is kept over a later duplicate on an ancestor. Rules
 * mutate the tree, not the table, so the table is a snapshot of the
 * pre-transformation tree; call rebuild() to refresh it after rewriting.
 */
class SymbolTable
{
public:
  void clear();

  /// Recompute named elements and type usages from a root (namespaces are kept)
  void rebuild(Element * root);

  void register_namespace(std::string prefix, std::string uri);
  /// Returns false when the name was already taken by another element
  bool register_named(const std::string & name, Element * element);
  void register_type_usage(const std::string & type_name, Element * element);

  [[nodiscard]] Element * find_named(std::string_view name) const;
  [[nodiscard]] std::optional<std::string> namespace_for_prefix(std::string_view prefix) const;
  [[nodiscard]] std::optional<std::string> prefix_for_namespace(std::string_view uri) const;
  [[nodiscard]] std::vector<Element *> type_usages(std::string_view type_name) const;

  [[nodiscard]] const std::map<std::string, Element *, std::less<>> & named_elements() const
  {
    return named_;
  }
  [[nodiscard]] const std::map<std::string, std::string, std::less<>> & namespaces() const
  {
    return namespaces_;
  }
  [[nodiscard]] const std::map<std::string, std::vector<Element *>, std::less<>> & types() const
  {
    return types_;
  }

private:
  void register_subtree(Element & elem);

  std::map<std::string, Element *, std::less<>> named_;
  std::map<std::string, std::string, std::less<>> namespaces_;  ///< prefix ("" = default) -> URI
  std::map<std::string, std::vector<Element *>, std::less<>> types_;
};

}  // namespace xaml_bridge
