// xaml_bridge/semantic/semantic_converter.hpp - Object graph to Unified AST bridge
#pragma once

#include <memory>

#include "xaml_bridge/ast/unified_ast.hpp"
#include "xaml_bridge/basic/diagnostic.hpp"
#include "xaml_bridge/semantic/semantic_parser.hpp"

namespace xaml_bridge
{

/**
 * Bridges the semantic object graph into the Unified AST.
 *
 * convert() builds a fresh tree without formatting hints. enrich() walks
 * the graph and an existing structural tree in lock-step and attaches
 * resolved types and property owners to the matching nodes.
 */
class SemanticConverter
{
public:
  [[nodiscard]] std::unique_ptr<Document> convert(const ObjectNode & root) const;

  /**
   * Enrich `document` in place.
   *
   * Properties are matched by full name and created at the member's slot
   * when missing. Children are matched by index after checking that type
   * names and child counts agree; on disagreement a SEMANTIC_CHILD_MISMATCH
   * warning is reported and that subtree is left as is.
   *
   * @return number of elements enriched
   */
  size_t enrich(const ObjectNode & root, Document & document, DiagnosticBag & diags) const;

private:
  std::unique_ptr<Element> convert_object(const ObjectNode & node) const;
  std::unique_ptr<MarkupExtension> convert_extension(const ObjectNode & node) const;
  std::unique_ptr<Property> convert_member(const PropertyValueNode & member, const ObjectNode & owner) const;

  size_t enrich_element(
    const ObjectNode & node, Element & element, const std::string & file_path,
    DiagnosticBag & diags) const;
  void enrich_property(
    const PropertyValueNode & member, Property & property, const std::string & file_path,
    DiagnosticBag & diags, size_t & enriched) const;
  void augment_extension(const ObjectNode & node, MarkupExtension & extension) const;
};

}  // namespace xaml_bridge
