// xaml_bridge/visitor/visitor.hpp - Unified AST traversal
//
// Read-only and mutating traversal share one virtual capability interface;
// walk() drives it in document order. Structural edits go through the
// ownership-transferring RewritingVisitor instead.
//
#pragma once

#include <cstdint>
#include <memory>
#include <type_traits>

#include "xaml_bridge/ast/unified_ast.hpp"

namespace xaml_bridge
{

/// Traversal control returned by every visit method
enum class VisitResult : uint8_t {
  Continue,      ///< Descend into the node's contents
  SkipChildren,  ///< Do not descend, continue with the next sibling
  Stop,          ///< Abort the whole walk
};

namespace detail
{

/// `const T &` for const traversal, `T &` otherwise
template <bool Const, typename T>
using node_ref_t = std::conditional_t<Const, const T &, T &>;

}  // namespace detail

// ============================================================================
// BasicUnifiedVisitor
// ============================================================================

/**
 * Visitor capability interface. Every hook defaults to Continue, so derived
 * visitors override only what they need.
 *
 * Order for an element: visit_element, then each property (its comments, then
 * its value), then the element's comments, then its children, then
 * leave_element. Nested extensions inside extension arguments are visited
 * after their owner.
 */
template <bool Const>
class BasicUnifiedVisitor
{
public:
  template <typename T>
  using Ref = detail::node_ref_t<Const, T>;

  virtual ~BasicUnifiedVisitor() = default;

  virtual VisitResult visit_document(Ref<Document> /*doc*/) { return VisitResult::Continue; }
  virtual VisitResult visit_element(Ref<Element> /*elem*/) { return VisitResult::Continue; }
  virtual void leave_element(Ref<Element> /*elem*/) {}
  virtual VisitResult visit_property(Ref<Property> /*prop*/) { return VisitResult::Continue; }
  virtual VisitResult visit_markup_extension(Ref<MarkupExtension> /*ext*/)
  {
    return VisitResult::Continue;
  }
  virtual VisitResult visit_comment(Ref<Comment> /*comment*/) { return VisitResult::Continue; }
};

using UnifiedVisitor = BasicUnifiedVisitor<false>;
using ConstUnifiedVisitor = BasicUnifiedVisitor<true>;

/// Walk a whole document (leading comments, root, trailing comments)
/// @return false when a visit method returned Stop
bool walk(Document & doc, UnifiedVisitor & visitor);
bool walk(const Document & doc, ConstUnifiedVisitor & visitor);

/// Walk one subtree
bool walk(Element & elem, UnifiedVisitor & visitor);
bool walk(const Element & elem, ConstUnifiedVisitor & visitor);

// ============================================================================
// RewritingVisitor
// ============================================================================

/**
 * Ownership-transferring rewrite hooks.
 *
 * Each hook receives the node it may replace and returns the node to keep in
 * its slot: the same pointer (possibly mutated), a new node, or nullptr to
 * delete the slot. Deleting a child element shifts the content anchors of the
 * comments, text and property elements that followed it.
 */
class RewritingVisitor
{
public:
  virtual ~RewritingVisitor() = default;

  virtual std::unique_ptr<Element> rewrite_element(std::unique_ptr<Element> elem) { return elem; }
  virtual std::unique_ptr<Property> rewrite_property(std::unique_ptr<Property> prop)
  {
    return prop;
  }
  virtual std::unique_ptr<MarkupExtension> rewrite_markup_extension(
    std::unique_ptr<MarkupExtension> ext)
  {
    return ext;
  }
};

/**
 * Rewrite the document tree pre-order: an element is offered first, then its
 * properties (and their values), then its children.
 *
 * @return number of slots deleted
 */
size_t rewrite(Document & doc, RewritingVisitor & rewriter);

}  // namespace xaml_bridge
