// xaml_bridge/visitor/visitor.cpp - Unified AST traversal
//
#include "xaml_bridge/visitor/visitor.hpp"

#include <utility>

namespace xaml_bridge
{

namespace
{

// ============================================================================
// Walker - read-only / in-place traversal
// ============================================================================

template <bool Const>
class Walker
{
public:
  template <typename T>
  using Ref = detail::node_ref_t<Const, T>;

  explicit Walker(BasicUnifiedVisitor<Const> & visitor) : visitor_(visitor) {}

  bool document(Ref<Document> doc)
  {
    const VisitResult r = visitor_.visit_document(doc);
    if (r == VisitResult::Stop) return false;
    if (r == VisitResult::SkipChildren) return true;
    for (const auto & c : doc.leading_comments) {
      if (!comment(*c)) return false;
    }
    if (doc.root() && !element(*doc.root())) return false;
    for (const auto & c : doc.trailing_comments) {
      if (!comment(*c)) return false;
    }
    return true;
  }

  bool element(Ref<Element> elem)
  {
    const VisitResult r = visitor_.visit_element(elem);
    if (r == VisitResult::Stop) return false;
    if (r == VisitResult::Continue) {
      for (const auto & p : elem.properties()) {
        if (!property(*p)) return false;
      }
      for (const auto & c : elem.comments) {
        if (!comment(*c)) return false;
      }
      for (const auto & child : elem.children()) {
        if (!element(*child)) return false;
      }
    }
    visitor_.leave_element(elem);
    return true;
  }

private:
  bool property(Ref<Property> prop)
  {
    const VisitResult r = visitor_.visit_property(prop);
    if (r == VisitResult::Stop) return false;
    if (r == VisitResult::SkipChildren) return true;
    for (const auto & c : prop.comments) {
      if (!comment(*c)) return false;
    }
    if (auto * ext = prop.markup_extension()) return extension(*ext);
    if (auto * value = prop.element()) return element(*value);
    return true;
  }

  bool extension(Ref<MarkupExtension> ext)
  {
    const VisitResult r = visitor_.visit_markup_extension(ext);
    if (r == VisitResult::Stop) return false;
    if (r == VisitResult::SkipChildren) return true;
    if (ext.positional) {
      if (auto * nested = ext.positional->nested(); nested && !extension(*nested)) return false;
    }
    for (const auto & arg : ext.parameters) {
      if (auto * nested = arg.nested(); nested && !extension(*nested)) return false;
    }
    return true;
  }

  bool comment(Ref<Comment> c) { return visitor_.visit_comment(c) != VisitResult::Stop; }

  BasicUnifiedVisitor<Const> & visitor_;
};

// ============================================================================
// Rewriter - ownership-transferring traversal
// ============================================================================

class Rewriter
{
public:
  explicit Rewriter(RewritingVisitor & rewriter) : rewriter_(rewriter) {}

  std::unique_ptr<Element> element(std::unique_ptr<Element> elem)
  {
    elem = rewriter_.rewrite_element(std::move(elem));
    if (!elem) {
      ++removed_;
      return nullptr;
    }

    // Offered nodes keep their owner as parent until re-added
    auto props = elem->release_properties();
    for (size_t i = 0; i < props.size(); ++i) {
      props[i]->set_parent(elem.get(), i);
      if (auto kept = property(std::move(props[i]))) elem->add_property(std::move(kept));
    }

    auto children = elem->release_children();
    for (size_t i = 0; i < children.size(); ++i) {
      children[i]->set_parent(elem.get(), i);
      if (auto kept = element(std::move(children[i]))) {
        elem->add_child(std::move(kept));
      } else {
        close_gap(*elem, elem->children().size());
      }
    }
    return elem;
  }

  [[nodiscard]] size_t removed() const noexcept { return removed_; }

private:
  std::unique_ptr<Property> property(std::unique_ptr<Property> prop)
  {
    prop = rewriter_.rewrite_property(std::move(prop));
    if (!prop) {
      ++removed_;
      return nullptr;
    }
    if (prop->markup_extension()) {
      auto ext = prop->take_markup_extension();
      ext->set_parent(prop.get());
      if ((ext = extension(std::move(ext)))) prop->set_value(std::move(ext));
    } else if (prop->element()) {
      auto value = prop->take_element();
      value->set_parent(prop.get());
      if ((value = element(std::move(value)))) prop->set_value(std::move(value));
    }
    return prop;
  }

  std::unique_ptr<MarkupExtension> extension(std::unique_ptr<MarkupExtension> ext)
  {
    ext = rewriter_.rewrite_markup_extension(std::move(ext));
    if (!ext) {
      ++removed_;
      return nullptr;
    }

    if (ext->positional && ext->positional->is_nested()) {
      auto & slot = std::get<std::unique_ptr<MarkupExtension>>(ext->positional->value);
      slot = extension(std::move(slot));
      if (!slot) ext->positional.reset();
    }
    for (size_t i = 0; i < ext->parameters.size();) {
      auto & arg = ext->parameters[i];
      if (arg.is_nested()) {
        auto & slot = std::get<std::unique_ptr<MarkupExtension>>(arg.value);
        slot = extension(std::move(slot));
        if (!slot) {
          ext->parameters.erase(ext->parameters.begin() + static_cast<ptrdiff_t>(i));
          continue;
        }
      }
      ++i;
    }
    ext->adopt_arguments();
    return ext;
  }

  /// A child at index `gap` was deleted: content anchored after it moves up by one
  static void close_gap(Element & elem, size_t gap)
  {
    auto shift = [gap](FormattingHints & hints) {
      if (hints.content_anchor && *hints.content_anchor > gap) --*hints.content_anchor;
    };
    for (auto & c : elem.comments) shift(c->hints);
    for (const auto & p : elem.properties()) {
      if (p->kind == PropertyKind::PropertyElement) shift(p->hints);
    }
    shift(elem.text_hints);
  }

  RewritingVisitor & rewriter_;
  size_t removed_ = 0;
};

}  // namespace

bool walk(Document & doc, UnifiedVisitor & visitor) { return Walker<false>(visitor).document(doc); }

bool walk(const Document & doc, ConstUnifiedVisitor & visitor)
{
  return Walker<true>(visitor).document(doc);
}

bool walk(Element & elem, UnifiedVisitor & visitor) { return Walker<false>(visitor).element(elem); }

bool walk(const Element & elem, ConstUnifiedVisitor & visitor)
{
  return Walker<true>(visitor).element(elem);
}

size_t rewrite(Document & doc, RewritingVisitor & rewriter)
{
  Rewriter driver(rewriter);
  if (doc.root()) doc.set_root(driver.element(doc.take_root()));
  return driver.removed();
}

}  // namespace xaml_bridge
