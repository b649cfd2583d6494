// xaml_bridge/visitor/collectors.cpp - Ready-made read-only visitors
//
#include "xaml_bridge/visitor/collectors.hpp"

namespace xaml_bridge
{

VisitResult ElementCollector::visit_element(const Element & elem)
{
  if (predicate_(elem)) results_.push_back(&elem);
  return VisitResult::Continue;
}

VisitResult MarkupExtensionCollector::visit_markup_extension(const MarkupExtension & ext)
{
  if (filter_.empty() || ext.local_name() == filter_) results_.push_back(&ext);
  return VisitResult::Continue;
}

VisitResult NodeCounter::visit_element(const Element & /*elem*/)
{
  ++counts_[NodeKind::Element];
  ++depth_;
  if (depth_ > max_depth_) max_depth_ = depth_;
  return VisitResult::Continue;
}

void NodeCounter::leave_element(const Element & /*elem*/) { --depth_; }

VisitResult NodeCounter::visit_property(const Property & /*prop*/)
{
  ++counts_[NodeKind::Property];
  return VisitResult::Continue;
}

VisitResult NodeCounter::visit_markup_extension(const MarkupExtension & /*ext*/)
{
  ++counts_[NodeKind::MarkupExtension];
  return VisitResult::Continue;
}

VisitResult NodeCounter::visit_comment(const Comment & /*comment*/)
{
  ++counts_[NodeKind::Comment];
  return VisitResult::Continue;
}

size_t NodeCounter::count(NodeKind kind) const
{
  auto it = counts_.find(kind);
  return it == counts_.end() ? 0 : it->second;
}

size_t NodeCounter::total() const noexcept
{
  size_t sum = 0;
  for (const auto & [kind, n] : counts_) sum += n;
  return sum;
}

std::vector<const Element *> collect_unresolved_elements(const Document & doc)
{
  ElementCollector collector(
    [](const Element & e) { return !e.synthetic_collection && !e.resolved_type; });
  walk(doc, collector);
  return collector.results();
}

}  // namespace xaml_bridge
