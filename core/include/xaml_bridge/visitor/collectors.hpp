// xaml_bridge/visitor/collectors.hpp - Ready-made read-only visitors
#pragma once

#include <cstddef>
#include <functional>
#include <map>
#include <string>
#include <vector>

#include "xaml_bridge/visitor/visitor.hpp"

namespace xaml_bridge
{

/// Collects elements matching a predicate, in document order
class ElementCollector : public ConstUnifiedVisitor
{
public:
  using Predicate = std::function<bool(const Element &)>;

  explicit ElementCollector(Predicate predicate) : predicate_(std::move(predicate)) {}

  VisitResult visit_element(const Element & elem) override;

  [[nodiscard]] const std::vector<const Element *> & results() const noexcept { return results_; }

private:
  Predicate predicate_;
  std::vector<const Element *> results_;
};

/// Collects every markup extension (nested ones included), optionally by local name
class MarkupExtensionCollector : public ConstUnifiedVisitor
{
public:
  MarkupExtensionCollector() = default;
  explicit MarkupExtensionCollector(std::string local_name) : filter_(std::move(local_name)) {}

  VisitResult visit_markup_extension(const MarkupExtension & ext) override;

  [[nodiscard]] const std::vector<const MarkupExtension *> & results() const noexcept
  {
    return results_;
  }

private:
  std::string filter_;
  std::vector<const MarkupExtension *> results_;
};

/// Node totals per kind, plus the deepest element nesting seen
class NodeCounter : public ConstUnifiedVisitor
{
public:
  VisitResult visit_element(const Element & elem) override;
  void leave_element(const Element & elem) override;
  VisitResult visit_property(const Property & prop) override;
  VisitResult visit_markup_extension(const MarkupExtension & ext) override;
  VisitResult visit_comment(const Comment & comment) override;

  [[nodiscard]] size_t count(NodeKind kind) const;
  [[nodiscard]] size_t total() const noexcept;
  [[nodiscard]] size_t max_depth() const noexcept { return max_depth_; }

private:
  std::map<NodeKind, size_t> counts_;
  size_t depth_ = 0;
  size_t max_depth_ = 0;
};

/// Elements whose type could not be resolved by semantic enrichment
[[nodiscard]] std::vector<const Element *> collect_unresolved_elements(const Document & doc);

}  // namespace xaml_bridge
