// xaml_bridge/transform/transformation_rule.hpp - Rule capability interfaces
#pragma once

#include <cstdint>
#include <memory>
#include <string_view>

#include "xaml_bridge/ast/unified_ast.hpp"

namespace xaml_bridge
{

class TransformationContext;

enum class RuleKind : uint8_t {
  Element,
  Property,
  MarkupExtension,
};

/**
 * Base of every transformation rule.
 *
 * A rule is a capability over one node category. The engine sorts rules by
 * descending priority and applies, per node, only the first rule whose
 * can_apply() holds.
 */
class TransformationRule
{
public:
  TransformationRule(const TransformationRule &) = delete;
  TransformationRule & operator=(const TransformationRule &) = delete;
  virtual ~TransformationRule() = default;

  [[nodiscard]] RuleKind get_kind() const noexcept { return kind_; }

  [[nodiscard]] virtual std::string_view name() const = 0;

  /// Higher runs first
  [[nodiscard]] virtual int priority() const { return 0; }

protected:
  explicit TransformationRule(RuleKind k) : kind_(k) {}

private:
  const RuleKind kind_;
};

/**
 * Rule over one node type.
 *
 * apply() receives ownership of the node and returns what goes back into the
 * slot: the same node, a replacement, or nullptr to delete it.
 */
template <typename Node, RuleKind K>
class NodeRule : public TransformationRule
{
public:
  using node_type = Node;

  static bool classof(const TransformationRule * rule) { return rule->get_kind() == K; }

  [[nodiscard]] virtual bool can_apply(const Node & node) const = 0;

  virtual std::unique_ptr<Node> apply(std::unique_ptr<Node> node, TransformationContext & ctx) = 0;

protected:
  NodeRule() : TransformationRule(K) {}
};

using ElementRule = NodeRule<Element, RuleKind::Element>;
using PropertyRule = NodeRule<Property, RuleKind::Property>;
using MarkupExtensionRule = NodeRule<MarkupExtension, RuleKind::MarkupExtension>;

}  // namespace xaml_bridge
