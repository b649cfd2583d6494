// xaml_bridge/transform/transformation_engine.hpp - Priority-ordered rule application
#pragma once

#include <cstddef>
#include <memory>
#include <vector>

#include <gsl/span>

#include "xaml_bridge/transform/transformation_context.hpp"
#include "xaml_bridge/transform/transformation_rule.hpp"

namespace xaml_bridge
{

/// Totals of one engine run
struct TransformationSummary
{
  size_t rules_applied = 0;
  size_t nodes_deleted = 0;
  bool had_root = false;
};

/**
 * Applies transformation rules to a document.
 *
 * Traversal is pre-order and depth-first: an element is offered to the
 * element rules, then each of its properties (and their values) to the
 * property and markup extension rules, then its children. For every node only
 * the first applicable rule in descending priority order runs; rules of equal
 * priority keep their registration order.
 */
class TransformationEngine
{
public:
  TransformationEngine() = default;

  TransformationEngine(const TransformationEngine &) = delete;
  TransformationEngine & operator=(const TransformationEngine &) = delete;
  TransformationEngine(TransformationEngine &&) = default;
  TransformationEngine & operator=(TransformationEngine &&) = default;

  void add_rule(std::unique_ptr<TransformationRule> rule);

  /// Take ownership of every rule in `rules` (the span's slots are left empty)
  void add_rules(gsl::span<std::unique_ptr<TransformationRule>> rules);

  [[nodiscard]] size_t rule_count() const noexcept { return rules_.size(); }

  /// Rules in application order
  [[nodiscard]] const std::vector<std::unique_ptr<TransformationRule>> & rules();

  /// Run every rule over the context's document and report the statistics
  TransformationSummary run(TransformationContext & ctx);

  /// Run every rule without the completion report (for multi-pass drivers)
  TransformationSummary apply(TransformationContext & ctx);

  /// Emit TRANSFORM_COMPLETE and one TRANSFORM_RULE_STATS info per rule seen by `ctx`
  static void report(TransformationContext & ctx, const TransformationSummary & summary);

private:
  void sort_rules();

  std::vector<std::unique_ptr<TransformationRule>> rules_;
  bool sorted_ = true;
};

}  // namespace xaml_bridge
