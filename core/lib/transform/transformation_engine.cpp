// xaml_bridge/transform/transformation_engine.cpp - Priority-ordered rule application
//
#include "xaml_bridge/transform/transformation_engine.hpp"

#include <algorithm>
#include <optional>
#include <utility>

#include <fmt/format.h>

#include "xaml_bridge/basic/casting.hpp"
#include "xaml_bridge/basic/diagnostic_codes.hpp"
#include "xaml_bridge/basic/logging.hpp"
#include "xaml_bridge/visitor/visitor.hpp"

namespace xaml_bridge
{

namespace
{

// ============================================================================
// RuleDispatcher - feeds every offered node to the first applicable rule
// ============================================================================

class RuleDispatcher : public RewritingVisitor
{
public:
  RuleDispatcher(
    const std::vector<std::unique_ptr<TransformationRule>> & rules, TransformationContext & ctx)
  : rules_(rules), ctx_(ctx)
  {
  }

  std::unique_ptr<Element> rewrite_element(std::unique_ptr<Element> elem) override
  {
    return dispatch<ElementRule>(std::move(elem));
  }

  std::unique_ptr<Property> rewrite_property(std::unique_ptr<Property> prop) override
  {
    return dispatch<PropertyRule>(std::move(prop));
  }

  std::unique_ptr<MarkupExtension> rewrite_markup_extension(
    std::unique_ptr<MarkupExtension> ext) override
  {
    return dispatch<MarkupExtensionRule>(std::move(ext));
  }

  [[nodiscard]] size_t applied() const noexcept { return applied_; }

private:
  template <typename RuleT, typename Node>
  std::unique_ptr<Node> dispatch(std::unique_ptr<Node> node)
  {
    for (const auto & rule : rules_) {
      auto * typed = dyn_cast<RuleT>(rule.get());
      if (!typed || !typed->can_apply(*node)) continue;

      const std::string_view rule_name = typed->name();
      node = typed->apply(std::move(node), ctx_);
      ++applied_;
      ctx_.count_applied(rule_name);
      if (!node) ctx_.count_deleted(rule_name);
      break;
    }
    return node;
  }

  const std::vector<std::unique_ptr<TransformationRule>> & rules_;
  TransformationContext & ctx_;
  size_t applied_ = 0;
};

}  // namespace

// ============================================================================
// TransformationEngine
// ============================================================================

void TransformationEngine::add_rule(std::unique_ptr<TransformationRule> rule)
{
  if (!rule) return;
  rules_.push_back(std::move(rule));
  sorted_ = false;
}

void TransformationEngine::add_rules(gsl::span<std::unique_ptr<TransformationRule>> rules)
{
  for (auto & rule : rules) add_rule(std::move(rule));
}

const std::vector<std::unique_ptr<TransformationRule>> & TransformationEngine::rules()
{
  sort_rules();
  return rules_;
}

void TransformationEngine::sort_rules()
{
  if (sorted_) return;
  std::stable_sort(rules_.begin(), rules_.end(), [](const auto & a, const auto & b) {
    return a->priority() > b->priority();
  });
  sorted_ = true;
}

TransformationSummary TransformationEngine::run(TransformationContext & ctx)
{
  TransformationSummary summary = apply(ctx);
  if (summary.had_root) report(ctx, summary);
  return summary;
}

TransformationSummary TransformationEngine::apply(TransformationContext & ctx)
{
  TransformationSummary summary;
  Document & doc = ctx.document();

  if (!doc.root()) {
    auto builder = ctx.diagnostics().report_warning(
      codes::k_transform_no_root, "Document has no root element");
    if (!doc.file_path.empty()) builder.with_file(doc.file_path);
    return summary;
  }
  summary.had_root = true;

  sort_rules();
  log_debug("Applying {} transformation rules to {}", rules_.size(), doc.file_path);

  RuleDispatcher dispatcher(rules_, ctx);
  summary.nodes_deleted = rewrite(doc, dispatcher);
  summary.rules_applied = dispatcher.applied();

  doc.refresh_symbols();
  return summary;
}

void TransformationEngine::report(
  TransformationContext & ctx, const TransformationSummary & summary)
{
  const Document & doc = ctx.document();
  std::optional<std::string> file;
  if (!doc.file_path.empty()) file = doc.file_path;

  ctx.diagnostics().add_info(
    codes::k_transform_complete,
    fmt::format(
      "Transformation complete: {} transformations applied, {} nodes removed",
      summary.rules_applied, summary.nodes_deleted),
    file);

  // Most active rules first
  std::vector<std::pair<std::string, RuleStatistics>> by_rule(
    ctx.statistics().begin(), ctx.statistics().end());
  std::stable_sort(by_rule.begin(), by_rule.end(), [](const auto & a, const auto & b) {
    return a.second.applied > b.second.applied;
  });
  for (const auto & [name, stats] : by_rule) {
    ctx.diagnostics().add_info(
      codes::k_transform_rule_stats,
      fmt::format("  {}: {} transformation(s)", name, stats.applied), file);
  }
}

}  // namespace xaml_bridge
