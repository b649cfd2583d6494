// xaml_bridge/transform/transformation_context.cpp - State threaded through rule applications
//
#include "xaml_bridge/transform/transformation_context.hpp"

#include "xaml_bridge/basic/logging.hpp"

namespace xaml_bridge
{

TransformationContext::TransformationContext(
  Document & document, const MappingRepository & mappings, TransformOptions options)
: document_(document), mappings_(mappings), options_(options)
{
}

void TransformationContext::record_transformation(
  std::string_view rule_name, std::string_view node_kind, std::string description,
  const UnifiedNode * node)
{
  TransformationRecord record;
  record.rule_name = std::string(rule_name);
  record.node_kind = std::string(node_kind);
  record.description = std::move(description);
  if (node) {
    record.node_id = node->id();
    record.line = node->location.line;
  }
  log_trace("[{}] {}: {}", record.rule_name, record.node_kind, record.description);
  document_.transformation_trace.push_back(std::move(record));
}

void TransformationContext::info(const char * code, std::string message, const UnifiedNode & node)
{
  auto builder = diagnostics().report_info(code, std::move(message));
  builder.at(node.location.line, node.location.column);
  if (!document_.file_path.empty()) builder.with_file(document_.file_path);
}

void TransformationContext::warning(
  const char * code, std::string message, const UnifiedNode & node)
{
  auto builder = diagnostics().report_warning(code, std::move(message));
  builder.at(node.location.line, node.location.column);
  if (!document_.file_path.empty()) builder.with_file(document_.file_path);
}

void TransformationContext::count_applied(std::string_view rule_name)
{
  auto it = statistics_.find(rule_name);
  if (it == statistics_.end()) it = statistics_.emplace(std::string(rule_name), RuleStatistics{}).first;
  ++it->second.applied;
}

void TransformationContext::count_deleted(std::string_view rule_name)
{
  auto it = statistics_.find(rule_name);
  if (it == statistics_.end()) it = statistics_.emplace(std::string(rule_name), RuleStatistics{}).first;
  ++it->second.deleted;
}

size_t TransformationContext::total_applied() const noexcept
{
  size_t sum = 0;
  for (const auto & [name, stats] : statistics_) sum += stats.applied;
  return sum;
}

}  // namespace xaml_bridge
