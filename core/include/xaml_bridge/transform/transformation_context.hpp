// xaml_bridge/transform/transformation_context.hpp - State threaded through rule applications
#pragma once

#include <cstddef>
#include <map>
#include <string>
#include <string_view>

#include "xaml_bridge/ast/unified_ast.hpp"
#include "xaml_bridge/basic/diagnostic.hpp"
#include "xaml_bridge/mapping/mapping_repository.hpp"
#include "xaml_bridge/transform/value_converters.hpp"

namespace xaml_bridge
{

struct TransformOptions
{
  /// Emit TYPE_MAPPING_NOT_FOUND for element types without a mapping
  bool report_unmapped_types = true;

  /// Emit PROPERTY_MAPPING_NOT_FOUND for properties without a mapping
  bool report_unmapped_properties = false;
};

/// Per-rule counters
struct RuleStatistics
{
  size_t applied = 0;
  size_t deleted = 0;
};

/**
 * Everything a rule may consult or record while it runs.
 *
 * Diagnostics go to the document's bag. The transformation trace is kept on
 * the document (Document::transformation_trace) so the writer can render it.
 */
class TransformationContext
{
public:
  TransformationContext(
    Document & document, const MappingRepository & mappings, TransformOptions options = {});

  [[nodiscard]] Document & document() const noexcept { return document_; }
  [[nodiscard]] const MappingRepository & mappings() const noexcept { return mappings_; }
  [[nodiscard]] const TransformOptions & options() const noexcept { return options_; }
  [[nodiscard]] DiagnosticBag & diagnostics() const noexcept { return document_.diagnostics; }

  [[nodiscard]] const ValueConverterRegistry & converters() const noexcept { return converters_; }
  [[nodiscard]] ValueConverterRegistry & converters() noexcept { return converters_; }

  /// Append to the transformation trace
  void record_transformation(
    std::string_view rule_name, std::string_view node_kind, std::string description,
    const UnifiedNode * node = nullptr);

  // Diagnostics located at `node`
  void info(const char * code, std::string message, const UnifiedNode & node);
  void warning(const char * code, std::string message, const UnifiedNode & node);

  void count_applied(std::string_view rule_name);
  void count_deleted(std::string_view rule_name);

  [[nodiscard]] const std::map<std::string, RuleStatistics, std::less<>> & statistics() const noexcept
  {
    return statistics_;
  }

  [[nodiscard]] size_t total_applied() const noexcept;

private:
  Document & document_;
  const MappingRepository & mappings_;
  TransformOptions options_;
  ValueConverterRegistry converters_;
  std::map<std::string, RuleStatistics, std::less<>> statistics_;
};

}  // namespace xaml_bridge
