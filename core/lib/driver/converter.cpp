// xaml_bridge/driver/converter.cpp - Conversion driver implementation
//
#include "xaml_bridge/driver/converter.hpp"

#include <fstream>
#include <iterator>
#include <utility>

#include <fmt/format.h>

#include "xaml_bridge/basic/diagnostic_codes.hpp"
#include "xaml_bridge/basic/logging.hpp"
#include "xaml_bridge/parser/hybrid_parser.hpp"
#include "xaml_bridge/serialization/unified_ast_serializer.hpp"
#include "xaml_bridge/serialization/xaml_writer.hpp"
#include "xaml_bridge/transform/rules.hpp"
#include "xaml_bridge/transform/transformation_context.hpp"

namespace xaml_bridge
{

namespace
{

std::optional<std::string> file_of(const std::string & path)
{
  if (path.empty()) return std::nullopt;
  return path;
}

}  // namespace

Converter::Converter(ConversionConfig config) : config_(std::move(config))
{
  load_catalog();
  load_mappings();
}

void Converter::load_catalog()
{
  catalog_.register_builtins();
  if (!config_.parser.type_catalog) return;

  const auto loaded = catalog_.load_json(*config_.parser.type_catalog);
  if (!loaded.success) {
    setup_diags_.add_warning(
      codes::k_mapping_load_failed,
      fmt::format("Type catalog not loaded: {}", loaded.error),
      config_.parser.type_catalog->string());
    return;
  }
  log_debug(
    "Loaded {} catalog types from {}", loaded.types_loaded, config_.parser.type_catalog->string());
}

void Converter::load_mappings()
{
  // Database records come first so they win over the built-in ones
  if (config_.mappings.file) {
    const auto loaded = mappings_.load(*config_.mappings.file);
    if (loaded.success) {
      log_debug(
        "Loaded {} mapping records (version {}) from {}", loaded.records_loaded, loaded.version,
        config_.mappings.file->string());
    } else {
      setup_diags_.add_error(
        codes::k_mapping_load_failed, fmt::format("Mapping database not loaded: {}", loaded.error),
        config_.mappings.file->string());
    }
  }
  if (config_.mappings.builtin) register_default_mappings(mappings_);
}

TransformationEngine Converter::build_engine() const
{
  TransformationEngine engine;
  for (const auto & r : config_.transform.type_renames) {
    engine.add_rule(
      std::make_unique<SimpleTypeRenameRule>(r.from, r.to, r.source_namespace, r.target_namespace));
  }
  for (const auto & r : config_.transform.property_renames) {
    engine.add_rule(std::make_unique<PropertyRenameRule>(r.from, r.to, r.element));
  }
  auto defaults = default_rule_set();
  engine.add_rules(defaults);
  return engine;
}

TransformationSummary Converter::transform(Document & doc) const
{
  TransformationContext ctx(doc, mappings_, config_.transform.options);
  TransformationSummary total;

  try {
    if (config_.transform.rewrite_namespaces) {
      TransformationEngine ns_pass;
      ns_pass.add_rule(std::make_unique<NamespaceRewriteRule>());
      const auto s = ns_pass.apply(ctx);
      total.rules_applied += s.rules_applied;
      total.nodes_deleted += s.nodes_deleted;
    }

    TransformationEngine engine = build_engine();
    const auto s = engine.apply(ctx);
    total.rules_applied += s.rules_applied;
    total.nodes_deleted += s.nodes_deleted;
    total.had_root = s.had_root;
  } catch (const std::exception & e) {
    log_error("transformation of '{}' failed: {}", doc.file_path, e.what());
    doc.diagnostics.add_error(
      codes::k_transform_rule_failed, fmt::format("Transformation failed: {}", e.what()),
      file_of(doc.file_path));
    return total;
  }

  if (total.had_root) TransformationEngine::report(ctx, total);
  return total;
}

ConversionResult Converter::parse_only(std::string_view text, const std::string & file_path) const
{
  ConversionResult result;
  result.diagnostics.merge(setup_diags_);

  HybridParserOptions options;
  options.enable_semantic = config_.parser.semantic;
  options.file_path = file_path;
  HybridParser parser(catalog_, options);

  auto parsed = parser.parse(text, file_path);
  if (!parsed.success()) {
    result.diagnostics.merge(std::move(parsed.diagnostics));
    return result;
  }

  result.success = true;
  result.document = std::move(parsed.document);
  result.diagnostics.merge(result.document->diagnostics);
  return result;
}

ConversionResult Converter::convert_text(std::string_view text, const std::string & file_path) const
{
  ConversionResult result;
  result.diagnostics.merge(setup_diags_);

  HybridParserOptions options;
  options.enable_semantic = config_.parser.semantic;
  options.file_path = file_path;
  HybridParser parser(catalog_, options);

  auto parsed = parser.parse(text, file_path);
  if (!parsed.success()) {
    result.diagnostics.merge(std::move(parsed.diagnostics));
    return result;
  }
  result.success = true;
  Document & doc = *parsed.document;

  if (oracle_) {
    CompanionLinkValidator validator(*oracle_, &mappings_);
    validator.validate(doc, doc.diagnostics);
  }

  result.summary = transform(doc);
  if (config_.writer.annotate_diagnostics) {
    attach_review_annotation(doc, config_.writer.annotation_cap, config_.writer.new_line);
  }

  UnifiedAstSerializer serializer(config_.writer);
  auto serialized = serializer.serialize_to_text(doc);
  result.output = std::move(serialized.text);

  // Document bag holds parse, validation and transformation diagnostics
  result.diagnostics.merge(doc.diagnostics);
  result.diagnostics.merge(std::move(serialized.diagnostics));
  result.document = std::move(parsed.document);
  return result;
}

ConversionResult Converter::convert_file(const std::filesystem::path & path) const
{
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    ConversionResult result;
    result.diagnostics.merge(setup_diags_);
    result.diagnostics.add_error(
      codes::k_xml_parse_error, "cannot open file: " + path.string(), path.string());
    return result;
  }
  const std::string text((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
  return convert_text(text, path.string());
}

}  // namespace xaml_bridge
