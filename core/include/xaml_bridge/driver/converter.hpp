// xaml_bridge/driver/converter.hpp - Conversion driver
//
// Single entry point for the parse -> transform -> serialize pipeline.
// Used by the CLI and can be embedded into other tools.
//
#pragma once

#include <filesystem>
#include <memory>
#include <string>
#include <string_view>

#include "xaml_bridge/ast/unified_ast.hpp"
#include "xaml_bridge/basic/diagnostic.hpp"
#include "xaml_bridge/companion/companion_link_validator.hpp"
#include "xaml_bridge/config/conversion_config.hpp"
#include "xaml_bridge/mapping/mapping_repository.hpp"
#include "xaml_bridge/semantic/type_catalog.hpp"
#include "xaml_bridge/transform/transformation_engine.hpp"

namespace xaml_bridge
{

// ============================================================================
// Conversion Result
// ============================================================================

struct ConversionResult
{
  /// Structural parse succeeded (warnings and errors of later stages may exist)
  bool success = false;

  /// Serialized target markup (empty when parsing or serialization failed)
  std::string output;

  /// Transformed document (null when the structural parse failed)
  std::unique_ptr<Document> document;

  /// Every diagnostic of the run, in the order stages produced them
  DiagnosticBag diagnostics;

  TransformationSummary summary;
};

// ============================================================================
// Converter
// ============================================================================

/**
 * Conversion driver that runs one document through the whole pipeline:
 * 1. Hybrid parse (structural, then semantic enrichment if enabled)
 * 2. Companion link validation (when an oracle is set)
 * 3. Namespace rewrite pass
 * 4. Rule pass: configured renames plus the mapping-driven rule set
 * 5. Serialization with the configured writer options
 *
 * The type catalog and mapping repository are built once per converter and
 * shared by every conversion it runs.
 */
class Converter
{
public:
  explicit Converter(ConversionConfig config = {});

  Converter(const Converter &) = delete;
  Converter & operator=(const Converter &) = delete;

  /// Diagnostics from loading the catalog and mapping database
  [[nodiscard]] const DiagnosticBag & setup_diagnostics() const noexcept { return setup_diags_; }

  /// Companion oracle consulted before transformation (not owned, may be null)
  void set_companion_oracle(const CompanionCodeOracle * oracle) noexcept { oracle_ = oracle; }

  [[nodiscard]] ConversionResult convert_text(
    std::string_view text, const std::string & file_path = {}) const;

  [[nodiscard]] ConversionResult convert_file(const std::filesystem::path & path) const;

  /// Parse only, without transformation or serialization
  [[nodiscard]] ConversionResult parse_only(
    std::string_view text, const std::string & file_path = {}) const;

  [[nodiscard]] const ConversionConfig & config() const noexcept { return config_; }
  [[nodiscard]] const TypeCatalog & catalog() const noexcept { return catalog_; }
  [[nodiscard]] const MappingRepository & mappings() const noexcept { return mappings_; }

private:
  void load_catalog();
  void load_mappings();

  /// Rules for the main pass, configured renames first
  [[nodiscard]] TransformationEngine build_engine() const;

  /// Run both transformation passes; exceptions become TRANSFORM_RULE_FAILED
  TransformationSummary transform(Document & doc) const;

  ConversionConfig config_;
  TypeCatalog catalog_;
  JsonMappingRepository mappings_;
  DiagnosticBag setup_diags_;
  const CompanionCodeOracle * oracle_ = nullptr;
};

}  // namespace xaml_bridge
