// xaml_bridge/config/conversion_config.hpp - Conversion configuration (xaml_bridge.yaml)
//
// Parses xaml_bridge.yaml, the per-project settings for the converter and
// the `xbc` command line.
//
#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "xaml_bridge/serialization/xaml_writer.hpp"
#include "xaml_bridge/transform/transformation_context.hpp"

namespace xaml_bridge
{

/// Default configuration file name
inline constexpr const char * k_conversion_config_file_name = "xaml_bridge.yaml";

// ============================================================================
// Configuration Structures
// ============================================================================

struct ParserConfig
{
  /// Run the semantic layer after the structural parse
  bool semantic = true;

  /// Extra type descriptors (JSON) merged into the built-in catalog
  std::optional<std::filesystem::path> type_catalog;
};

struct MappingsConfig
{
  /// JSON mapping database
  std::optional<std::filesystem::path> file;

  /// Seed the repository with the built-in mappings before loading `file`
  bool builtin = true;
};

/// One `transform.type_renames` entry
struct TypeRenameConfig
{
  std::string from;
  std::string to;
  std::optional<std::string> source_namespace;
  std::optional<std::string> target_namespace;
};

/// One `transform.property_renames` entry
struct PropertyRenameConfig
{
  std::string from;
  std::string to;

  /// Restrict the rename to elements of this type
  std::optional<std::string> element;
};

struct TransformConfig
{
  TransformOptions options;

  /// Rewrite namespace declarations through the namespace mappings first
  bool rewrite_namespaces = true;

  std::vector<TypeRenameConfig> type_renames;
  std::vector<PropertyRenameConfig> property_renames;
};

/**
 * Complete conversion configuration (xaml_bridge.yaml).
 */
struct ConversionConfig
{
  ParserConfig parser;
  MappingsConfig mappings;
  TransformConfig transform;
  XamlWriterOptions writer;

  /// Directory containing the configuration file (relative paths resolve here)
  std::filesystem::path config_root;
};

// ============================================================================
// Configuration Loading Result
// ============================================================================

struct ConfigLoadResult
{
  /// Loaded configuration (only valid if success == true)
  ConversionConfig config;

  bool success = false;

  std::string error;

  static ConfigLoadResult ok(ConversionConfig cfg)
  {
    ConfigLoadResult r;
    r.config = std::move(cfg);
    r.success = true;
    return r;
  }

  static ConfigLoadResult fail(std::string msg)
  {
    ConfigLoadResult r;
    r.error = std::move(msg);
    r.success = false;
    return r;
  }
};

// ============================================================================
// Configuration Loading API
// ============================================================================

/**
 * Load a conversion configuration from a YAML file.
 *
 * @param config_path Path to xaml_bridge.yaml
 * @return ConfigLoadResult with the loaded config or error message
 */
[[nodiscard]] ConfigLoadResult load_conversion_config(const std::filesystem::path & config_path);

/// Parse configuration text (relative paths resolve against `config_root`)
[[nodiscard]] ConfigLoadResult parse_conversion_config(
  const std::string & yaml_text, const std::filesystem::path & config_root = {});

/**
 * Find a configuration file by searching upward from a directory.
 *
 * @param start_dir Directory (or file) to start from
 * @return Path to the nearest xaml_bridge.yaml, or nullopt
 */
[[nodiscard]] std::optional<std::filesystem::path> find_conversion_config(
  const std::filesystem::path & start_dir);

}  // namespace xaml_bridge
