// xaml_bridge/config/conversion_config.cpp - Conversion configuration implementation
//
#include "xaml_bridge/config/conversion_config.hpp"

#include <yaml-cpp/yaml.h>

namespace xaml_bridge
{

namespace
{

std::filesystem::path resolve_path(const std::filesystem::path & root, const std::string & value)
{
  std::filesystem::path p(value);
  if (p.is_relative() && !root.empty()) p = root / p;
  return p;
}

template <typename T>
void read_if_present(const YAML::Node & section, const char * key, T & out)
{
  if (section[key]) out = section[key].as<T>();
}

std::optional<std::string> optional_string(const YAML::Node & node, const char * key)
{
  if (!node[key]) return std::nullopt;
  return node[key].as<std::string>();
}

/// Parse the 'transform' section
std::optional<std::string> parse_transform(const YAML::Node & node, TransformConfig & out)
{
  read_if_present(node, "report_unmapped_types", out.options.report_unmapped_types);
  read_if_present(node, "report_unmapped_properties", out.options.report_unmapped_properties);
  read_if_present(node, "rewrite_namespaces", out.rewrite_namespaces);

  if (const auto renames = node["type_renames"]) {
    if (!renames.IsSequence()) return "transform.type_renames must be a list";
    for (const auto & entry : renames) {
      if (!entry.IsMap() || !entry["from"] || !entry["to"]) {
        return "transform.type_renames entries need 'from' and 'to'";
      }
      TypeRenameConfig rename;
      rename.from = entry["from"].as<std::string>();
      rename.to = entry["to"].as<std::string>();
      rename.source_namespace = optional_string(entry, "source_namespace");
      rename.target_namespace = optional_string(entry, "target_namespace");
      out.type_renames.push_back(std::move(rename));
    }
  }

  if (const auto renames = node["property_renames"]) {
    if (!renames.IsSequence()) return "transform.property_renames must be a list";
    for (const auto & entry : renames) {
      if (!entry.IsMap() || !entry["from"] || !entry["to"]) {
        return "transform.property_renames entries need 'from' and 'to'";
      }
      PropertyRenameConfig rename;
      rename.from = entry["from"].as<std::string>();
      rename.to = entry["to"].as<std::string>();
      rename.element = optional_string(entry, "element");
      out.property_renames.push_back(std::move(rename));
    }
  }
  return std::nullopt;
}

/// Parse the 'writer' section
std::optional<std::string> parse_writer(const YAML::Node & node, XamlWriterOptions & out)
{
  read_if_present(node, "preserve_formatting", out.preserve_formatting);
  read_if_present(node, "preserve_comments", out.preserve_comments);
  read_if_present(node, "use_target_namespace", out.use_target_namespace);
  read_if_present(node, "annotate_diagnostics", out.annotate_diagnostics);
  read_if_present(node, "sort_attributes", out.sort_attributes);
  read_if_present(node, "self_closing", out.use_self_closing_tags);
  read_if_present(node, "xml_declaration", out.include_xml_declaration);
  read_if_present(node, "attributes_on_separate_lines", out.attributes_on_separate_lines);
  read_if_present(node, "transformation_comments", out.add_transformation_comments);
  read_if_present(node, "max_line_length", out.max_line_length);
  read_if_present(node, "annotation_cap", out.annotation_cap);
  out.target_namespace = optional_string(node, "target_namespace");

  if (const auto indent = node["indent"]) {
    // A number means that many spaces
    if (indent.IsScalar()) {
      const std::string raw = indent.as<std::string>();
      if (!raw.empty() && raw.find_first_not_of("0123456789") == std::string::npos) {
        out.indent_string = std::string(indent.as<size_t>(), ' ');
      } else {
        out.indent_string = raw;
      }
    } else {
      return "writer.indent must be a number or a string";
    }
  }
  return std::nullopt;
}

ConfigLoadResult parse_root(const YAML::Node & root, const std::filesystem::path & config_root)
{
  ConversionConfig config;
  config.config_root = config_root;

  if (!root || root.IsNull()) return ConfigLoadResult::ok(std::move(config));
  if (!root.IsMap()) return ConfigLoadResult::fail("configuration root must be a map");

  if (const auto parser = root["parser"]) {
    read_if_present(parser, "semantic", config.parser.semantic);
    if (parser["type_catalog"]) {
      config.parser.type_catalog =
        resolve_path(config_root, parser["type_catalog"].as<std::string>());
    }
  }

  if (const auto mappings = root["mappings"]) {
    read_if_present(mappings, "builtin", config.mappings.builtin);
    if (mappings["file"]) {
      config.mappings.file = resolve_path(config_root, mappings["file"].as<std::string>());
    }
  }

  if (const auto transform = root["transform"]) {
    if (auto error = parse_transform(transform, config.transform)) {
      return ConfigLoadResult::fail(*error);
    }
  }

  if (const auto writer = root["writer"]) {
    if (auto error = parse_writer(writer, config.writer)) return ConfigLoadResult::fail(*error);
  }

  return ConfigLoadResult::ok(std::move(config));
}

}  // namespace

ConfigLoadResult parse_conversion_config(
  const std::string & yaml_text, const std::filesystem::path & config_root)
{
  try {
    return parse_root(YAML::Load(yaml_text), config_root);
  } catch (const YAML::Exception & e) {
    return ConfigLoadResult::fail("failed to parse YAML: " + std::string(e.what()));
  }
}

ConfigLoadResult load_conversion_config(const std::filesystem::path & config_path)
{
  namespace fs = std::filesystem;

  if (!fs::exists(config_path)) {
    return ConfigLoadResult::fail("configuration file not found: " + config_path.string());
  }

  try {
    const YAML::Node root = YAML::LoadFile(config_path.string());
    return parse_root(root, fs::absolute(config_path).parent_path());
  } catch (const YAML::Exception & e) {
    return ConfigLoadResult::fail("failed to parse YAML: " + std::string(e.what()));
  }
}

std::optional<std::filesystem::path> find_conversion_config(const std::filesystem::path & start_dir)
{
  namespace fs = std::filesystem;

  fs::path current = fs::absolute(start_dir);
  if (fs::is_regular_file(current)) current = current.parent_path();

  while (true) {
    fs::path candidate = current / k_conversion_config_file_name;
    if (fs::exists(candidate)) return candidate;

    const fs::path parent = current.parent_path();
    if (parent == current) break;
    current = parent;
  }
  return std::nullopt;
}

}  // namespace xaml_bridge
