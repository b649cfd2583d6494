#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <string>

#include "xaml_bridge/config/conversion_config.hpp"

using namespace xaml_bridge;
namespace fs = std::filesystem;

TEST(ConversionConfigTest, EmptyTextGivesDefaults)
{
  const auto result = parse_conversion_config("");
  ASSERT_TRUE(result.success) << result.error;
  EXPECT_TRUE(result.config.parser.semantic);
  EXPECT_TRUE(result.config.mappings.builtin);
  EXPECT_FALSE(result.config.mappings.file.has_value());
  EXPECT_TRUE(result.config.transform.rewrite_namespaces);
  EXPECT_TRUE(result.config.writer.preserve_formatting);
  EXPECT_EQ(result.config.writer.indent_string, "    ");
}

TEST(ConversionConfigTest, ParsesAllSections)
{
  const std::string yaml = R"(
parser:
  semantic: false
  type_catalog: types/extra.json
mappings:
  builtin: false
  file: /opt/mappings.json
transform:
  report_unmapped_types: false
  report_unmapped_properties: true
  rewrite_namespaces: false
  type_renames:
    - from: Gauge
      to: Meter
      target_namespace: clr-namespace:Modern
  property_renames:
    - from: Reading
      to: Value
      element: Gauge
writer:
  preserve_formatting: false
  use_target_namespace: true
  target_namespace: https://github.com/avaloniaui
  annotate_diagnostics: true
  annotation_cap: 5
  indent: 2
  max_line_length: 80
)";
  const auto result = parse_conversion_config(yaml, "/work/project");
  ASSERT_TRUE(result.success) << result.error;
  const ConversionConfig & c = result.config;

  EXPECT_FALSE(c.parser.semantic);
  EXPECT_EQ(c.parser.type_catalog, fs::path("/work/project") / "types/extra.json");
  EXPECT_FALSE(c.mappings.builtin);
  EXPECT_EQ(c.mappings.file, fs::path("/opt/mappings.json"));

  EXPECT_FALSE(c.transform.options.report_unmapped_types);
  EXPECT_TRUE(c.transform.options.report_unmapped_properties);
  EXPECT_FALSE(c.transform.rewrite_namespaces);
  ASSERT_EQ(c.transform.type_renames.size(), 1u);
  EXPECT_EQ(c.transform.type_renames[0].from, "Gauge");
  EXPECT_EQ(c.transform.type_renames[0].to, "Meter");
  EXPECT_FALSE(c.transform.type_renames[0].source_namespace.has_value());
  EXPECT_EQ(c.transform.type_renames[0].target_namespace, std::optional<std::string>("clr-namespace:Modern"));
  ASSERT_EQ(c.transform.property_renames.size(), 1u);
  EXPECT_EQ(c.transform.property_renames[0].element, std::optional<std::string>("Gauge"));

  EXPECT_FALSE(c.writer.preserve_formatting);
  EXPECT_TRUE(c.writer.use_target_namespace);
  EXPECT_EQ(c.writer.target_namespace, std::optional<std::string>("https://github.com/avaloniaui"));
  EXPECT_TRUE(c.writer.annotate_diagnostics);
  EXPECT_EQ(c.writer.annotation_cap, 5u);
  EXPECT_EQ(c.writer.indent_string, "  ");
  EXPECT_EQ(c.writer.max_line_length, 80u);
}

TEST(ConversionConfigTest, IndentMayBeLiteralString)
{
  const auto result = parse_conversion_config("writer:\n  indent: \"\\t\"\n");
  ASSERT_TRUE(result.success) << result.error;
  EXPECT_EQ(result.config.writer.indent_string, "\t");
}

TEST(ConversionConfigTest, InvalidShapesFail)
{
  EXPECT_FALSE(parse_conversion_config("- a\n- b\n").success);
  EXPECT_FALSE(parse_conversion_config("transform:\n  type_renames: Gauge\n").success);
  EXPECT_FALSE(parse_conversion_config("transform:\n  property_renames:\n    - from: A\n").success);
  EXPECT_FALSE(parse_conversion_config("writer:\n  indent: [1, 2]\n").success);

  const auto bad_yaml = parse_conversion_config("parser: [unclosed");
  EXPECT_FALSE(bad_yaml.success);
  EXPECT_NE(bad_yaml.error.find("failed to parse YAML"), std::string::npos);

  const auto bad_type = parse_conversion_config("parser:\n  semantic: maybe\n");
  EXPECT_FALSE(bad_type.success);
}

TEST(ConversionConfigTest, LoadAndFindFromFile)
{
  const fs::path root = fs::temp_directory_path() / "xaml_bridge_config_test";
  const fs::path nested = root / "Views" / "Dialogs";
  fs::remove_all(root);
  fs::create_directories(nested);
  {
    std::ofstream out(root / k_conversion_config_file_name);
    out << "mappings:\n  file: db/mappings.json\n";
  }

  const auto found = find_conversion_config(nested);
  ASSERT_TRUE(found.has_value());
  EXPECT_EQ(fs::canonical(*found), fs::canonical(root / k_conversion_config_file_name));

  const auto loaded = load_conversion_config(*found);
  ASSERT_TRUE(loaded.success) << loaded.error;
  EXPECT_EQ(
    fs::weakly_canonical(*loaded.config.mappings.file),
    fs::weakly_canonical(root / "db" / "mappings.json"));

  EXPECT_FALSE(load_conversion_config(root / "missing.yaml").success);
  fs::remove_all(root);
}
