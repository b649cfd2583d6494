#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <string>

#include "xaml_bridge/basic/diagnostic_codes.hpp"
#include "xaml_bridge/companion/companion_link_validator.hpp"
#include "xaml_bridge/driver/converter.hpp"

using namespace xaml_bridge;
namespace fs = std::filesystem;

namespace
{

constexpr const char * k_view =
  "<Window xmlns=\"http://schemas.microsoft.com/winfx/2006/xaml/presentation\"\n"
  "        xmlns:x=\"http://schemas.microsoft.com/winfx/2006/xaml\"\n"
  "        x:Class=\"Demo.MainWindow\" Title=\"Orders\">\n"
  "    <StackPanel>\n"
  "        <TextBlock Text=\"{Binding Header}\" Visibility=\"Collapsed\"/>\n"
  "        <ListView x:Name=\"Orders\"/>\n"
  "    </StackPanel>\n"
  "</Window>\n";

bool contains(const std::string & s, const std::string & needle)
{
  return s.find(needle) != std::string::npos;
}

fs::path write_temp(const std::string & name, const std::string & content)
{
  const fs::path path = fs::temp_directory_path() / name;
  std::ofstream out(path, std::ios::binary);
  out << content;
  return path;
}

}  // namespace

TEST(ConverterTest, ConvertsEndToEnd)
{
  const Converter converter;
  EXPECT_TRUE(converter.setup_diagnostics().empty());

  const auto result = converter.convert_text(k_view, "MainWindow.xaml");
  ASSERT_TRUE(result.success);
  ASSERT_NE(result.document, nullptr);
  EXPECT_FALSE(result.diagnostics.has_errors());

  const std::string & out = result.output;
  EXPECT_TRUE(contains(out, "<Window xmlns=\"https://github.com/avaloniaui\"\n")) << out;
  EXPECT_TRUE(contains(out, "xmlns:x=\"http://schemas.microsoft.com/winfx/2006/xaml\""));
  EXPECT_FALSE(contains(out, "winfx/2006/xaml/presentation"));
  EXPECT_TRUE(contains(out, "x:Class=\"Demo.MainWindow\" Title=\"Orders\">"));
  EXPECT_TRUE(contains(out, "<TextBlock Text=\"{Binding Header}\" IsVisible=\"False\"/>")) << out;
  EXPECT_TRUE(contains(out, "        <ListBox x:Name=\"Orders\"/>\n")) << out;

  EXPECT_GT(result.summary.rules_applied, 0u);
  EXPECT_TRUE(result.diagnostics.has_code(codes::k_type_requires_review));
  EXPECT_TRUE(result.diagnostics.has_code(codes::k_transform_complete));
  EXPECT_EQ(
    result.document->metadata.transformed_namespace,
    std::optional<std::string>("https://github.com/avaloniaui"));
}

TEST(ConverterTest, MalformedInputFails)
{
  const Converter converter;
  const auto result = converter.convert_text("<Window><Grid></Window>", "Broken.xaml");
  EXPECT_FALSE(result.success);
  EXPECT_EQ(result.document, nullptr);
  EXPECT_TRUE(result.output.empty());
  EXPECT_TRUE(result.diagnostics.has_code(codes::k_xml_parse_error));
}

TEST(ConverterTest, ParseOnlyLeavesTreeUntouched)
{
  const Converter converter;
  const auto result = converter.parse_only(k_view);
  ASSERT_TRUE(result.success);
  EXPECT_TRUE(result.output.empty());
  EXPECT_EQ(result.document->find_element_by_name("Orders")->type_name, "ListView");
  EXPECT_TRUE(result.document->transformation_trace.empty());
}

TEST(ConverterTest, MappingDatabaseTakesPriority)
{
  const fs::path db = write_temp(
    "xaml_bridge_converter_mappings.json",
    R"({"typeMappings": [{"wpfTypeName": "System.Windows.Controls.TextBlock",
                          "avaloniaTypeName": "SelectableTextBlock",
                          "simpleTypeName": "TextBlock"}]})");

  ConversionConfig config;
  config.mappings.file = db;
  const Converter converter(config);
  EXPECT_FALSE(converter.setup_diagnostics().has_errors());

  const auto result = converter.convert_text(k_view);
  ASSERT_TRUE(result.success);
  EXPECT_TRUE(contains(result.output, "<SelectableTextBlock ")) << result.output;
  EXPECT_TRUE(contains(result.output, "<ListBox ")) << result.output;
  fs::remove(db);
}

TEST(ConverterTest, BrokenMappingDatabaseIsReported)
{
  const fs::path db = write_temp("xaml_bridge_converter_broken.json", "[1, 2");

  ConversionConfig config;
  config.mappings.file = db;
  const Converter converter(config);
  EXPECT_TRUE(converter.setup_diagnostics().has_code(codes::k_mapping_load_failed));

  const auto result = converter.convert_text(k_view);
  EXPECT_TRUE(result.diagnostics.has_code(codes::k_mapping_load_failed));
  fs::remove(db);
}

TEST(ConverterTest, ConfiguredRenamesRunBeforeMappings)
{
  ConversionConfig config;
  config.transform.type_renames.push_back({"StackPanel", "WrapPanel", std::nullopt, std::nullopt});
  config.transform.property_renames.push_back({"Title", "Caption", std::string("Window")});
  const Converter converter(config);

  const auto result = converter.convert_text(k_view);
  ASSERT_TRUE(result.success);
  EXPECT_TRUE(contains(result.output, "<WrapPanel>")) << result.output;
  EXPECT_TRUE(contains(result.output, "</WrapPanel>"));
  EXPECT_TRUE(contains(result.output, "Caption=\"Orders\""));
}

TEST(ConverterTest, StructuralOnlyModeStillConverts)
{
  ConversionConfig config;
  config.parser.semantic = false;
  const Converter converter(config);

  const auto result = converter.convert_text(k_view);
  ASSERT_TRUE(result.success);
  EXPECT_TRUE(result.diagnostics.has_code(codes::k_merge_xml_only));
  EXPECT_TRUE(contains(result.output, "IsVisible=\"False\""));
}

TEST(ConverterTest, CompanionValidationRunsWithOracle)
{
  InMemoryCompanionOracle oracle;
  oracle.add_class({"Demo.MainWindow", {}});

  Converter converter;
  converter.set_companion_oracle(&oracle);
  const auto result = converter.convert_text(k_view);
  ASSERT_TRUE(result.success);
  EXPECT_TRUE(result.diagnostics.has_code(codes::k_companion_member_missing));
  ASSERT_TRUE(result.document->metadata.companion_class.has_value());
  EXPECT_EQ(result.document->metadata.companion_class->qualified_name, "Demo.MainWindow");
}

TEST(ConverterTest, AnnotationListsReviewItems)
{
  ConversionConfig config;
  config.writer.annotate_diagnostics = true;
  const Converter converter(config);

  const auto result = converter.convert_text(k_view);
  ASSERT_TRUE(result.success);
  EXPECT_TRUE(contains(result.output, "Manual Review Required"));
  EXPECT_TRUE(contains(result.output, std::string("[") + codes::k_type_requires_review + "]"));

  // The block also lives in the tree, after the root
  const auto & trailing = result.document->trailing_comments;
  ASSERT_EQ(trailing.size(), 1u);
  EXPECT_FALSE(trailing[0]->preserve);
  EXPECT_EQ(trailing[0]->placement, CommentPlacement::Standalone);
  EXPECT_TRUE(contains(trailing[0]->text, "Manual Review Required"));

  const size_t at = result.output.find("<!--");
  ASSERT_NE(at, std::string::npos);
  EXPECT_GT(at, result.output.find("</Window>"));
  EXPECT_EQ(result.output.find("<!--", at + 4), std::string::npos);
}

TEST(ConverterTest, RepeatedConversionIsDeterministic)
{
  const Converter converter;
  const auto first = converter.convert_text(k_view, "MainWindow.xaml");
  const auto second = converter.convert_text(k_view, "MainWindow.xaml");
  ASSERT_TRUE(first.success);
  ASSERT_TRUE(second.success);

  EXPECT_EQ(first.output, second.output);
  EXPECT_EQ(first.summary.rules_applied, second.summary.rules_applied);

  const auto & a = first.document->transformation_trace;
  const auto & b = second.document->transformation_trace;
  ASSERT_FALSE(a.empty());
  ASSERT_EQ(a.size(), b.size());
  for (size_t i = 0; i < a.size(); ++i) {
    EXPECT_EQ(a[i].rule_name, b[i].rule_name) << i;
    EXPECT_EQ(a[i].node_kind, b[i].node_kind) << i;
    EXPECT_EQ(a[i].description, b[i].description) << i;
    EXPECT_EQ(a[i].line, b[i].line) << i;
  }
}

TEST(ConverterTest, ConvertFileReadsFromDisk)
{
  const fs::path view = write_temp("xaml_bridge_converter_view.xaml", k_view);
  const Converter converter;

  const auto result = converter.convert_file(view);
  ASSERT_TRUE(result.success);
  EXPECT_EQ(result.document->file_path, view.string());
  fs::remove(view);

  const auto missing = converter.convert_file(fs::temp_directory_path() / "xaml_bridge_missing.xaml");
  EXPECT_FALSE(missing.success);
  EXPECT_TRUE(missing.diagnostics.has_code(codes::k_xml_parse_error));
}
