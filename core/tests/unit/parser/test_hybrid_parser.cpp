#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "xaml_bridge/basic/diagnostic_codes.hpp"
#include "xaml_bridge/parser/hybrid_parser.hpp"
#include "xaml_bridge/semantic/type_catalog.hpp"

using namespace xaml_bridge;

namespace
{

constexpr const char * k_view =
  "<UserControl xmlns=\"http://schemas.microsoft.com/winfx/2006/xaml/presentation\"\n"
  "             xmlns:x=\"http://schemas.microsoft.com/winfx/2006/xaml\">\n"
  "  <StackPanel>\n"
  "    <Button Content=\"{Binding Title}\" Click=\"OnClick\" Grid.Column=\"1\"/>\n"
  "  </StackPanel>\n"
  "</UserControl>\n";

class HybridParserTest : public ::testing::Test
{
protected:
  void SetUp() override { catalog_.register_builtins(); }

  TypeCatalog catalog_;
};

}  // namespace

TEST_F(HybridParserTest, SemanticEnrichmentResolvesTypes)
{
  HybridParser parser(catalog_);
  auto result = parser.parse(k_view, "View.xaml");
  ASSERT_TRUE(result.success());
  EXPECT_TRUE(result.semantic_applied);
  EXPECT_EQ(result.final_state, HybridParseState::Done);
  EXPECT_EQ(parser.state(), HybridParseState::Done);
  EXPECT_EQ(result.enriched_elements, 3u);

  const Element * root = result.document->root();
  ASSERT_TRUE(root->resolved_type.has_value());
  EXPECT_EQ(root->resolved_type->clr_name, "System.Windows.Controls.UserControl");

  const Element * button = root->children()[0]->children()[0].get();
  ASSERT_TRUE(button->resolved_type.has_value());
  EXPECT_EQ(button->resolved_type->base_type, "ButtonBase");

  const Property * click = button->find_property("Click");
  ASSERT_NE(click, nullptr);
  ASSERT_TRUE(click->resolved_property.has_value());
  EXPECT_EQ(click->resolved_property->property_type, "event");
  EXPECT_EQ(click->resolved_property->declaring_type, "ButtonBase");
}

TEST_F(HybridParserTest, EnrichmentKeepsFormattingHints)
{
  HybridParser parser(catalog_);
  auto result = parser.parse(k_view);
  ASSERT_TRUE(result.success());

  const Element * button = result.document->root()->children()[0]->children()[0].get();
  const Property * content = button->find_property("Content");
  ASSERT_NE(content, nullptr);
  EXPECT_EQ(content->hints.original_text, "Content=\"{Binding Title}\"");
  ASSERT_NE(content->markup_extension(), nullptr);
  EXPECT_EQ(content->markup_extension()->to_string(), "{Binding Title}");
  EXPECT_EQ(button->properties().size(), 3u);
}

TEST_F(HybridParserTest, StructuralOnlyWhenSemanticDisabled)
{
  HybridParserOptions options;
  options.enable_semantic = false;
  HybridParser parser(catalog_, options);

  auto result = parser.parse(k_view);
  ASSERT_TRUE(result.success());
  EXPECT_FALSE(result.semantic_applied);
  EXPECT_EQ(result.final_state, HybridParseState::StructuralOnly);
  EXPECT_TRUE(result.diagnostics.has_code(codes::k_merge_xml_only));
  EXPECT_FALSE(result.document->root()->resolved_type.has_value());
}

TEST_F(HybridParserTest, UnknownTypeIsWarningNotFailure)
{
  HybridParser parser(catalog_);
  auto result = parser.parse(
    "<Grid xmlns=\"http://schemas.microsoft.com/winfx/2006/xaml/presentation\">"
    "<FancyChart/></Grid>");
  ASSERT_TRUE(result.success());
  EXPECT_TRUE(result.diagnostics.has_code(codes::k_semantic_type_unresolved));
  EXPECT_TRUE(result.diagnostics.errors().empty());
  EXPECT_FALSE(result.document->root()->children()[0]->resolved_type.has_value());
}

TEST_F(HybridParserTest, EmptyInputFails)
{
  HybridParser parser(catalog_);
  auto result = parser.parse("  \n ");
  EXPECT_FALSE(result.success());
  EXPECT_EQ(result.final_state, HybridParseState::Failed);
  EXPECT_TRUE(result.diagnostics.has_code(codes::k_xaml_empty));
}

TEST_F(HybridParserTest, MalformedInputReportsErrorWithLocation)
{
  HybridParser parser(catalog_);
  auto result = parser.parse("<Window>\n  <Grid>\n</Window>\n", "Broken.xaml");
  EXPECT_FALSE(result.success());
  EXPECT_EQ(result.document, nullptr);

  const auto errors = result.diagnostics.errors();
  ASSERT_EQ(errors.size(), 1u);
  EXPECT_EQ(errors[0].code, codes::k_xml_parse_error);
  EXPECT_GE(errors[0].line, 1u);
  EXPECT_GE(errors[0].column, 1u);
  EXPECT_EQ(errors[0].file_path, "Broken.xaml");
}

TEST_F(HybridParserTest, DiagnosticsAreCopiedToDocument)
{
  HybridParser parser(catalog_);
  auto result = parser.parse(k_view);
  ASSERT_TRUE(result.success());
  EXPECT_TRUE(result.document->diagnostics.has_code(codes::k_parse_start));
  EXPECT_TRUE(result.document->diagnostics.has_code(codes::k_parse_success));
}

TEST_F(HybridParserTest, GroupParseIsIndependent)
{
  HybridParser parser(catalog_);
  const std::vector<ParseInput> inputs = {
    {"<Grid xmlns=\"http://schemas.microsoft.com/winfx/2006/xaml/presentation\"/>", "A.xaml"},
    {"<Grid>", "B.xaml"},
    {"<Border xmlns=\"http://schemas.microsoft.com/winfx/2006/xaml/presentation\"/>", "C.xaml"},
  };
  auto results = parser.parse_group(inputs);
  ASSERT_EQ(results.size(), 3u);
  EXPECT_TRUE(results[0].success());
  EXPECT_FALSE(results[1].success());
  EXPECT_TRUE(results[2].success());
  EXPECT_EQ(results[2].document->file_path, "C.xaml");
  EXPECT_FALSE(results[2].diagnostics.has_errors());
}
