#include <gtest/gtest.h>

#include <memory>
#include <string>

#include "xaml_bridge/basic/diagnostic_codes.hpp"
#include "xaml_bridge/companion/companion_link_validator.hpp"
#include "xaml_bridge/mapping/mapping_repository.hpp"
#include "xaml_bridge/parser/hybrid_parser.hpp"
#include "xaml_bridge/semantic/type_catalog.hpp"

using namespace xaml_bridge;

namespace
{

constexpr const char * k_window =
  "<Window xmlns=\"http://schemas.microsoft.com/winfx/2006/xaml/presentation\"\n"
  "        xmlns:x=\"http://schemas.microsoft.com/winfx/2006/xaml\"\n"
  "        x:Class=\"Demo.MainWindow\" Loaded=\"OnLoaded\">\n"
  "  <StackPanel>\n"
  "    <Button x:Name=\"SaveButton\" Click=\"OnSave\"/>\n"
  "    <TextBox x:Name=\"NameBox\"/>\n"
  "  </StackPanel>\n"
  "</Window>\n";

class CompanionLinkValidatorTest : public ::testing::Test
{
protected:
  void SetUp() override { catalog_.register_builtins(); }

  std::unique_ptr<Document> parse(const std::string & text, bool semantic = true)
  {
    HybridParserOptions options;
    options.enable_semantic = semantic;
    HybridParser parser(catalog_, options);
    return std::move(parser.parse(text, "MainWindow.xaml").document);
  }

  TypeCatalog catalog_;
};

size_t count_code(const DiagnosticBag & diags, const char * code)
{
  size_t n = 0;
  for (const auto & d : diags) {
    if (d.code == code) ++n;
  }
  return n;
}

}  // namespace

TEST_F(CompanionLinkValidatorTest, AllMembersPresent)
{
  auto doc = parse(k_window);
  ASSERT_NE(doc, nullptr);

  InMemoryCompanionOracle oracle;
  oracle.add_class({"Demo.MainWindow", {"SaveButton", "NameBox", "OnSave", "OnLoaded"}});

  DiagnosticBag diags;
  const auto report = CompanionLinkValidator(oracle).validate(*doc, diags);
  EXPECT_TRUE(report.has_class_directive);
  EXPECT_TRUE(report.class_found);
  EXPECT_EQ(report.named_elements_checked, 2u);
  EXPECT_EQ(report.handlers_checked, 2u);
  EXPECT_EQ(report.missing_members, 0u);
  EXPECT_TRUE(diags.warnings().empty());
  EXPECT_TRUE(diags.has_code(codes::k_companion_class_valid));
  EXPECT_TRUE(diags.has_code(codes::k_companion_link_summary));

  ASSERT_TRUE(doc->metadata.companion_class.has_value());
  EXPECT_EQ(doc->metadata.companion_class->qualified_name, "Demo.MainWindow");
  EXPECT_EQ(doc->metadata.companion_class->members.size(), 4u);
}

TEST_F(CompanionLinkValidatorTest, MissingMembersWarnAtElement)
{
  auto doc = parse(k_window);
  ASSERT_NE(doc, nullptr);

  InMemoryCompanionOracle oracle;
  oracle.add_class({"Demo.MainWindow", {"SaveButton", "OnLoaded"}});

  DiagnosticBag diags;
  const auto report = CompanionLinkValidator(oracle).validate(*doc, diags);
  EXPECT_EQ(report.missing_members, 2u);
  EXPECT_EQ(count_code(diags, codes::k_companion_member_missing), 2u);

  bool located_name_box = false;
  for (const auto & w : diags.warnings()) {
    if (w.message.find("NameBox") != std::string::npos) {
      EXPECT_EQ(w.line, 6u);
      located_name_box = true;
    }
  }
  EXPECT_TRUE(located_name_box);
}

TEST_F(CompanionLinkValidatorTest, HandlersFoundThroughEventMappingsWithoutSemantics)
{
  auto doc = parse(k_window, false);
  ASSERT_NE(doc, nullptr);

  InMemoryCompanionOracle oracle;
  oracle.add_class({"Demo.MainWindow", {"SaveButton", "NameBox"}});

  DiagnosticBag without_repo;
  EXPECT_EQ(CompanionLinkValidator(oracle).validate(*doc, without_repo).handlers_checked, 0u);

  InMemoryMappingRepository repo;
  register_default_mappings(repo);
  DiagnosticBag with_repo;
  const auto report = CompanionLinkValidator(oracle, &repo).validate(*doc, with_repo);
  EXPECT_EQ(report.handlers_checked, 1u);
  EXPECT_EQ(report.missing_members, 1u);
}

TEST_F(CompanionLinkValidatorTest, UnknownClassWarns)
{
  auto doc = parse(k_window);
  ASSERT_NE(doc, nullptr);

  InMemoryCompanionOracle oracle;
  DiagnosticBag diags;
  const auto report = CompanionLinkValidator(oracle).validate(*doc, diags);
  EXPECT_TRUE(report.has_class_directive);
  EXPECT_FALSE(report.class_found);
  EXPECT_TRUE(diags.has_code(codes::k_companion_class_missing));
  EXPECT_FALSE(doc->metadata.companion_class.has_value());
}

TEST_F(CompanionLinkValidatorTest, NoClassDirective)
{
  auto doc = parse("<Grid xmlns=\"http://schemas.microsoft.com/winfx/2006/xaml/presentation\"/>");
  ASSERT_NE(doc, nullptr);

  InMemoryCompanionOracle oracle;
  DiagnosticBag diags;
  const auto report = CompanionLinkValidator(oracle).validate(*doc, diags);
  EXPECT_FALSE(report.has_class_directive);
  EXPECT_TRUE(diags.has_code(codes::k_companion_no_class));
  EXPECT_FALSE(diags.has_code(codes::k_companion_link_summary));
}

TEST_F(CompanionLinkValidatorTest, TreeIsNotModified)
{
  auto doc = parse(k_window);
  ASSERT_NE(doc, nullptr);
  const size_t before = doc->root()->descendants().size();

  InMemoryCompanionOracle oracle;
  oracle.add_class({"Demo.MainWindow", {}});
  DiagnosticBag diags;
  CompanionLinkValidator(oracle).validate(*doc, diags);

  EXPECT_EQ(doc->root()->descendants().size(), before);
  EXPECT_NE(doc->root()->find_property("Loaded"), nullptr);
  EXPECT_EQ(doc->find_element_by_name("SaveButton")->type_name, "Button");
}
