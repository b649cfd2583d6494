#include <gtest/gtest.h>

#include <filesystem>
#include <nlohmann/json.hpp>

#include "xaml_bridge/semantic/type_catalog.hpp"

using namespace xaml_bridge;

namespace
{

class TypeCatalogTest : public ::testing::Test
{
protected:
  void SetUp() override { catalog_.register_builtins(); }

  const TypeDescriptor & wpf(const char * name) const
  {
    const auto * t = catalog_.find_type(k_wpf_presentation_namespace, name);
    EXPECT_NE(t, nullptr) << name;
    return *t;
  }

  TypeCatalog catalog_;
};

}  // namespace

TEST_F(TypeCatalogTest, BuiltinTypesCarryClrNames)
{
  EXPECT_EQ(wpf("Button").clr_name(), "System.Windows.Controls.Button");
  EXPECT_EQ(wpf("Window").clr_name(), "System.Windows.Window");
  EXPECT_EQ(wpf("ToggleButton").clr_name(), "System.Windows.Controls.Primitives.ToggleButton");
  EXPECT_EQ(catalog_.find_type(k_xaml_language_namespace, "Button"), nullptr);
  EXPECT_EQ(catalog_.find_type("Style")->name, "Style");
  EXPECT_EQ(catalog_.find_type("NoSuchControl"), nullptr);
}

TEST_F(TypeCatalogTest, PropertiesResolveThroughBaseChain)
{
  const auto click = catalog_.resolve_property(wpf("Button"), "Click");
  ASSERT_TRUE(click.has_value());
  EXPECT_EQ(click->declaring_type, "ButtonBase");
  EXPECT_EQ(click->property_type, "event");

  const auto margin = catalog_.resolve_property(wpf("CheckBox"), "Margin");
  ASSERT_TRUE(margin.has_value());
  EXPECT_EQ(margin->declaring_type, "FrameworkElement");
  EXPECT_EQ(margin->property_type, "Thickness");

  const auto row = catalog_.resolve_property(wpf("Grid"), "Row");
  ASSERT_TRUE(row.has_value());
  EXPECT_TRUE(row->is_attached);

  EXPECT_FALSE(catalog_.resolve_property(wpf("Button"), "Orientation").has_value());
}

TEST_F(TypeCatalogTest, ContentPropertyIsInherited)
{
  EXPECT_EQ(catalog_.content_property(wpf("Button")), std::optional<std::string>("Content"));
  EXPECT_EQ(catalog_.content_property(wpf("StackPanel")), std::optional<std::string>("Children"));
  EXPECT_EQ(catalog_.content_property(wpf("ListView")), std::optional<std::string>("Items"));
  EXPECT_FALSE(catalog_.content_property(wpf("Image")).has_value());

  const ResolvedType resolved = catalog_.to_resolved(wpf("Button"));
  EXPECT_EQ(resolved.clr_name, "System.Windows.Controls.Button");
  EXPECT_EQ(resolved.base_type, std::optional<std::string>("ButtonBase"));
  EXPECT_EQ(resolved.content_property, std::optional<std::string>("Content"));
  EXPECT_FALSE(resolved.is_markup_extension);
}

TEST_F(TypeCatalogTest, MarkupExtensionsFoundWithOrWithoutSuffix)
{
  const auto * binding = catalog_.find_markup_extension(k_wpf_presentation_namespace, "Binding");
  ASSERT_NE(binding, nullptr);
  EXPECT_EQ(binding->name, "BindingExtension");
  EXPECT_EQ(binding->positional_parameter, std::optional<std::string>("Path"));
  EXPECT_TRUE(binding->is_markup_extension);

  const auto * type = catalog_.find_markup_extension(k_xaml_language_namespace, "Type");
  ASSERT_NE(type, nullptr);
  EXPECT_EQ(type->positional_parameter, std::optional<std::string>("TypeName"));

  EXPECT_NE(
    catalog_.find_markup_extension(k_wpf_presentation_namespace, "StaticResourceExtension"),
    nullptr);
  EXPECT_EQ(catalog_.find_markup_extension(k_wpf_presentation_namespace, "Type"), nullptr);
}

TEST_F(TypeCatalogTest, MergeJsonExtendsCatalog)
{
  const size_t before = catalog_.size();
  const auto result = catalog_.merge_json(nlohmann::json::parse(R"({
    "types": [
      {"name": "Gauge", "clrNamespace": "Demo.Controls", "baseType": "Control",
       "properties": [{"name": "Reading", "type": "Double"},
                      {"name": "Band", "isAttached": true}]},
      {"name": "LocalizeExtension", "xmlNamespace": "clr-namespace:Demo",
       "isMarkupExtension": true, "positionalParameter": "Key"}
    ]
  })"));
  ASSERT_TRUE(result.success) << result.error;
  EXPECT_EQ(result.types_loaded, 2u);
  EXPECT_EQ(catalog_.size(), before + 2);

  const TypeDescriptor & gauge = wpf("Gauge");
  EXPECT_EQ(gauge.clr_name(), "Demo.Controls.Gauge");
  EXPECT_EQ(catalog_.resolve_property(gauge, "Reading")->declaring_type, "Gauge");
  EXPECT_EQ(catalog_.resolve_property(gauge, "Band")->property_type, "Object");
  EXPECT_EQ(catalog_.resolve_property(gauge, "Background")->declaring_type, "Control");

  const auto * localize = catalog_.find_markup_extension("clr-namespace:Demo", "Localize");
  ASSERT_NE(localize, nullptr);
  EXPECT_EQ(localize->positional_parameter, std::optional<std::string>("Key"));
}

TEST_F(TypeCatalogTest, MergeJsonRejectsBadInput)
{
  EXPECT_FALSE(catalog_.merge_json(nlohmann::json::array()).success);
  EXPECT_FALSE(catalog_.merge_json(nlohmann::json{{"types", "Button"}}).success);

  const auto missing_name =
    catalog_.merge_json(nlohmann::json::parse(R"({"types": [{"clrNamespace": "Demo"}]})"));
  EXPECT_FALSE(missing_name.success);
  EXPECT_NE(missing_name.error.find("Invalid type catalog entry"), std::string::npos);

  const auto missing_file =
    catalog_.load_json(std::filesystem::temp_directory_path() / "xaml_bridge_no_catalog.json");
  EXPECT_FALSE(missing_file.success);
}
