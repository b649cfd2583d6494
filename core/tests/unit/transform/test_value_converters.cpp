#include <gtest/gtest.h>

#include <cctype>
#include <string>

#include "xaml_bridge/transform/value_converters.hpp"

using namespace xaml_bridge;

TEST(ValueConverterRegistryTest, VisibilityToBool)
{
  const ValueConverterRegistry registry;
  ASSERT_TRUE(registry.contains("VisibilityToBool"));

  auto visible = registry.convert("VisibilityToBool", "Visible");
  ASSERT_TRUE(visible.has_value());
  EXPECT_EQ(visible->value, "True");
  EXPECT_FALSE(visible->warning.has_value());

  auto collapsed = registry.convert("VisibilityToBool", "Collapsed");
  EXPECT_EQ(collapsed->value, "False");
  EXPECT_FALSE(collapsed->warning.has_value());
}

TEST(ValueConverterRegistryTest, HiddenLosesInformation)
{
  const ValueConverterRegistry registry;
  auto hidden = registry.convert("VisibilityToBool", "Hidden");
  ASSERT_TRUE(hidden.has_value());
  EXPECT_EQ(hidden->value, "False");
  EXPECT_TRUE(hidden->warning.has_value());
}

TEST(ValueConverterRegistryTest, UnrecognizedValueIsKept)
{
  const ValueConverterRegistry registry;
  auto odd = registry.convert("VisibilityToBool", "{Binding Shown}");
  ASSERT_TRUE(odd.has_value());
  EXPECT_EQ(odd->value, "{Binding Shown}");
  EXPECT_TRUE(odd->warning.has_value());
}

TEST(ValueConverterRegistryTest, NegateBoolIgnoresCase)
{
  const ValueConverterRegistry registry;
  EXPECT_EQ(registry.convert("NegateBool", "true")->value, "False");
  EXPECT_EQ(registry.convert("NegateBool", "FALSE")->value, "True");

  auto other = registry.convert("NegateBool", "Maybe");
  EXPECT_EQ(other->value, "Maybe");
  EXPECT_TRUE(other->warning.has_value());
}

TEST(ValueConverterRegistryTest, UnknownTagAndCustomConverters)
{
  ValueConverterRegistry registry;
  EXPECT_FALSE(registry.contains("Upper"));
  EXPECT_FALSE(registry.convert("Upper", "abc").has_value());

  registry.register_converter("Upper", [](std::string_view v) {
    std::string out(v);
    for (auto & c : out) c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    return ValueConversion{out, std::nullopt};
  });
  ASSERT_TRUE(registry.contains("Upper"));
  EXPECT_EQ(registry.convert("Upper", "abc")->value, "ABC");
}
