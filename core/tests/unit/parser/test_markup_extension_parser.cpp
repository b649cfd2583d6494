#include <gtest/gtest.h>

#include <string>
#include <variant>

#include "xaml_bridge/parser/markup_extension_parser.hpp"

using namespace xaml_bridge;

namespace
{

std::unique_ptr<MarkupExtension> parse(const std::string & text)
{
  MarkupExtensionParser parser;
  return parser.parse(text);
}

}  // namespace

TEST(MarkupExtensionParserTest, DetectsExtensionSyntax)
{
  EXPECT_TRUE(MarkupExtensionParser::is_markup_extension("{Binding}"));
  EXPECT_TRUE(MarkupExtensionParser::is_markup_extension("  {StaticResource Brush} "));
  EXPECT_FALSE(MarkupExtensionParser::is_markup_extension("{}{0:N2}"));
  EXPECT_FALSE(MarkupExtensionParser::is_markup_extension("Hello"));
  EXPECT_FALSE(MarkupExtensionParser::is_markup_extension("{"));
}

TEST(MarkupExtensionParserTest, PositionalAndNamedArguments)
{
  auto ext = parse("{Binding Name, Mode=TwoWay}");
  ASSERT_TRUE(ext);
  EXPECT_EQ(ext->name, "Binding");
  EXPECT_EQ(ext->extension_kind(), MarkupExtensionKind::Binding);
  ASSERT_TRUE(ext->positional.has_value());
  EXPECT_EQ(*ext->positional->literal(), "Name");
  ASSERT_EQ(ext->parameters.size(), 1u);
  EXPECT_EQ(ext->parameters[0].name, "Mode");
  EXPECT_EQ(ext->literal_parameter("Mode"), "TwoWay");

  const auto * binding = std::get_if<BindingPayload>(&ext->payload);
  ASSERT_NE(binding, nullptr);
  EXPECT_EQ(binding->path, "Name");
  EXPECT_EQ(binding->mode, "TwoWay");
}

TEST(MarkupExtensionParserTest, NestedExtensionKeepsParent)
{
  auto ext = parse("{Binding Path=Items, Source={StaticResource Model}}");
  const MarkupExtensionArgument * source = ext->find_parameter("Source");
  ASSERT_NE(source, nullptr);
  ASSERT_TRUE(source->is_nested());

  MarkupExtension * nested = source->nested();
  EXPECT_EQ(nested->name, "StaticResource");
  EXPECT_EQ(nested->parent(), ext.get());

  const auto * resource = std::get_if<ResourcePayload>(&nested->payload);
  ASSERT_NE(resource, nullptr);
  EXPECT_EQ(resource->resource_key, "Model");
  EXPECT_FALSE(resource->is_dynamic);
}

TEST(MarkupExtensionParserTest, NestedExtensionRoundTripsThroughToString)
{
  const std::string text = "{Binding Path=Items, RelativeSource={RelativeSource AncestorType={x:Type Window}}}";
  auto ext = parse(text);
  EXPECT_EQ(ext->to_string(), text);

  auto again = parse(ext->to_string());
  EXPECT_EQ(again->to_string(), text);
}

TEST(MarkupExtensionParserTest, QuotedStringFormatKeepsQuotes)
{
  auto ext = parse("{Binding StringFormat='{0}'}");
  const MarkupExtensionArgument * format = ext->find_parameter("StringFormat");
  ASSERT_NE(format, nullptr);
  EXPECT_FALSE(format->is_nested());
  EXPECT_EQ(*format->literal(), "{0}");
  EXPECT_EQ(format->quote, '\'');
  EXPECT_EQ(ext->to_string(), "{Binding StringFormat='{0}'}");
}

TEST(MarkupExtensionParserTest, LiteralEscapeIsNotAnExtension)
{
  auto ext = parse("{Binding Price, StringFormat={}{0:C}}");
  const MarkupExtensionArgument * format = ext->find_parameter("StringFormat");
  ASSERT_NE(format, nullptr);
  EXPECT_FALSE(format->is_nested());
  EXPECT_EQ(*format->literal(), "{}{0:C}");
}

TEST(MarkupExtensionParserTest, BackslashEscapesInQuotedValue)
{
  auto ext = parse(R"({Binding ConverterParameter='It\'s'})");
  EXPECT_EQ(ext->literal_parameter("ConverterParameter"), "It's");
}

TEST(MarkupExtensionParserTest, PrefixedExtensionName)
{
  auto ext = parse("{x:Static local:Settings.Default}");
  EXPECT_EQ(ext->local_name(), "Static");
  EXPECT_EQ(ext->extension_kind(), MarkupExtensionKind::Static);

  auto type = parse("{x:Type local:Widget}");
  const auto * payload = std::get_if<TypeReferencePayload>(&type->payload);
  ASSERT_NE(payload, nullptr);
  EXPECT_EQ(payload->prefix, "local");
  EXPECT_EQ(payload->type_name, "Widget");
}

TEST(MarkupExtensionParserTest, EmptyExtension)
{
  auto ext = parse("{x:Null}");
  EXPECT_EQ(ext->extension_kind(), MarkupExtensionKind::Null);
  EXPECT_FALSE(ext->positional.has_value());
  EXPECT_TRUE(ext->parameters.empty());
  EXPECT_EQ(ext->to_string(), "{x:Null}");
}

TEST(MarkupExtensionParserTest, MalformedInputThrowsWithOffset)
{
  MarkupExtensionParser parser;
  EXPECT_THROW((void)parser.parse("{Binding Path=Name"), MarkupExtensionParseError);
  EXPECT_THROW((void)parser.parse("{}"), MarkupExtensionParseError);
  EXPECT_THROW((void)parser.parse("{Binding A, B}"), MarkupExtensionParseError);

  try {
    (void)parser.parse("{Binding Path='open}");
    FAIL() << "expected MarkupExtensionParseError";
  } catch (const MarkupExtensionParseError & e) {
    EXPECT_GT(e.offset(), 0u);
  }
}
