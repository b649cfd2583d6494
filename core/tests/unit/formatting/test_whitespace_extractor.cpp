#include <gtest/gtest.h>

#include <string>

#include "xaml_bridge/basic/source_index.hpp"
#include "xaml_bridge/formatting/whitespace_extractor.hpp"

using namespace xaml_bridge;

TEST(WhitespaceNormalizationTest, CollapsesBlankLinesToLastBreak)
{
  EXPECT_EQ(WhitespaceExtractor::normalize_leading_whitespace("\n\n\n    "), "\n    ");
  EXPECT_EQ(WhitespaceExtractor::normalize_leading_whitespace("\r\n  \r\n\t"), "\r\n\t");
}

TEST(WhitespaceNormalizationTest, KeepsSingleLineBreakAndSpaces)
{
  EXPECT_EQ(WhitespaceExtractor::normalize_leading_whitespace("\n  "), "\n  ");
  EXPECT_EQ(WhitespaceExtractor::normalize_leading_whitespace("   "), "   ");
  EXPECT_EQ(WhitespaceExtractor::normalize_leading_whitespace(""), "");
}

TEST(WhitespaceNormalizationTest, IsIdempotent)
{
  const char * samples[] = {"", " ", "\n", "\n\n", "\n  \n    ", "\r\n\r\n  ", "\t\n\t\n\t", "  \n"};
  for (const char * s : samples) {
    const std::string once = WhitespaceExtractor::normalize_leading_whitespace(s);
    EXPECT_EQ(WhitespaceExtractor::normalize_leading_whitespace(once), once) << "input: " << s;
  }
}

TEST(WhitespaceExtractorTest, LeadingWhitespaceBeforeTag)
{
  const SourceIndex index("<Grid>\n    <Button/>\n</Grid>");
  const WhitespaceExtractor ws(index);

  const uint32_t button = ws.find_tag_start("Button", 0);
  ASSERT_NE(button, WhitespaceExtractor::npos);
  EXPECT_EQ(ws.leading_whitespace(button), "\n    ");
}

TEST(WhitespaceExtractorTest, LeadingWhitespaceStopsAtFloor)
{
  const SourceIndex index("<A>\n\n  <B/></A>");
  const WhitespaceExtractor ws(index);

  const uint32_t b = ws.find_tag_start("B", 0);
  ASSERT_NE(b, WhitespaceExtractor::npos);
  EXPECT_EQ(ws.raw_leading_whitespace(b, b - 2), "  ");
  EXPECT_EQ(ws.raw_leading_whitespace(b), "\n\n  ");
  EXPECT_EQ(ws.leading_whitespace(b), "\n  ");
}

TEST(WhitespaceExtractorTest, TrailingWhitespace)
{
  const SourceIndex index("<A/>  \n<B/>");
  const WhitespaceExtractor ws(index);
  EXPECT_EQ(ws.trailing_whitespace(4), "  \n");
}

TEST(WhitespaceExtractorTest, FindTagStartSkipsComments)
{
  const SourceIndex index("<!-- <Button/> --><Button/>");
  const WhitespaceExtractor ws(index);
  EXPECT_EQ(ws.find_tag_start("Button", 0), 18u);
}

TEST(WhitespaceExtractorTest, FindTagStartRequiresNameBoundary)
{
  const SourceIndex index("<ButtonBase/><Button/>");
  const WhitespaceExtractor ws(index);
  EXPECT_EQ(ws.find_tag_start("Button", 0), 13u);
}

TEST(WhitespaceExtractorTest, ScanOpenTagAttributes)
{
  const SourceIndex index("<Button Content=\"OK\"\n        Width='80' />");
  const WhitespaceExtractor ws(index);

  const OpenTagScan scan = ws.scan_open_tag(0);
  ASSERT_TRUE(scan.ok);
  EXPECT_EQ(scan.name, "Button");
  EXPECT_TRUE(scan.self_closing);
  EXPECT_EQ(scan.tag_end_whitespace, " ");
  ASSERT_EQ(scan.attributes.size(), 2u);
  EXPECT_EQ(scan.attributes[0].name, "Content");
  EXPECT_EQ(scan.attributes[0].raw_value, "OK");
  EXPECT_EQ(scan.attributes[0].leading_whitespace, " ");
  EXPECT_EQ(scan.attributes[1].name, "Width");
  EXPECT_EQ(scan.attributes[1].quote, '\'');
  EXPECT_EQ(scan.attributes[1].leading_whitespace, "\n        ");
  EXPECT_EQ(scan.end, index.size());
}

TEST(WhitespaceExtractorTest, AttributeLeadingWhitespaceHints)
{
  const SourceIndex index("<Button\n    Content=\"OK\" Width=\"80\"/>");
  const WhitespaceExtractor ws(index);

  const FormattingHints content = ws.attribute_leading_whitespace("Content", 0);
  ASSERT_TRUE(content.leading_whitespace.has_value());
  EXPECT_EQ(*content.leading_whitespace, "\n    ");
  EXPECT_TRUE(content.preserve_line_break);

  const FormattingHints width = ws.attribute_leading_whitespace("Width", 0);
  ASSERT_TRUE(width.leading_whitespace.has_value());
  EXPECT_EQ(*width.leading_whitespace, " ");
  EXPECT_FALSE(width.preserve_line_break);

  const FormattingHints missing = ws.attribute_leading_whitespace("Height", 0);
  EXPECT_FALSE(missing.leading_whitespace.has_value());
}

TEST(WhitespaceExtractorTest, CloseTagAndComment)
{
  const SourceIndex index("<A><!-- note --></A>");
  const WhitespaceExtractor ws(index);

  const MarkupSpan comment = ws.find_comment(3);
  ASSERT_TRUE(comment.ok);
  EXPECT_EQ(index.slice(comment.begin, comment.end), "<!-- note -->");

  const MarkupSpan close = ws.find_close_tag("A", comment.end);
  ASSERT_TRUE(close.ok);
  EXPECT_EQ(index.slice(close.begin, close.end), "</A>");
}

TEST(WhitespaceExtractorTest, DeclarationOnlyAtStart)
{
  const SourceIndex with_decl("<?xml version=\"1.0\"?>\n<A/>");
  const MarkupSpan decl = WhitespaceExtractor(with_decl).find_declaration(0);
  ASSERT_TRUE(decl.ok);
  EXPECT_EQ(with_decl.slice(decl.begin, decl.end), "<?xml version=\"1.0\"?>");

  const SourceIndex without("<A/>");
  EXPECT_FALSE(WhitespaceExtractor(without).find_declaration(0).ok);
}
