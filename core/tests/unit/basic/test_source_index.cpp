#include <gtest/gtest.h>

#include "xaml_bridge/basic/source_index.hpp"

using namespace xaml_bridge;

TEST(SourceIndexTest, EveryTerminatorEndsOneLine)
{
  const SourceIndex index("<A>\r\n<B/>\r<C/>\n</A>");
  EXPECT_EQ(index.line_count(), 4u);
  EXPECT_EQ(index.line_start(2), 5u);
  EXPECT_EQ(index.line_start(3), 10u);
  EXPECT_EQ(index.line_start(4), 15u);
  EXPECT_EQ(index.line_text(1), "<A>");
  EXPECT_EQ(index.line_text(2), "<B/>");
  EXPECT_EQ(index.line_text(4), "</A>");
  EXPECT_EQ(index.line_text(9), "");
}

TEST(SourceIndexTest, EmptyTextHasOneLine)
{
  const SourceIndex index;
  EXPECT_EQ(index.line_count(), 1u);
  EXPECT_EQ(index.line_start(1), 0u);
  EXPECT_EQ(index.line_start(2), 0u);
}

TEST(SourceIndexTest, ParserColumnsLandOnTagOpen)
{
  const SourceIndex index("<Grid>\n    <Button/>\n</Grid>");
  // Parsers report the column of the tag name
  const uint32_t offset = index.character_position(2, 6);
  EXPECT_EQ(index.text()[offset], '<');
  EXPECT_EQ(offset, 11u);

  EXPECT_EQ(index.character_position(1, 1), 0u);
  EXPECT_EQ(index.character_position(7, 1), index.size());
}

TEST(SourceIndexTest, OffsetsMapBackToLineColumn)
{
  const SourceIndex index("<Grid>\n    <Button/>\n</Grid>");
  const LineColumn lc = index.line_column(11);
  EXPECT_EQ(lc.line, 2u);
  EXPECT_EQ(lc.column, 5u);
  EXPECT_TRUE(lc.is_valid());

  const LineColumn past_end = index.line_column(1000);
  EXPECT_EQ(past_end.line, 3u);
  EXPECT_EQ(past_end.column, 8u);
}

TEST(SourceIndexTest, SliceClampsToText)
{
  const SourceIndex index("<Grid/>");
  EXPECT_EQ(index.slice(1, 5), "Grid");
  EXPECT_EQ(index.slice(1, 100), "Grid/>");
  EXPECT_EQ(index.slice(50, 60), "");
  EXPECT_EQ(index.slice(SourceRange()), "");

  SourceIndex reused;
  reused.set_text("a\nb");
  EXPECT_EQ(reused.line_count(), 2u);
  EXPECT_EQ(reused.line_text(2), "b");
}
