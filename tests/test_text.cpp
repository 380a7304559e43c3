#include "termtoast/text.hpp"
#include <gtest/gtest.h>

using namespace termtoast;

TEST(TextTest, DisplayWidthCountsCells) {
    EXPECT_EQ(display_width("abc"), 3);
    EXPECT_EQ(display_width(""), 0);
    EXPECT_EQ(display_width("日本"), 4);
    EXPECT_EQ(display_width("🐞"), 2);
    EXPECT_EQ(display_width("╭─╮"), 3);
    EXPECT_EQ(display_width("e\xCC\x81"), 1); // e + combining acute
}

TEST(TextTest, SplitGlyphsKeepsMultibyteSequences) {
    auto glyphs = split_glyphs("a✖b");
    ASSERT_EQ(glyphs.size(), 3u);
    EXPECT_EQ(glyphs[1], "✖");
}

TEST(TextTest, SplitLinesDropsCarriageReturn) {
    auto lines = split_lines("one\r\ntwo\n");
    ASSERT_EQ(lines.size(), 3u);
    EXPECT_EQ(lines[0], "one");
    EXPECT_EQ(lines[1], "two");
    EXPECT_EQ(lines[2], "");
}

TEST(TextTest, WrapOnWordBoundaries) {
    auto lines = wrap_text("hello world again", 11);
    ASSERT_EQ(lines.size(), 2u);
    EXPECT_EQ(lines[0], "hello world");
    EXPECT_EQ(lines[1], "again");
}

TEST(TextTest, WrapBreaksLongWords) {
    auto lines = wrap_text("abcdefgh", 3);
    ASSERT_EQ(lines.size(), 3u);
    EXPECT_EQ(lines[0], "abc");
    EXPECT_EQ(lines[1], "def");
    EXPECT_EQ(lines[2], "gh");
}

TEST(TextTest, WrapKeepsExplicitNewlines) {
    auto lines = wrap_text("a\n\nb", 10);
    ASSERT_EQ(lines.size(), 3u);
    EXPECT_EQ(lines[0], "a");
    EXPECT_EQ(lines[1], "");
    EXPECT_EQ(lines[2], "b");
}

TEST(TextTest, WrapEmptyTextIsOneLine) {
    auto lines = wrap_text("", 5);
    ASSERT_EQ(lines.size(), 1u);
    EXPECT_EQ(lines[0], "");
}

TEST(TextTest, TruncateRespectsWideGlyphs) {
    EXPECT_EQ(truncate_to_width("日本語", 5), "日本");
    EXPECT_EQ(truncate_to_width("hello", 10), "hello");
    EXPECT_EQ(truncate_to_width("hello", 0), "");
}
