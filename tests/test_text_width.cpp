#include <gtest/gtest.h>
#include "text/TextWidth.hpp"
#include <string>

using namespace text;

TEST(TextWidthTest, CountsAsciiCharacters) {
    EXPECT_EQ(visibleWidth("hello"), 5);
    EXPECT_EQ(visibleWidth(""), 0);
}

TEST(TextWidthTest, IgnoresSgrSequences) {
    EXPECT_EQ(visibleWidth("\x1b[31mred\x1b[0m"), 3);
    EXPECT_EQ(visibleWidth("\x1b[1m\x1b[31mbold red\x1b[0m"), 8);
    EXPECT_EQ(visibleWidth("\x1b[31m\x1b[0m"), 0);
}

TEST(TextWidthTest, IgnoresHyperlinks) {
    EXPECT_EQ(visibleWidth("\x1b]8;;http://example.com\x07link\x1b]8;;\x07"), 4);
}

TEST(TextWidthTest, WideGlyphsTakeTwoCells) {
    EXPECT_EQ(visibleWidth("你好"), 4);
    EXPECT_EQ(visibleWidth("hi你好"), 6);
}

TEST(TextWidthTest, BoxDrawingIsSingleWidth) {
    EXPECT_EQ(visibleWidth("┌──┐"), 4);
}

TEST(TextWidthTest, TabExpandsToThreeCells) {
    EXPECT_EQ(visibleWidth("\t"), 3);
    EXPECT_EQ(stripAnsi("a\tb"), "a   b");
}

TEST(TextWidthTest, StripAnsiKeepsOnlyGlyphs) {
    EXPECT_EQ(stripAnsi("\x1b[32mok\x1b[0m done"), "ok done");
}

TEST(TruncateTest, UnchangedWhenItFits) {
    EXPECT_EQ(truncateToWidth("hello", 10, "…"), "hello");
    EXPECT_EQ(truncateToWidth("hello", 5, "…"), "hello");
}

TEST(TruncateTest, HundredCharsAtFiftyEndWithMarker) {
    std::string line(100, 'x');
    auto out = truncateToWidth(line, 50, "…");

    EXPECT_EQ(visibleWidth(out), 50);
    EXPECT_EQ(out, std::string(49, 'x') + "…");
}

TEST(TruncateTest, PreservesAnsiAndResetsBeforeMarker) {
    auto out = truncateToWidth("\x1b[31mhello world\x1b[0m", 8, "…");
    EXPECT_LE(visibleWidth(out), 8);
    EXPECT_EQ(out.rfind("\x1b[31m", 0), 0u);
    EXPECT_NE(out.find("\x1b[0m…"), std::string::npos);
}

TEST(TruncateTest, ClosesOpenHyperlink) {
    std::string linked = "\x1b]8;;file:///test\x07long-filename.ts\x1b]8;;\x07";
    auto out = truncateToWidth(linked, 10, "…");
    EXPECT_LE(visibleWidth(out), 10);
    EXPECT_NE(out.find("\x1b]8;;\x07"), std::string::npos);
}

TEST(TruncateTest, WideGlyphNotSplit) {
    auto out = truncateToWidth("你好世界", 5, "…");
    EXPECT_EQ(out, "你好…");
    EXPECT_LE(visibleWidth(out), 5);
}

TEST(TruncateTest, TinyWidths) {
    EXPECT_EQ(truncateToWidth("hello", 1, "…"), "…");
    EXPECT_EQ(truncateToWidth("hello", 0, "…"), "");
    EXPECT_EQ(truncateToWidth("hello", 2, "..."), "he");
}

TEST(WrapTest, WrapsAtWordBoundaries) {
    auto lines = wrapText("hello world foo", 10);
    ASSERT_EQ(lines.size(), 2u);
    EXPECT_EQ(lines[0], "hello");
    EXPECT_EQ(lines[1], "world foo");
}

TEST(WrapTest, SplitsLongWords) {
    auto lines = wrapText("superlongword", 5);
    ASSERT_EQ(lines.size(), 3u);
    EXPECT_EQ(lines[0], "super");
    EXPECT_EQ(lines[1], "longw");
    EXPECT_EQ(lines[2], "ord");
}

TEST(WrapTest, HundredCharsAtFiftyHaveNoMarker) {
    auto lines = wrapText(std::string(100, 'x'), 50);
    ASSERT_EQ(lines.size(), 2u);
    for (auto& l : lines) {
        EXPECT_LE(visibleWidth(l), 50);
        EXPECT_EQ(l.find("…"), std::string::npos);
    }
}

TEST(WrapTest, EmptyStringIsOneEmptyLine) {
    auto lines = wrapText("", 80);
    ASSERT_EQ(lines.size(), 1u);
    EXPECT_EQ(lines[0], "");
}

TEST(WrapTest, HonorsNewlines) {
    auto lines = wrapText("one\ntwo\n\nfour", 80);
    ASSERT_EQ(lines.size(), 4u);
    EXPECT_EQ(lines[0], "one");
    EXPECT_EQ(lines[2], "");
    EXPECT_EQ(lines[3], "four");
}

TEST(WrapTest, KeepsLeadingIndentation) {
    auto lines = wrapText("  indented", 20);
    ASSERT_EQ(lines.size(), 1u);
    EXPECT_EQ(lines[0], "  indented");
}

TEST(WrapTest, CarriesStylesAcrossBreaks) {
    auto lines = wrapText("\x1b[31mhello world\x1b[0m", 8);
    ASSERT_EQ(lines.size(), 2u);
    EXPECT_EQ(lines[0], "\x1b[31mhello\x1b[0m");
    EXPECT_EQ(lines[1], "\x1b[31mworld\x1b[0m");
}

TEST(WrapTest, WideGlyphsRespectWidth) {
    for (auto& l : wrapText("你好世界测试", 5))
        EXPECT_LE(visibleWidth(l), 5);
}

TEST(SliceColumnsTest, ExtractsCells) {
    EXPECT_EQ(sliceColumns("abcdef", 2, 3), "cde");
    EXPECT_EQ(sliceColumns("abc", 1, 4), "bc  ");
}

TEST(SliceColumnsTest, KeepsEscapesBeforeEnd) {
    auto out = sliceColumns("\x1b[1mabcdef", 1, 2);
    EXPECT_EQ(out, "\x1b[1mbc");
}

TEST(SliceColumnsTest, ReplacesCutWideGlyphs) {
    auto out = sliceColumns("你好", 1, 2);
    EXPECT_EQ(out, "  ");
    EXPECT_EQ(visibleWidth(out), 2);
}

TEST(PadToWidthTest, PadsButNeverTruncates) {
    EXPECT_EQ(padToWidth("ab", 4), "ab  ");
    EXPECT_EQ(padToWidth("abcdef", 4), "abcdef");
    EXPECT_EQ(visibleWidth(padToWidth("\x1b[31mab\x1b[0m", 5)), 5);
}

TEST(SanitizeLineTest, DropsCursorMovingBytes) {
    EXPECT_EQ(sanitizeLine("one\ntwo"), "onetwo");
    EXPECT_EQ(sanitizeLine("a\rb\x07z"), "abz");
    EXPECT_EQ(sanitizeLine("up\x1b[2Ahere\x1b[K"), "uphere");
}

TEST(SanitizeLineTest, ExpandsTabs) {
    auto out = sanitizeLine("a\tb");
    EXPECT_EQ(out, "a   b");
    EXPECT_EQ(visibleWidth(out), 5);
}

TEST(SanitizeLineTest, KeepsStylesAndHyperlinks) {
    std::string styled = "\x1b[1mbold\x1b[0m \x1b]8;;http://x\x07link\x1b]8;;\x07";
    EXPECT_EQ(sanitizeLine(styled), styled);
}

TEST(SanitizeLineTest, DropsUnterminatedEscapes) {
    EXPECT_EQ(sanitizeLine("text\x1b]8;;http://x"), "text");
    EXPECT_EQ(sanitizeLine("text\x1b"), "text");
}
