#include <gtest/gtest.h>

#include "tasklex/util/text.hpp"

using namespace tasklex::util;

class TextTest : public ::testing::Test {
protected:
  void SetUp() override {}
  void TearDown() override {}
};

TEST_F(TextTest, CollapseWhitespace) {
  EXPECT_EQ(Text::collapseWhitespace("  Buy \t milk\n now  "), "Buy milk now");
  EXPECT_EQ(Text::collapseWhitespace(""), "");
  EXPECT_EQ(Text::collapseWhitespace("   "), "");
}

TEST_F(TextTest, TrimHandlesUtf8) {
  EXPECT_EQ(Text::trim("  héllo wörld \n"), "héllo wörld");
  EXPECT_EQ(Text::trim("\t"), "");
}

TEST_F(TextTest, RemoveRangesKeepsWordsApart) {
  EXPECT_EQ(Text::removeRanges("Task done today", {{5, 9}}), "Task today");
  EXPECT_EQ(Text::removeRanges("a@home b", {{1, 6}}), "a b");
  // Overlapping ranges after the first are ignored
  EXPECT_EQ(Text::removeRanges("one two three", {{0, 7}, {4, 7}}), "three");
}

TEST_F(TextTest, CaseInsensitiveMatching) {
  EXPECT_TRUE(Text::containsIgnoreCase("In Progress", "progress"));
  EXPECT_TRUE(Text::containsIgnoreCase("anything", ""));
  EXPECT_FALSE(Text::containsIgnoreCase("open", "closed"));

  EXPECT_TRUE(Text::equalsIgnoreCase("ÄRGER", "ärger"));
  EXPECT_FALSE(Text::equalsIgnoreCase("done", "don"));
  EXPECT_TRUE(Text::equalsIgnoreCase("", ""));
}

TEST_F(TextTest, MatchAtReturnsEndOffset) {
  auto end = Text::matchAt("Café au lait", 0, "CAFÉ");
  ASSERT_TRUE(end.has_value());
  EXPECT_EQ(*end, 5u);  // "é" is two bytes

  EXPECT_FALSE(Text::matchAt("Café", 0, "cafes").has_value());
}

TEST_F(TextTest, FindAllReportsEveryOccurrence) {
  auto ranges = Text::findAll("ab Ab aB", "AB");
  ASSERT_EQ(ranges.size(), 3);
  EXPECT_EQ(ranges[0].start, 0u);
  EXPECT_EQ(ranges[1].start, 3u);
  EXPECT_EQ(ranges[2].end, 8u);
}

TEST_F(TextTest, WordBoundaries) {
  EXPECT_FALSE(Text::isBoundaryBefore("a#b", 1));
  EXPECT_TRUE(Text::isBoundaryBefore("(#b", 1));
  EXPECT_TRUE(Text::isBoundaryBefore("abc", 0));
  EXPECT_TRUE(Text::isBoundaryAfter("abc", 3));
  EXPECT_FALSE(Text::isBoundaryAfter("Progressive", 8));

  // Letters outside ASCII are word characters too
  EXPECT_FALSE(Text::isBoundaryAfter("fällig", 1));
  EXPECT_TRUE(Text::isWordCodePoint('_'));
  EXPECT_FALSE(Text::isWordCodePoint('-'));
}

TEST_F(TextTest, WhitespaceHelpers) {
  EXPECT_EQ(Text::findWhitespace("abc def", 0), 3u);
  EXPECT_EQ(Text::findWhitespace("abc", 0), std::string_view::npos);
  EXPECT_EQ(Text::skipWhitespace("a   b", 1), 4u);
  EXPECT_TRUE(Text::containsWhitespace("a b"));
  EXPECT_FALSE(Text::containsWhitespace("ab"));
  EXPECT_TRUE(Text::isBlank(" \t\n"));
  EXPECT_FALSE(Text::isBlank(" x "));
}

TEST_F(TextTest, FoldCase) {
  EXPECT_EQ(Text::foldCase("HOME"), Text::foldCase("home"));
  EXPECT_EQ(Text::foldCase("Ärger"), "ärger");
}
