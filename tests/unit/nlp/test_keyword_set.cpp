#include <gtest/gtest.h>

#include "tasklex/nlp/keyword_set.hpp"

using namespace tasklex::nlp;

class KeywordSetTest : public ::testing::Test {
protected:
  void SetUp() override {}
  void TearDown() override {}

  KeywordSet cues_{std::vector<WordList>{{"due on", "due"}, {"by"}}};
};

TEST_F(KeywordSetTest, LongestKeywordWins) {
  auto match = cues_.matchAt("due on friday", 0);
  ASSERT_TRUE(match.has_value());
  EXPECT_EQ(match->end, 6u);
  EXPECT_EQ(match->group, 0);
}

TEST_F(KeywordSetTest, InnerWhitespaceMatchesAnyRun) {
  auto match = cues_.matchAt("DUE \t on friday", 0);
  ASSERT_TRUE(match.has_value());
  EXPECT_EQ(match->end, 8u);
}

TEST_F(KeywordSetTest, EndBoundaryIsOptional) {
  EXPECT_FALSE(cues_.matchAt("dueling", 0).has_value());

  auto loose = cues_.matchAt("dueling", 0, false);
  ASSERT_TRUE(loose.has_value());
  EXPECT_EQ(loose->end, 3u);
}

TEST_F(KeywordSetTest, GroupsAreReported) {
  auto match = cues_.matchAt("by monday", 0);
  ASSERT_TRUE(match.has_value());
  EXPECT_EQ(match->group, 1);
}

TEST_F(KeywordSetTest, BlankKeywordsAreIgnored) {
  auto set = KeywordSet::single({"", "  "});
  EXPECT_TRUE(set.empty());
  EXPECT_FALSE(set.matchAt("anything", 0).has_value());
}

TEST_F(KeywordSetTest, MatchBeforeFindsCueEndingAtPhrase) {
  std::string_view text = "Pay rent due on friday";
  auto start = cues_.matchBefore(text, 16);
  ASSERT_TRUE(start.has_value());
  EXPECT_EQ(*start, 9u);
}

TEST_F(KeywordSetTest, MatchBeforeNeedsAdjacentCue) {
  EXPECT_FALSE(cues_.matchBefore("due soon friday", 9).has_value());
  EXPECT_FALSE(cues_.matchBefore("overdue friday", 8).has_value());
}

TEST_F(KeywordSetTest, ArrayGroups) {
  std::array<WordList, 2> groups = {{{"am"}, {"pm"}}};
  KeywordSet set(groups);

  auto match = set.matchAt("pm", 0);
  ASSERT_TRUE(match.has_value());
  EXPECT_EQ(match->group, 1);
}

TEST_F(KeywordSetTest, MatchNumber) {
  auto number = matchNumber("123abc", 0);
  ASSERT_TRUE(number.has_value());
  EXPECT_EQ(number->first, 123);
  EXPECT_EQ(number->second, 3u);

  EXPECT_FALSE(matchNumber("12345", 0).has_value());
  EXPECT_FALSE(matchNumber("abc", 0).has_value());
  EXPECT_FALSE(matchNumber("123", 0, 2).has_value());
}
