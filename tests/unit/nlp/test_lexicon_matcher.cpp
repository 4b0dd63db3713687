#include <gtest/gtest.h>

#include "tasklex/nlp/lexicon_matcher.hpp"

#include "test_helpers.hpp"

using namespace tasklex::nlp;
using tasklex::core::Lexicon;

class LexiconMatcherTest : public ::testing::Test {
protected:
  void SetUp() override {
    statuses_ = tasklex::test::sampleStatuses();
  }
  void TearDown() override {}

  Lexicon statuses_;
};

TEST_F(LexiconMatcherTest, LongestSurfaceWins) {
  Lexicon entries = {
    {"progress", "progress", "progress", false, 0},
    {"in-progress", "in-progress", "In Progress", false, 1},
  };

  auto match = LexiconMatcher::findBestMatch("Task In Progress review", entries, std::nullopt);
  ASSERT_TRUE(match.has_value());
  EXPECT_EQ(match->canonical_id, "in-progress");
  EXPECT_EQ(match->start, 5u);
  EXPECT_EQ(match->end, 16u);
  EXPECT_EQ(match->matched_source, "In Progress");
  EXPECT_FALSE(match->via_trigger);
}

TEST_F(LexiconMatcherTest, RequiresWordBoundaries) {
  Lexicon entries = {{"progress", "progress", "progress", false, 0}};
  EXPECT_FALSE(
      LexiconMatcher::findBestMatch("Task Progressive work", entries, std::nullopt).has_value());
  EXPECT_FALSE(LexiconMatcher::findBestMatch("Reprogress", entries, std::nullopt).has_value());
}

TEST_F(LexiconMatcherTest, CaseInsensitive) {
  auto match = LexiconMatcher::findBestMatch("task DONE", statuses_, std::nullopt);
  ASSERT_TRUE(match.has_value());
  EXPECT_EQ(match->canonical_id, "done");
  EXPECT_EQ(match->matched_source, "DONE");
}

TEST_F(LexiconMatcherTest, TriggeredMatchIncludesTrigger) {
  auto match = LexiconMatcher::findBestMatch("Finish *done report", statuses_, "*");
  ASSERT_TRUE(match.has_value());
  EXPECT_EQ(match->canonical_id, "done");
  EXPECT_EQ(match->start, 7u);
  EXPECT_EQ(match->end, 12u);
  EXPECT_TRUE(match->via_trigger);
}

TEST_F(LexiconMatcherTest, TriggerBeatsLongerBareMatch) {
  auto match = LexiconMatcher::findBestMatch("In Progress *open", statuses_, "*");
  ASSERT_TRUE(match.has_value());
  EXPECT_EQ(match->canonical_id, "open");
  EXPECT_TRUE(match->via_trigger);
}

TEST_F(LexiconMatcherTest, UnknownTriggeredWordFallsBackToBare) {
  auto match = LexiconMatcher::findBestMatch("*Invalid but open", statuses_, "*");
  ASSERT_TRUE(match.has_value());
  EXPECT_EQ(match->canonical_id, "open");
  EXPECT_FALSE(match->via_trigger);

  EXPECT_FALSE(LexiconMatcher::findBestMatch("Task *Invalid", statuses_, "*").has_value());
}

TEST_F(LexiconMatcherTest, LabelWithPunctuation) {
  auto match = LexiconMatcher::findBestMatch("Ticket Status: Waiting for Review (2024) today",
                                             statuses_, std::nullopt);
  ASSERT_TRUE(match.has_value());
  EXPECT_EQ(match->canonical_id, "waiting");
  EXPECT_EQ(match->start, 7u);
}

TEST_F(LexiconMatcherTest, TiesGoToLowerOrder) {
  Lexicon entries = {
    {"later", "x", "x", false, 2},
    {"earlier", "x", "x", false, 1},
  };
  auto match = LexiconMatcher::findBestMatch("do x", entries, std::nullopt);
  ASSERT_TRUE(match.has_value());
  EXPECT_EQ(match->canonical_id, "earlier");
}

TEST_F(LexiconMatcherTest, BlankSurfacesAreSkipped) {
  Lexicon entries = {{"blank", "", " ", false, 0}};
  EXPECT_FALSE(LexiconMatcher::findBestMatch("anything at all", entries, std::nullopt).has_value());
  EXPECT_FALSE(LexiconMatcher::findBestMatch("", statuses_, "*").has_value());
}
