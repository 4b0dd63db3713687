#include <gtest/gtest.h>

#include "tasklex/nlp/token_list.hpp"

using namespace tasklex::nlp;

class TokenListTest : public ::testing::Test {
protected:
  void SetUp() override {}
  void TearDown() override {}
};

TEST_F(TokenListTest, DeduplicatesAndRemovesEveryOccurrence) {
  auto result = TokenListExtractor::extract("Buy milk @home @home #errands", "@");
  ASSERT_EQ(result.tokens.size(), 1);
  EXPECT_EQ(result.tokens[0], "home");
  EXPECT_EQ(result.remaining, "Buy milk #errands");
}

TEST_F(TokenListTest, DeduplicationIgnoresCase) {
  auto result = TokenListExtractor::extract("#Work notes #work #urgent", "#");
  ASSERT_EQ(result.tokens.size(), 2);
  EXPECT_EQ(result.tokens[0], "Work");
  EXPECT_EQ(result.tokens[1], "urgent");
  EXPECT_EQ(result.remaining, "notes");
}

TEST_F(TokenListTest, BracketedTokenKeepsSpaces) {
  auto result = TokenListExtractor::extract("+[[Project Alpha]] review +ops", "+");
  ASSERT_EQ(result.tokens.size(), 2);
  EXPECT_EQ(result.tokens[0], "[[Project Alpha]]");
  EXPECT_EQ(result.tokens[1], "ops");
  EXPECT_EQ(result.remaining, "review");
}

TEST_F(TokenListTest, LoneTriggerIsKept) {
  auto result = TokenListExtractor::extract("a + b", "+");
  EXPECT_TRUE(result.tokens.empty());
  EXPECT_EQ(result.remaining, "a + b");
}

TEST_F(TokenListTest, TriggerRunIsNotAToken) {
  auto result = TokenListExtractor::extract("Fix C++ build", "+");
  EXPECT_TRUE(result.tokens.empty());
  EXPECT_EQ(result.remaining, "Fix C++ build");

  auto hashes = TokenListExtractor::extract("Heading ## and ### #docs", "#");
  ASSERT_EQ(hashes.tokens.size(), 1);
  EXPECT_EQ(hashes.tokens[0], "docs");
  EXPECT_EQ(hashes.remaining, "Heading ## and ###");

  auto colons = TokenListExtractor::extract("Plan :::: ::home", "::");
  ASSERT_EQ(colons.tokens.size(), 1);
  EXPECT_EQ(colons.tokens[0], "home");
}

TEST_F(TokenListTest, MultiCharacterTrigger) {
  auto result = TokenListExtractor::extract("Plan ::home ::office", "::");
  ASSERT_EQ(result.tokens.size(), 2);
  EXPECT_EQ(result.tokens[1], "office");
  EXPECT_EQ(result.remaining, "Plan");
}

TEST_F(TokenListTest, Utf8Tokens) {
  auto result = TokenListExtractor::extract("Einkaufen #büro #Büro", "#");
  ASSERT_EQ(result.tokens.size(), 1);
  EXPECT_EQ(result.tokens[0], "büro");
  EXPECT_EQ(result.remaining, "Einkaufen");
}
