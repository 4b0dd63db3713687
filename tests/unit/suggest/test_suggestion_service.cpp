#include <gtest/gtest.h>

#include "tasklex/suggest/suggestion_service.hpp"

#include "test_helpers.hpp"

using namespace tasklex::suggest;
using tasklex::core::PropertyKind;
using tasklex::core::TriggerConfig;

class SuggestionServiceTest : public ::testing::Test {
protected:
  void SetUp() override {
    statuses_ = tasklex::test::sampleStatuses();
    priorities_ = tasklex::test::samplePriorities();
  }

  static std::vector<std::string> values(const std::vector<Suggestion>& suggestions) {
    std::vector<std::string> result;
    for (const auto& s : suggestions) {
      result.push_back(s.value);
    }
    return result;
  }

  tasklex::core::Lexicon statuses_;
  tasklex::core::Lexicon priorities_;
};

TEST_F(SuggestionServiceTest, HasTrigger) {
  EXPECT_TRUE(SuggestionService::hasTrigger("Task *in", "*", 8));
  EXPECT_TRUE(SuggestionService::hasTrigger("Task *", "*", 6));
  EXPECT_FALSE(SuggestionService::hasTrigger("Task *in progress", "*", 17));
  EXPECT_FALSE(SuggestionService::hasTrigger("Task", "*", 4));
  EXPECT_FALSE(SuggestionService::hasTrigger("Task *in", "", 8));
}

TEST_F(SuggestionServiceTest, CursorPastEndIsClamped) {
  EXPECT_TRUE(SuggestionService::hasTrigger("Task *in", "*", 100));
  EXPECT_EQ(SuggestionService::extractQueryAfterTrigger("Task *in", "*", 100), "in");
}

TEST_F(SuggestionServiceTest, ExtractQueryRunsToNextWhitespace) {
  EXPECT_EQ(SuggestionService::extractQueryAfterTrigger("Task *active now", "*", 8), "active");
  EXPECT_EQ(SuggestionService::extractQueryAfterTrigger("Task *act", "*", 9), "act");
  EXPECT_EQ(SuggestionService::extractQueryAfterTrigger("Task *", "*", 6), "");
}

TEST_F(SuggestionServiceTest, ExtractQueryWithoutTrigger) {
  EXPECT_EQ(SuggestionService::extractQueryAfterTrigger("Task active", "*", 8), "");
  EXPECT_EQ(SuggestionService::extractQueryAfterTrigger("Task *in progress", "*", 17), "");
}

TEST_F(SuggestionServiceTest, RankByValueOrLabel) {
  auto suggestions =
      SuggestionService::rankSuggestions("progress", statuses_, PropertyKind::kStatus, 10);
  ASSERT_EQ(suggestions.size(), 1);
  EXPECT_EQ(suggestions[0].value, "in-progress");
  EXPECT_EQ(suggestions[0].label, "In Progress");
  EXPECT_EQ(suggestions[0].display, "In Progress");
  EXPECT_EQ(suggestions[0].kind, PropertyKind::kStatus);
}

TEST_F(SuggestionServiceTest, RankIgnoresCase) {
  auto suggestions = SuggestionService::rankSuggestions("NOW", statuses_, PropertyKind::kStatus, 10);
  EXPECT_EQ(values(suggestions), std::vector<std::string>{"active"});
}

TEST_F(SuggestionServiceTest, EmptyQueryMatchesEverythingUpToLimit) {
  auto all = SuggestionService::rankSuggestions("", statuses_, PropertyKind::kStatus, 10);
  EXPECT_EQ(all.size(), statuses_.size());

  auto limited = SuggestionService::rankSuggestions("", statuses_, PropertyKind::kStatus, 2);
  EXPECT_EQ(values(limited), (std::vector<std::string>{"open", "active"}));
}

TEST_F(SuggestionServiceTest, RankFollowsEntryOrder) {
  tasklex::core::Lexicon entries = {
    {"later", "later", "Later", false, 2},
    {"blank", "", "Blank", false, 0},
    {"first", "first", "First", false, 1},
  };

  auto suggestions = SuggestionService::rankSuggestions("", entries, PropertyKind::kPriority, 10);
  EXPECT_EQ(values(suggestions), (std::vector<std::string>{"first", "later"}));
  EXPECT_EQ(suggestions[0].kind, PropertyKind::kPriority);
}

TEST_F(SuggestionServiceTest, ApplySelectionInsertsLabel) {
  Suggestion active{"active", "Active = Now", "Active = Now", PropertyKind::kStatus};

  auto result = SuggestionService::applySelection("Task *act", "*", 5, active);
  EXPECT_EQ(result.new_text, "Task Active = Now");
  EXPECT_EQ(result.new_cursor, 17);
}

TEST_F(SuggestionServiceTest, ApplySelectionInsertsValue) {
  Suggestion active{"active", "Active = Now", "Active = Now", PropertyKind::kStatus};

  auto result =
      SuggestionService::applySelection("Task *act more", "*", 5, active, InsertMode::kValue);
  EXPECT_EQ(result.new_text, "Task active more");
  EXPECT_EQ(result.new_cursor, 11);
}

TEST_F(SuggestionServiceTest, ApplySelectionWithoutTriggerAtOffset) {
  Suggestion active{"active", "Active = Now", "Active = Now", PropertyKind::kStatus};

  auto result = SuggestionService::applySelection("Task *act", "*", 2, active);
  EXPECT_EQ(result.new_text, "Task *act");
  EXPECT_EQ(result.new_cursor, 2);
}

TEST_F(SuggestionServiceTest, QuotedTextIsNotAContext) {
  EXPECT_TRUE(SuggestionService::isValidContext("Task *in", 8));
  EXPECT_FALSE(SuggestionService::isValidContext("Say \"hi *in", 11));
  EXPECT_TRUE(SuggestionService::isValidContext("Say \"hi\" *in", 12));
  EXPECT_FALSE(SuggestionService::isValidContext("Say \"a \\\" b *in", 15));
}

TEST_F(SuggestionServiceTest, EscapedBackslashDoesNotEscapeTheQuote) {
  // Say "a\\" *in, two backslashes
  EXPECT_TRUE(SuggestionService::isValidContext("Say \"a\\\\\" *in", 13));
  // Say "a\\\" *in, three backslashes
  EXPECT_FALSE(SuggestionService::isValidContext("Say \"a\\\\\\\" *in", 14));

  SuggestionService service;
  EXPECT_TRUE(service.detectActiveTrigger("Say \"a\\\\\" *in", 13).has_value());
}

TEST_F(SuggestionServiceTest, DetectStatusTrigger) {
  SuggestionService service;

  auto active = service.detectActiveTrigger("Task *in", 8);
  ASSERT_TRUE(active.has_value());
  EXPECT_EQ(active->kind, PropertyKind::kStatus);
  EXPECT_EQ(active->offset, 5);
  EXPECT_EQ(active->trigger, "*");
  EXPECT_EQ(active->query, "in");
}

TEST_F(SuggestionServiceTest, DetectIgnoresTriggerInsideWord) {
  SuggestionService service;
  EXPECT_FALSE(service.detectActiveTrigger("mail me@home", 12).has_value());
}

TEST_F(SuggestionServiceTest, DetectPicksMostRecentTrigger) {
  SuggestionService service;

  auto active = service.detectActiveTrigger("Plan #work @off", 15);
  ASSERT_TRUE(active.has_value());
  EXPECT_EQ(active->kind, PropertyKind::kContext);
  EXPECT_EQ(active->offset, 11);
  EXPECT_EQ(active->query, "off");
}

TEST_F(SuggestionServiceTest, DetectMultiCharacterTrigger) {
  auto triggers = TriggerConfig::defaults();
  triggers.set(PropertyKind::kStatus, "##", true);
  SuggestionService service(triggers);

  auto active = service.detectActiveTrigger("Task ##do", 9);
  ASSERT_TRUE(active.has_value());
  EXPECT_EQ(active->kind, PropertyKind::kStatus);
  EXPECT_EQ(active->offset, 5);
  EXPECT_EQ(active->query, "do");

  auto tag = service.detectActiveTrigger("Task #do", 8);
  ASSERT_TRUE(tag.has_value());
  EXPECT_EQ(tag->kind, PropertyKind::kTag);
}

TEST_F(SuggestionServiceTest, DetectSkipsDisabledAndQuoted) {
  SuggestionService service;
  EXPECT_FALSE(service.detectActiveTrigger("Fix !hi", 7).has_value());
  EXPECT_FALSE(service.detectActiveTrigger("Say \"*in", 8).has_value());
  EXPECT_FALSE(service.detectActiveTrigger("Task *in progress", 17).has_value());
}

TEST_F(SuggestionServiceTest, SuggestionsForStatusTrigger) {
  SuggestionService service;

  auto suggestions = service.suggestionsAt("Task *in", 8, statuses_, priorities_, 10);
  EXPECT_EQ(values(suggestions), (std::vector<std::string>{"in-progress", "waiting"}));
}

TEST_F(SuggestionServiceTest, SuggestionsForPriorityTrigger) {
  auto triggers = TriggerConfig::defaults();
  triggers.setEnabled(PropertyKind::kPriority, true);
  SuggestionService service(triggers);

  auto suggestions = service.suggestionsAt("Fix !hi", 7, statuses_, priorities_, 10);
  EXPECT_EQ(values(suggestions), std::vector<std::string>{"high"});
  EXPECT_EQ(suggestions[0].kind, PropertyKind::kPriority);
}

TEST_F(SuggestionServiceTest, NoSuggestionsForTokenTriggers) {
  SuggestionService service;
  EXPECT_TRUE(service.suggestionsAt("Plan #wo", 8, statuses_, priorities_, 10).empty());
  EXPECT_TRUE(service.suggestionsAt("Plan", 4, statuses_, priorities_, 10).empty());
}
