#include <gtest/gtest.h>

#include "tasklex/nlp/task_parser.hpp"

#include "test_helpers.hpp"

using namespace tasklex::nlp;
using tasklex::core::PropertyKind;
using tasklex::core::TimeOfDay;
using tasklex::test::date;

class TaskParserTest : public ::testing::Test {
protected:
  void SetUp() override {
    reference_ = tasklex::test::referenceInstant();
  }
  void TearDown() override {}

  tasklex::core::ExtractionResult parse(std::string_view input,
                                        ParserSettings settings = tasklex::test::sampleSettings()) {
    TaskParser parser(std::move(settings));
    return parser.parse(input, reference_);
  }

  ReferenceInstant reference_;
};

TEST_F(TaskParserTest, LongestStatusWins) {
  auto settings = tasklex::test::sampleSettings();
  settings.statuses.push_back({"progress", "progress", "progress", false, 9});

  auto result = parse("Task In Progress review", settings);
  EXPECT_EQ(result.status, "in-progress");
  EXPECT_EQ(result.title, "Task review");
}

TEST_F(TaskParserTest, StatusNeedsWordBoundary) {
  auto settings = tasklex::test::sampleSettings();
  settings.statuses = {{"progress", "progress", "progress", false, 0}};

  auto result = parse("Task Progressive work", settings);
  EXPECT_FALSE(result.status.has_value());
  EXPECT_EQ(result.title, "Task Progressive work");
}

TEST_F(TaskParserTest, StatusIsRemovedBeforeDates) {
  auto result = parse("Task Active = Now tomorrow at 3pm");
  EXPECT_EQ(result.status, "active");
  EXPECT_EQ(result.title, "Task");
  EXPECT_EQ(result.due_date, date(2025, 3, 13));
  EXPECT_EQ(result.due_time, (TimeOfDay{15, 0}));
  EXPECT_FALSE(result.scheduled_date.has_value());
  EXPECT_FALSE(result.scheduled_time.has_value());
}

TEST_F(TaskParserTest, UnknownTriggeredStatusStays) {
  auto result = parse("Task *Invalid");
  EXPECT_FALSE(result.status.has_value());
  EXPECT_EQ(result.title, "Task *Invalid");
}

TEST_F(TaskParserTest, TriggeredStatus) {
  auto result = parse("Finish report *done");
  EXPECT_EQ(result.status, "done");
  EXPECT_EQ(result.title, "Finish report");
}

TEST_F(TaskParserTest, StatusLabelWithPunctuation) {
  auto result = parse("Ticket Status: Waiting for Review (2024) today");
  EXPECT_EQ(result.status, "waiting");
  EXPECT_EQ(result.due_date, date(2025, 3, 12));
  EXPECT_EQ(result.title, "Ticket");
}

TEST_F(TaskParserTest, ContextsAndTags) {
  auto result = parse("Buy milk @home @home #errands");
  ASSERT_EQ(result.contexts.size(), 1);
  EXPECT_EQ(result.contexts[0], "home");
  ASSERT_EQ(result.tags.size(), 1);
  EXPECT_EQ(result.tags[0], "errands");
  EXPECT_TRUE(result.projects.empty());
  EXPECT_EQ(result.title, "Buy milk");
}

TEST_F(TaskParserTest, Projects) {
  auto result = parse("Pay rent due on friday +[[Household]] +finance");
  EXPECT_EQ(result.due_date, date(2025, 3, 14));
  ASSERT_EQ(result.projects.size(), 2);
  EXPECT_EQ(result.projects[0], "[[Household]]");
  EXPECT_EQ(result.projects[1], "finance");
  EXPECT_EQ(result.title, "Pay rent");
}

TEST_F(TaskParserTest, Estimate) {
  auto result = parse("task 2 hours 30 minutes");
  EXPECT_EQ(result.estimate_minutes, 150);
  EXPECT_EQ(result.title, "task");
}

TEST_F(TaskParserTest, Recurrence) {
  auto result = parse("Standup every monday #team");
  EXPECT_EQ(result.recurrence_rule, "FREQ=WEEKLY;BYDAY=MO");
  EXPECT_FALSE(result.due_date.has_value());
  EXPECT_EQ(result.title, "Standup");
}

TEST_F(TaskParserTest, EverythingAtOnce) {
  auto result = parse("Call Anna tomorrow at 3pm @phone #work high every monday 30 min");
  EXPECT_EQ(result.title, "Call Anna");
  EXPECT_EQ(result.priority, "high");
  EXPECT_EQ(result.due_date, date(2025, 3, 13));
  EXPECT_EQ(result.due_time, (TimeOfDay{15, 0}));
  EXPECT_EQ(result.recurrence_rule, "FREQ=WEEKLY;BYDAY=MO");
  EXPECT_EQ(result.estimate_minutes, 30);
  EXPECT_EQ(result.contexts, std::vector<std::string>{"phone"});
  EXPECT_EQ(result.tags, std::vector<std::string>{"work"});
}

TEST_F(TaskParserTest, ParsingTheTitleAgainFindsNothing) {
  std::vector<std::string> inputs = {
    "Call Anna tomorrow at 3pm @phone #work high every monday 30 min",
    "Task In Progress review",
    "Buy milk @home @home #errands",
    "Pay rent due on friday +[[Household]]",
    "Write report every other week 2h urgent",
    "Plain title without anything",
    "Standup every monday at 9am",
    "Pay rent due tomorrow and due friday",
    "Call mom on monday by friday on sunday",
    "Meeting from tomorrow to next friday",
    "Fix C++ build",
  };

  for (const auto& input : inputs) {
    auto first = parse(input);
    auto second = parse(first.title);
    EXPECT_TRUE(second.hasNoFields()) << input;
    EXPECT_EQ(second.title, first.title) << input;
  }
}

TEST_F(TaskParserTest, RecurringTimeGoesToTheFirstOccurrence) {
  auto result = parse("Standup every monday at 9am");
  EXPECT_EQ(result.recurrence_rule, "FREQ=WEEKLY;BYDAY=MO");
  EXPECT_EQ(result.due_date, date(2025, 3, 17));
  EXPECT_EQ(result.due_time, (TimeOfDay{9, 0}));
  EXPECT_EQ(result.title, "Standup");
}

TEST_F(TaskParserTest, SurplusDatesAreDropped) {
  auto result = parse("Call mom on monday by friday on sunday");
  EXPECT_EQ(result.scheduled_date, date(2025, 3, 17));
  EXPECT_EQ(result.due_date, date(2025, 3, 14));
  EXPECT_EQ(result.title, "Call mom");
}

TEST_F(TaskParserTest, DateRange) {
  auto result = parse("Meeting from tomorrow to next friday");
  EXPECT_EQ(result.scheduled_date, date(2025, 3, 13));
  EXPECT_EQ(result.due_date, date(2025, 3, 14));
  EXPECT_EQ(result.title, "Meeting");
}

TEST_F(TaskParserTest, TriggerCharactersInWordsAreNotProjects) {
  auto result = parse("Fix C++ build");
  EXPECT_TRUE(result.projects.empty());
  EXPECT_EQ(result.title, "Fix C++ build");
}

TEST_F(TaskParserTest, DetailsAfterFirstLine) {
  auto result = parse("Write report #work\nInclude Q1 numbers\nand charts  ");
  EXPECT_EQ(result.title, "Write report");
  EXPECT_EQ(result.details, "Include Q1 numbers\nand charts");
  EXPECT_EQ(result.tags, std::vector<std::string>{"work"});
}

TEST_F(TaskParserTest, EmptyInput) {
  auto result = parse("   ");
  EXPECT_EQ(result.title, "");
  EXPECT_TRUE(result.hasNoFields());
  EXPECT_FALSE(result.details.has_value());
}

TEST_F(TaskParserTest, WhitespaceIsCollapsed) {
  auto result = parse("  Buy   fresh \t milk  ");
  EXPECT_EQ(result.title, "Buy fresh milk");
}

TEST_F(TaskParserTest, PriorityTriggerWhenEnabled) {
  auto settings = tasklex::test::sampleSettings();
  settings.triggers.setEnabled(PropertyKind::kPriority, true);

  auto result = parse("Fix !high login bug", settings);
  EXPECT_EQ(result.priority, "high");
  EXPECT_EQ(result.title, "Fix login bug");
}

TEST_F(TaskParserTest, DisabledTriggerLeavesTokens) {
  auto settings = tasklex::test::sampleSettings();
  settings.triggers.setEnabled(PropertyKind::kTag, false);

  auto result = parse("Plan #work @desk", settings);
  EXPECT_TRUE(result.tags.empty());
  EXPECT_EQ(result.contexts, std::vector<std::string>{"desk"});
  EXPECT_EQ(result.title, "Plan #work");
}

TEST_F(TaskParserTest, TriggersAreNormalized) {
  auto settings = tasklex::test::sampleSettings();
  settings.triggers.set(PropertyKind::kStatus, "#", true);

  TaskParser parser(settings);
  EXPECT_FALSE(parser.settings().triggers.activeTrigger(PropertyKind::kStatus).has_value());
  EXPECT_EQ(parser.settings().triggers.activeTrigger(PropertyKind::kTag).value_or(""), "#");

  auto result = parser.parse("Ship it #release", reference_);
  EXPECT_EQ(result.tags, std::vector<std::string>{"release"});
  EXPECT_EQ(result.title, "Ship it");
}

TEST_F(TaskParserTest, DefaultToScheduled) {
  auto settings = tasklex::test::sampleSettings();
  settings.default_to_scheduled = true;

  auto result = parse("Call mom tomorrow", settings);
  EXPECT_FALSE(result.due_date.has_value());
  EXPECT_EQ(result.scheduled_date, date(2025, 3, 13));
}

TEST_F(TaskParserTest, FallbackKeywordsWhenLexiconsAreEmpty) {
  auto result = parse("Fix bug urgent done", ParserSettings{});
  EXPECT_EQ(result.status, "done");
  EXPECT_EQ(result.priority, "urgent");
  EXPECT_EQ(result.title, "Fix bug");
}

TEST_F(TaskParserTest, UnsupportedLanguageFallsBackToEnglish) {
  ParserSettings settings;
  settings.language = "xx";
  TaskParser parser(settings);
  EXPECT_EQ(parser.language().code, "en");

  auto result = parser.parse("Call mom tomorrow", reference_);
  EXPECT_EQ(result.due_date, date(2025, 3, 13));
}

TEST_F(TaskParserTest, RecognizerFailureOnlySkipsDates) {
  auto settings = tasklex::test::sampleSettings();
  settings.recognizer = std::make_shared<tasklex::test::ThrowingDateRecognizer>();

  auto result = parse("Call tomorrow #x", settings);
  EXPECT_FALSE(result.due_date.has_value());
  EXPECT_EQ(result.tags, std::vector<std::string>{"x"});
  EXPECT_EQ(result.title, "Call tomorrow");
}

TEST_F(TaskParserTest, CustomRecognizer) {
  auto settings = tasklex::test::sampleSettings();
  settings.recognizer =
      std::make_shared<tasklex::test::FixedDateRecognizer>("next sprint", date(2025, 4, 1));

  auto result = parse("Plan next sprint", settings);
  EXPECT_EQ(result.due_date, date(2025, 4, 1));
  EXPECT_EQ(result.title, "Plan");
}

TEST_F(TaskParserTest, German) {
  ParserSettings settings;
  settings.language = "de";

  auto result = parse("Bericht schreiben morgen um 14 uhr dringend", settings);
  EXPECT_EQ(result.priority, "urgent");
  EXPECT_EQ(result.due_date, date(2025, 3, 13));
  EXPECT_EQ(result.due_time, (TimeOfDay{14, 0}));
  EXPECT_EQ(result.title, "Bericht schreiben");
}

TEST_F(TaskParserTest, Spanish) {
  ParserSettings settings;
  settings.language = "es";

  auto result = parse("Llamar a Juan mañana a las 17:00 @oficina", settings);
  EXPECT_EQ(result.due_date, date(2025, 3, 13));
  EXPECT_EQ(result.due_time, (TimeOfDay{17, 0}));
  EXPECT_EQ(result.contexts, std::vector<std::string>{"oficina"});
  EXPECT_EQ(result.title, "Llamar a Juan");
}

TEST_F(TaskParserTest, French) {
  ParserSettings settings;
  settings.language = "fr";

  auto result = parse("Appeler Marie demain à 14:00 #travail", settings);
  EXPECT_EQ(result.due_date, date(2025, 3, 13));
  EXPECT_EQ(result.tags, std::vector<std::string>{"travail"});
  EXPECT_EQ(result.title, "Appeler Marie");
}

TEST_F(TaskParserTest, Italian) {
  ParserSettings settings;
  settings.language = "it";

  auto result = parse("Chiamare Marco domani alle 15:00 urgente #lavoro", settings);
  EXPECT_EQ(result.priority, "urgent");
  EXPECT_EQ(result.due_date, date(2025, 3, 13));
  EXPECT_EQ(result.due_time, (TimeOfDay{15, 0}));
  EXPECT_EQ(result.tags, std::vector<std::string>{"lavoro"});
  EXPECT_EQ(result.title, "Chiamare Marco");
}

TEST_F(TaskParserTest, Dutch) {
  ParserSettings settings;
  settings.language = "nl";

  auto result = parse("Rapport schrijven morgen om 14:00 klaar", settings);
  EXPECT_EQ(result.status, "done");
  EXPECT_EQ(result.due_date, date(2025, 3, 13));
  EXPECT_EQ(result.due_time, (TimeOfDay{14, 0}));
  EXPECT_EQ(result.title, "Rapport schrijven");
}

TEST_F(TaskParserTest, PortugueseAndSwedish) {
  ParserSettings portuguese;
  portuguese.language = "pt";
  auto pt = parse("Pagar contas sexta-feira importante", portuguese);
  EXPECT_EQ(pt.priority, "high");
  EXPECT_EQ(pt.due_date, date(2025, 3, 14));
  EXPECT_EQ(pt.title, "Pagar contas");

  ParserSettings swedish;
  swedish.language = "sv";
  auto sv = parse("Ringa Erik imorgon kl 15:00 brådskande", swedish);
  EXPECT_EQ(sv.priority, "urgent");
  EXPECT_EQ(sv.due_date, date(2025, 3, 13));
  EXPECT_EQ(sv.due_time, (TimeOfDay{15, 0}));
  EXPECT_EQ(sv.title, "Ringa Erik");
}

TEST_F(TaskParserTest, ChineseWordsMatchBetweenSpaces) {
  ParserSettings settings;
  settings.language = "zh";

  auto result = parse("写报告 明天 紧急", settings);
  EXPECT_EQ(result.priority, "urgent");
  EXPECT_EQ(result.due_date, date(2025, 3, 13));
  EXPECT_EQ(result.title, "写报告");

  // Inside a run of ideographs there is no word boundary
  auto joined = parse("写报告紧急", settings);
  EXPECT_FALSE(joined.priority.has_value());
  EXPECT_EQ(joined.title, "写报告紧急");
}

TEST_F(TaskParserTest, Japanese) {
  ParserSettings settings;
  settings.language = "ja";

  auto result = parse("報告書を書く 明日 15時 至急 #仕事", settings);
  EXPECT_EQ(result.priority, "urgent");
  EXPECT_EQ(result.due_date, date(2025, 3, 13));
  EXPECT_EQ(result.due_time, (TimeOfDay{15, 0}));
  EXPECT_EQ(result.tags, std::vector<std::string>{"仕事"});
  EXPECT_EQ(result.title, "報告書を書く");
}

TEST_F(TaskParserTest, StageNames) {
  EXPECT_EQ(parseStageToString(ParseStage::kRaw), "raw");
  EXPECT_EQ(parseStageToString(ParseStage::kDateTimeStripped), "date-time-stripped");
  EXPECT_EQ(parseStageToString(ParseStage::kFinalized), "finalized");
}
