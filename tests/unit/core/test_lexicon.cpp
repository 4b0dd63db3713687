#include <gtest/gtest.h>

#include "tasklex/core/lexicon.hpp"
#include "tasklex/core/trigger_config.hpp"

using namespace tasklex::core;

class LexiconTest : public ::testing::Test {
protected:
  void SetUp() override {}
  void TearDown() override {}
};

TEST_F(LexiconTest, CanonicalIdFallsBackToValue) {
  LexiconEntry with_id{"in-progress", "doing", "Doing", false, 0};
  EXPECT_EQ(with_id.canonicalId(), "in-progress");

  LexiconEntry without_id{"", "todo", "To do", false, 0};
  EXPECT_EQ(without_id.canonicalId(), "todo");

  LexiconEntry blank_id{"  ", "todo", "To do", false, 0};
  EXPECT_EQ(blank_id.canonicalId(), "todo");
}

TEST_F(LexiconTest, DefaultLexicons) {
  auto statuses = defaultStatuses();
  ASSERT_EQ(statuses.size(), 4);
  EXPECT_EQ(statuses[0].id, "none");
  EXPECT_EQ(statuses[2].id, "in-progress");
  EXPECT_TRUE(statuses[3].is_terminal);

  auto priorities = defaultPriorities();
  ASSERT_EQ(priorities.size(), 4);
  EXPECT_EQ(priorities[3].id, "high");
}

TEST_F(LexiconTest, PropertyKindNames) {
  EXPECT_EQ(propertyKindToString(PropertyKind::kContext), "context");
  EXPECT_EQ(propertyKindFromString("tags"), PropertyKind::kTag);
  EXPECT_EQ(propertyKindFromString("project"), PropertyKind::kProject);
  EXPECT_FALSE(propertyKindFromString("milestone").has_value());
}

class TriggerConfigTest : public ::testing::Test {
protected:
  void SetUp() override {}
  void TearDown() override {}
};

TEST_F(TriggerConfigTest, Defaults) {
  auto config = TriggerConfig::defaults();
  EXPECT_EQ(config.activeTrigger(PropertyKind::kTag), "#");
  EXPECT_EQ(config.activeTrigger(PropertyKind::kContext), "@");
  EXPECT_EQ(config.activeTrigger(PropertyKind::kProject), "+");
  EXPECT_EQ(config.activeTrigger(PropertyKind::kStatus), "*");
  EXPECT_FALSE(config.activeTrigger(PropertyKind::kPriority).has_value());
  EXPECT_EQ(config.get(PropertyKind::kPriority).trigger, "!");
}

TEST_F(TriggerConfigTest, KindForTrigger) {
  auto config = TriggerConfig::defaults();
  EXPECT_EQ(config.kindForTrigger("@"), PropertyKind::kContext);
  EXPECT_FALSE(config.kindForTrigger("!").has_value());
}

TEST_F(TriggerConfigTest, EnabledTriggersLongestFirst) {
  auto config = TriggerConfig::defaults();
  config.set(PropertyKind::kPriority, "!!", true);

  auto triggers = config.enabledTriggers();
  ASSERT_EQ(triggers.size(), 5);
  EXPECT_EQ(triggers[0].first, PropertyKind::kPriority);
  EXPECT_EQ(triggers[0].second, "!!");
}

TEST_F(TriggerConfigTest, NormalizedDisablesBlankAndWhitespaceTriggers) {
  auto config = TriggerConfig::defaults();
  config.set(PropertyKind::kTag, "", true);
  config.set(PropertyKind::kContext, "a t", true);

  auto normalized = config.normalized();
  EXPECT_FALSE(normalized.get(PropertyKind::kTag).enabled);
  EXPECT_FALSE(normalized.get(PropertyKind::kContext).enabled);
  EXPECT_TRUE(normalized.get(PropertyKind::kProject).enabled);
}

TEST_F(TriggerConfigTest, NormalizedResolvesDuplicatesByKindOrder) {
  auto config = TriggerConfig::defaults();
  config.set(PropertyKind::kStatus, "#", true);
  config.set(PropertyKind::kPriority, "@", true);

  auto normalized = config.normalized();
  EXPECT_EQ(normalized.activeTrigger(PropertyKind::kTag), "#");
  EXPECT_EQ(normalized.activeTrigger(PropertyKind::kContext), "@");
  EXPECT_FALSE(normalized.activeTrigger(PropertyKind::kStatus).has_value());
  EXPECT_FALSE(normalized.activeTrigger(PropertyKind::kPriority).has_value());
}

TEST_F(TriggerConfigTest, DisabledDuplicateDoesNotClaim) {
  auto config = TriggerConfig::defaults();
  config.set(PropertyKind::kTag, "*", false);

  auto normalized = config.normalized();
  EXPECT_EQ(normalized.activeTrigger(PropertyKind::kStatus), "*");
}
