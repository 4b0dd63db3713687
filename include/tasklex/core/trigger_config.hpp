#pragma once

#include <array>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "tasklex/core/lexicon.hpp"

namespace tasklex::core {

/**
 * @brief Trigger prefix configured for one property kind
 */
struct PropertyTrigger {
  std::string trigger;
  bool enabled = false;

  bool operator==(const PropertyTrigger&) const = default;
};

/**
 * @brief Trigger prefixes per property kind
 *
 * A trigger signals explicit intent: "*done" always selects a status, while a
 * bare "done" is only matched on word boundaries. List-valued kinds (tags,
 * contexts, projects) are only extracted through their trigger.
 */
class TriggerConfig {
 public:
  TriggerConfig() = default;

  // "#" tags, "@" contexts, "+" projects, "*" status; "!" priority disabled
  static TriggerConfig defaults();

  void set(PropertyKind kind, std::string trigger, bool enabled);
  void setEnabled(PropertyKind kind, bool enabled);
  const PropertyTrigger& get(PropertyKind kind) const;

  /**
   * @brief Trigger for a kind if it is enabled and usable
   */
  std::optional<std::string_view> activeTrigger(PropertyKind kind) const;

  /**
   * @brief Property kind that owns an enabled trigger
   */
  std::optional<PropertyKind> kindForTrigger(std::string_view trigger) const;

  /**
   * @brief Enabled triggers, longest trigger first
   */
  std::vector<std::pair<PropertyKind, std::string>> enabledTriggers() const;

  /**
   * @brief Copy with malformed entries disabled
   *
   * Blank triggers and triggers containing whitespace are disabled. When
   * several enabled kinds share a trigger, the first claimant in the order
   * tag, context, project, status, priority keeps it.
   */
  TriggerConfig normalized() const;

  bool operator==(const TriggerConfig&) const = default;

 private:
  static size_t indexOf(PropertyKind kind) { return static_cast<size_t>(kind); }

  std::array<PropertyTrigger, 5> triggers_;
};

}  // namespace tasklex::core
