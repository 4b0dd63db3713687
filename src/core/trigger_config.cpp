#include "tasklex/core/trigger_config.hpp"

#include <algorithm>

#include <spdlog/spdlog.h>

namespace tasklex::core {

TriggerConfig TriggerConfig::defaults() {
  TriggerConfig config;
  config.set(PropertyKind::kTag, "#", true);
  config.set(PropertyKind::kContext, "@", true);
  config.set(PropertyKind::kProject, "+", true);
  config.set(PropertyKind::kStatus, "*", true);
  // Priority uses keyword matching unless the user opts in
  config.set(PropertyKind::kPriority, "!", false);
  return config;
}

void TriggerConfig::set(PropertyKind kind, std::string trigger, bool enabled) {
  triggers_[indexOf(kind)] = PropertyTrigger{std::move(trigger), enabled};
}

void TriggerConfig::setEnabled(PropertyKind kind, bool enabled) {
  triggers_[indexOf(kind)].enabled = enabled;
}

const PropertyTrigger& TriggerConfig::get(PropertyKind kind) const {
  return triggers_[indexOf(kind)];
}

std::optional<std::string_view> TriggerConfig::activeTrigger(PropertyKind kind) const {
  const auto& entry = get(kind);
  if (!entry.enabled || entry.trigger.empty() || util::Text::containsWhitespace(entry.trigger)) {
    return std::nullopt;
  }
  return std::string_view(entry.trigger);
}

std::optional<PropertyKind> TriggerConfig::kindForTrigger(std::string_view trigger) const {
  for (const auto& [kind, value] : enabledTriggers()) {
    if (value == trigger) {
      return kind;
    }
  }
  return std::nullopt;
}

std::vector<std::pair<PropertyKind, std::string>> TriggerConfig::enabledTriggers() const {
  std::vector<std::pair<PropertyKind, std::string>> result;
  for (auto kind : {PropertyKind::kTag, PropertyKind::kContext, PropertyKind::kProject,
                    PropertyKind::kStatus, PropertyKind::kPriority}) {
    if (auto trigger = activeTrigger(kind)) {
      result.emplace_back(kind, std::string(*trigger));
    }
  }

  // Multi-character triggers must be tried before their single-character prefixes
  std::stable_sort(result.begin(), result.end(), [](const auto& a, const auto& b) {
    return a.second.size() > b.second.size();
  });
  return result;
}

TriggerConfig TriggerConfig::normalized() const {
  TriggerConfig result = *this;
  std::vector<std::string> claimed;

  for (auto kind : {PropertyKind::kTag, PropertyKind::kContext, PropertyKind::kProject,
                    PropertyKind::kStatus, PropertyKind::kPriority}) {
    auto& entry = result.triggers_[indexOf(kind)];
    if (!entry.enabled) {
      continue;
    }

    if (entry.trigger.empty() || util::Text::containsWhitespace(entry.trigger)) {
      spdlog::warn("Disabling {} trigger: '{}' is blank or contains whitespace",
                   propertyKindToString(kind), entry.trigger);
      entry.enabled = false;
      continue;
    }

    if (std::find(claimed.begin(), claimed.end(), entry.trigger) != claimed.end()) {
      spdlog::warn("Disabling {} trigger: '{}' is already used by another property",
                   propertyKindToString(kind), entry.trigger);
      entry.enabled = false;
      continue;
    }

    claimed.push_back(entry.trigger);
  }

  return result;
}

}  // namespace tasklex::core
