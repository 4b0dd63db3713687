#include "tasklex/core/lexicon.hpp"

namespace tasklex::core {

std::string_view propertyKindToString(PropertyKind kind) {
  switch (kind) {
    case PropertyKind::kStatus:
      return "status";
    case PropertyKind::kPriority:
      return "priority";
    case PropertyKind::kTag:
      return "tag";
    case PropertyKind::kContext:
      return "context";
    case PropertyKind::kProject:
      return "project";
  }
  return "status";
}

std::optional<PropertyKind> propertyKindFromString(std::string_view name) {
  // Accept both the singular names and the plural property ids used in settings files
  if (name == "status") return PropertyKind::kStatus;
  if (name == "priority") return PropertyKind::kPriority;
  if (name == "tag" || name == "tags") return PropertyKind::kTag;
  if (name == "context" || name == "contexts") return PropertyKind::kContext;
  if (name == "project" || name == "projects") return PropertyKind::kProject;
  return std::nullopt;
}

const std::string& LexiconEntry::canonicalId() const {
  return util::Text::isBlank(id) ? value : id;
}

Lexicon defaultStatuses() {
  return {
    {"none", "none", "None", false, 0},
    {"open", "open", "Open", false, 1},
    {"in-progress", "in-progress", "In progress", false, 2},
    {"done", "done", "Done", true, 3},
  };
}

Lexicon defaultPriorities() {
  return {
    {"none", "none", "None", false, 0},
    {"low", "low", "Low", false, 1},
    {"normal", "normal", "Normal", false, 2},
    {"high", "high", "High", false, 3},
  };
}

}  // namespace tasklex::core
