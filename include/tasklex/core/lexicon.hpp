#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "tasklex/util/text.hpp"

namespace tasklex::core {

/**
 * @brief Task property that can be populated from natural language
 */
enum class PropertyKind {
  kStatus,
  kPriority,
  kTag,
  kContext,
  kProject
};

std::string_view propertyKindToString(PropertyKind kind);
std::optional<PropertyKind> propertyKindFromString(std::string_view name);

/**
 * @brief One configured status or priority option
 *
 * Both value and label are valid match surfaces. The terminal flag marks a
 * completed status; the engine passes it through untouched.
 */
struct LexiconEntry {
  std::string id;
  std::string value;
  std::string label;
  bool is_terminal = false;
  int order = 0;

  // Identifier reported in results; falls back to the value when id is blank
  const std::string& canonicalId() const;

  bool operator==(const LexiconEntry&) const = default;
};

using Lexicon = std::vector<LexiconEntry>;

/**
 * @brief Consumed span produced by a single extraction phase
 */
struct MatchSpan {
  size_t start = 0;
  size_t end = 0;
  std::string matched_source;   // Text as it appeared in the input
  std::string canonical_id;
  bool via_trigger = false;

  util::TextRange range() const { return {start, end}; }
};

// Standard status set: none, open, in-progress, done
Lexicon defaultStatuses();

// Standard priority set: none, low, normal, high
Lexicon defaultPriorities();

}  // namespace tasklex::core
