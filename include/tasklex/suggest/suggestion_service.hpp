#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "tasklex/core/lexicon.hpp"
#include "tasklex/core/trigger_config.hpp"

namespace tasklex::suggest {

/**
 * @brief Read-only view of a lexicon entry offered for completion
 */
struct Suggestion {
  std::string value;
  std::string label;
  std::string display;  // Text shown in a completion list
  core::PropertyKind kind = core::PropertyKind::kStatus;
};

// Which surface of a suggestion ends up in the text
enum class InsertMode {
  kLabel,
  kValue
};

struct SelectionResult {
  std::string new_text;
  size_t new_cursor = 0;
};

/**
 * @brief Trigger the user is currently typing after
 */
struct ActiveTrigger {
  core::PropertyKind kind;
  size_t offset = 0;     // Byte offset of the trigger
  std::string trigger;
  std::string query;     // Text between the trigger and the cursor
};

/**
 * @brief Completion support for property triggers in a live input buffer
 *
 * All offsets are byte offsets into UTF-8 text; cursors past the end are
 * clamped. Nothing here keeps state between calls.
 */
class SuggestionService {
 public:
  explicit SuggestionService(core::TriggerConfig triggers = core::TriggerConfig::defaults());

  /**
   * @brief Check whether the cursor sits right after a trigger word
   * @return true if the last trigger before the cursor has no whitespace
   *         between it and the cursor
   */
  static bool hasTrigger(std::string_view text, std::string_view trigger, size_t cursor);

  /**
   * @brief Text typed after the last trigger before the cursor
   *
   * Runs from the trigger to the first whitespace at or after the cursor,
   * or to the cursor when no whitespace follows. Empty when there is no
   * trigger.
   */
  static std::string extractQueryAfterTrigger(std::string_view text, std::string_view trigger,
                                              size_t cursor);

  /**
   * @brief Entries whose value or label contains the query
   * @param query Case-insensitive filter, empty matches everything
   * @param entries Candidate entries; blank values or labels are skipped
   * @param kind Property kind stamped on each suggestion
   * @param limit Maximum number of suggestions
   * @return Suggestions in entry order
   */
  static std::vector<Suggestion> rankSuggestions(std::string_view query,
                                                 const core::Lexicon& entries,
                                                 core::PropertyKind kind, size_t limit);

  /**
   * @brief Replace a trigger and its partial query with a suggestion
   * @param trigger_offset Byte offset of the trigger in text
   * @return New text and the cursor right after the inserted text
   */
  static SelectionResult applySelection(std::string_view text, std::string_view trigger,
                                        size_t trigger_offset, const Suggestion& suggestion,
                                        InsertMode mode = InsertMode::kLabel);

  // False when the cursor is inside a double-quoted span
  static bool isValidContext(std::string_view text, size_t cursor);

  /**
   * @brief Most recent enabled trigger the cursor is typing after
   *
   * Only triggers that start a word count, so an e-mail address does not
   * open context completion.
   */
  std::optional<ActiveTrigger> detectActiveTrigger(std::string_view text, size_t cursor) const;

  /**
   * @brief Detect the active trigger and rank matching status or priority entries
   */
  std::vector<Suggestion> suggestionsAt(std::string_view text, size_t cursor,
                                        const core::Lexicon& statuses,
                                        const core::Lexicon& priorities, size_t limit) const;

  const core::TriggerConfig& triggers() const { return triggers_; }

 private:
  core::TriggerConfig triggers_;
};

}  // namespace tasklex::suggest
