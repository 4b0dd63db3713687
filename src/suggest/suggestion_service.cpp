#include "tasklex/suggest/suggestion_service.hpp"

#include <algorithm>

#include <spdlog/spdlog.h>

#include "tasklex/util/text.hpp"

namespace tasklex::suggest {

using core::PropertyKind;
using util::Text;

namespace {

// Offset of the last trigger occurrence that starts before the cursor
std::optional<size_t> lastTriggerBefore(std::string_view text, std::string_view trigger,
                                        size_t cursor) {
  if (Text::isBlank(trigger) || cursor < trigger.size()) {
    return std::nullopt;
  }
  auto pos = text.substr(0, cursor).rfind(trigger);
  if (pos == std::string_view::npos) {
    return std::nullopt;
  }
  return pos;
}

bool onlyWordBetween(std::string_view text, size_t from, size_t to) {
  return from <= to && Text::findWhitespace(text.substr(0, to), from) == std::string_view::npos;
}

}  // namespace

SuggestionService::SuggestionService(core::TriggerConfig triggers)
    : triggers_(triggers.normalized()) {}

bool SuggestionService::hasTrigger(std::string_view text, std::string_view trigger,
                                   size_t cursor) {
  cursor = std::min(cursor, text.size());
  auto pos = lastTriggerBefore(text, trigger, cursor);
  return pos && onlyWordBetween(text, *pos + trigger.size(), cursor);
}

std::string SuggestionService::extractQueryAfterTrigger(std::string_view text,
                                                        std::string_view trigger,
                                                        size_t cursor) {
  cursor = std::min(cursor, text.size());
  if (!hasTrigger(text, trigger, cursor)) {
    return "";
  }

  size_t start = *lastTriggerBefore(text, trigger, cursor) + trigger.size();
  size_t end = Text::findWhitespace(text, cursor);
  if (end == std::string_view::npos) {
    end = cursor;
  }
  return std::string(text.substr(start, end - start));
}

std::vector<Suggestion> SuggestionService::rankSuggestions(std::string_view query,
                                                           const core::Lexicon& entries,
                                                           PropertyKind kind, size_t limit) {
  std::vector<const core::LexiconEntry*> matches;
  for (const auto& entry : entries) {
    if (Text::isBlank(entry.value) || Text::isBlank(entry.label)) {
      continue;
    }
    if (Text::containsIgnoreCase(entry.value, query) ||
        Text::containsIgnoreCase(entry.label, query)) {
      matches.push_back(&entry);
    }
  }

  std::stable_sort(matches.begin(), matches.end(),
                   [](const core::LexiconEntry* a, const core::LexiconEntry* b) {
                     return a->order < b->order;
                   });

  std::vector<Suggestion> suggestions;
  for (const auto* entry : matches) {
    if (suggestions.size() >= limit) {
      break;
    }
    suggestions.push_back({entry->value, entry->label, entry->label, kind});
  }
  return suggestions;
}

SelectionResult SuggestionService::applySelection(std::string_view text,
                                                  std::string_view trigger,
                                                  size_t trigger_offset,
                                                  const Suggestion& suggestion, InsertMode mode) {
  if (Text::isBlank(trigger) || trigger_offset > text.size() ||
      text.compare(trigger_offset, trigger.size(), trigger) != 0) {
    spdlog::debug("No trigger '{}' at offset {}, leaving text unchanged", trigger, trigger_offset);
    return {std::string(text), std::min(trigger_offset, text.size())};
  }

  size_t query_end = Text::findWhitespace(text, trigger_offset + trigger.size());
  if (query_end == std::string_view::npos) {
    query_end = text.size();
  }

  const std::string& inserted = mode == InsertMode::kValue ? suggestion.value : suggestion.label;

  SelectionResult result;
  result.new_text.reserve(text.size() + inserted.size());
  result.new_text.append(text.substr(0, trigger_offset));
  result.new_text.append(inserted);
  result.new_text.append(text.substr(query_end));
  result.new_cursor = trigger_offset + inserted.size();
  return result;
}

bool SuggestionService::isValidContext(std::string_view text, size_t cursor) {
  cursor = std::min(cursor, text.size());
  size_t quotes = 0;
  for (size_t i = 0; i < cursor; ++i) {
    if (text[i] != '"') {
      continue;
    }
    // Only an odd run of backslashes escapes the quote
    size_t backslashes = 0;
    while (backslashes < i && text[i - 1 - backslashes] == '\\') {
      ++backslashes;
    }
    if (backslashes % 2 == 0) {
      ++quotes;
    }
  }
  return quotes % 2 == 0;
}

std::optional<ActiveTrigger> SuggestionService::detectActiveTrigger(std::string_view text,
                                                                    size_t cursor) const {
  cursor = std::min(cursor, text.size());
  if (!isValidContext(text, cursor)) {
    return std::nullopt;
  }

  std::optional<ActiveTrigger> best;
  for (const auto& [kind, trigger] : triggers_.enabledTriggers()) {
    auto pos = lastTriggerBefore(text, trigger, cursor);
    if (!pos || !onlyWordBetween(text, *pos + trigger.size(), cursor)) {
      continue;
    }
    // "#" inside "a#b" is not a trigger, "(#b" is
    if (*pos > 0 && Text::isWordCodePoint(Text::codePointBefore(text, *pos))) {
      continue;
    }
    // Longer triggers come first; "#" inside an active "##" is part of it
    if (best && *pos >= best->offset && *pos < best->offset + best->trigger.size()) {
      continue;
    }
    if (!best || *pos > best->offset) {
      size_t query_start = *pos + trigger.size();
      best = ActiveTrigger{kind, *pos, trigger,
                           std::string(text.substr(query_start, cursor - query_start))};
    }
  }
  return best;
}

std::vector<Suggestion> SuggestionService::suggestionsAt(std::string_view text, size_t cursor,
                                                         const core::Lexicon& statuses,
                                                         const core::Lexicon& priorities,
                                                         size_t limit) const {
  auto active = detectActiveTrigger(text, cursor);
  if (!active) {
    return {};
  }

  switch (active->kind) {
    case PropertyKind::kStatus:
      return rankSuggestions(active->query, statuses, PropertyKind::kStatus, limit);
    case PropertyKind::kPriority:
      return rankSuggestions(active->query, priorities, PropertyKind::kPriority, limit);
    default:
      return {};
  }
}

}  // namespace tasklex::suggest
