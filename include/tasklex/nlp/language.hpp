#pragma once

#include <array>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "tasklex/core/lexicon.hpp"
#include "tasklex/nlp/keyword_set.hpp"

namespace tasklex::nlp {

/**
 * @brief Words that assign a date phrase to a slot ("due friday", "on friday")
 *
 * `range_start` and `range_end` bracket a span ("from monday to friday") whose
 * start is scheduled and whose end is due.
 */
struct DateCues {
  WordList due;
  WordList scheduled;
  WordList range_start;
  WordList range_end;
};

/**
 * @brief Vocabulary of the bundled date recognizer
 */
struct DateVocabulary {
  std::vector<std::pair<std::string, int>> relative_days;  // Word and day offset
  WordList now;
  WordList next;            // Placed before the unit ("next friday")
  WordList next_after;      // Placed after the unit ("vendredi prochain")
  WordList in;              // "in 3 days"
  WordList at;              // "at 3pm"
  WordList noon;
  WordList midnight;
  WordList am;              // Empty for 24-hour locales
  WordList pm;
  WordList hour_suffix;     // "15 Uhr"
  std::array<WordList, 12> months;
  WordList ordinal_suffixes;
  WordList day_month_connectors;  // "15 de marzo"
  bool month_first_numeric = false;
};

/**
 * @brief Vocabulary of the recurrence extractor
 *
 * Weekday arrays start on Monday, period arrays are day, week, month, year.
 */
struct RecurrenceVocabulary {
  std::array<WordList, 4> frequencies;
  WordList every;
  WordList other;
  std::array<WordList, 7> plural_weekdays;
  std::array<WordList, 5> ordinals;  // first, second, third, fourth, last
  std::array<WordList, 4> periods;
};

struct EstimateUnits {
  WordList hours;
  WordList minutes;
};

/**
 * @brief Built-in keywords used when the caller supplies no lexicon
 */
struct FallbackKeywords {
  std::string canonical_id;
  bool is_terminal = false;
  WordList words;
};

/**
 * @brief Locale specific keyword tables
 */
struct LanguageProfile {
  std::string code;
  std::string name;
  DateCues cues;
  std::array<WordList, 7> weekdays;
  DateVocabulary dates;
  RecurrenceVocabulary recurrence;
  EstimateUnits estimate;
  std::vector<FallbackKeywords> fallback_statuses;
  std::vector<FallbackKeywords> fallback_priorities;
};

/**
 * @brief Profile for an ISO-639-1 code
 *
 * Region suffixes are ignored ("de-AT" selects "de"). Unknown codes fall
 * back to English.
 */
const LanguageProfile& languageProfile(std::string_view code);

bool isSupportedLanguage(std::string_view code);

// Codes of all bundled profiles, sorted
std::vector<std::string> availableLanguages();

/**
 * @brief Lexicon built from fallback keywords
 *
 * Every keyword becomes one entry whose id is the canonical id of its group,
 * so "completed" and "finished" both report "done".
 */
core::Lexicon fallbackLexicon(const std::vector<FallbackKeywords>& keywords);

}  // namespace tasklex::nlp
