#pragma once

#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include "tasklex/nlp/date_phrase.hpp"
#include "tasklex/nlp/language.hpp"

namespace tasklex::nlp {

/**
 * @brief Dates assigned by the date/time phase and the text left behind
 */
struct DateTimeExtraction {
  std::optional<core::CalendarDate> due_date;
  std::optional<core::TimeOfDay> due_time;
  std::optional<core::CalendarDate> scheduled_date;
  std::optional<core::TimeOfDay> scheduled_time;
  std::string remaining;
};

/**
 * @brief Assigns recognized date phrases to the due and scheduled slots
 *
 * Phrases are visited left to right. A phrase right after a scheduling cue
 * fills the scheduled slot, one right after a due cue fills the due slot, and
 * an uncued phrase fills the default slot. A range ("from monday to friday")
 * fills both slots when both are empty. A phrase whose slot is taken is
 * removed from the text and discarded.
 *
 * Dates that follow recurrence wording ("every", "other", ordinals) are left
 * for the recurrence phase. A time attached to such a date ("every monday at
 * 9am") goes to the default slot together with the first occurrence.
 */
class DateTimeExtractor {
 public:
  explicit DateTimeExtractor(std::shared_ptr<const DatePhraseRecognizer> recognizer,
                             bool default_to_scheduled = false);

  DateTimeExtraction extract(std::string_view text, const LanguageProfile& language,
                             const ReferenceInstant& reference) const;

 private:
  std::vector<RecognizedPhrase> recognize(std::string_view text, const LanguageProfile& language,
                                          const ReferenceInstant& reference) const;

  std::shared_ptr<const DatePhraseRecognizer> recognizer_;
  bool default_to_scheduled_;
};

}  // namespace tasklex::nlp
