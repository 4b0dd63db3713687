#pragma once

#include <optional>
#include <string_view>
#include <vector>

#include "tasklex/core/extraction_result.hpp"
#include "tasklex/nlp/keyword_set.hpp"
#include "tasklex/nlp/language.hpp"

namespace tasklex::nlp {

/**
 * @brief Point in time that relative phrases are resolved against
 */
struct ReferenceInstant {
  core::CalendarDate date;
  core::TimeOfDay time;

  // Current local date and time
  static ReferenceInstant now();
};

/**
 * @brief Date phrase found by a recognizer
 *
 * Offsets are byte offsets into the recognized text. The time is only set
 * when the phrase mentions one explicitly. `time_start` marks where a trailing
 * time begins in phrases like "monday at 9am".
 */
struct RecognizedPhrase {
  size_t start = 0;
  size_t end = 0;
  core::CalendarDate date;
  std::optional<core::TimeOfDay> time;
  std::optional<size_t> time_start;
};

/**
 * @brief Finds date and time phrases in text
 *
 * Implementations must be synchronous. They may throw; the caller treats an
 * exception as "no phrases".
 */
class DatePhraseRecognizer {
 public:
  virtual ~DatePhraseRecognizer() = default;

  /**
   * @brief Recognize all date phrases in text, left to right
   * @param text Text to scan
   * @param language Active language profile
   * @param reference Instant that relative phrases resolve against
   */
  virtual std::vector<RecognizedPhrase> recognize(std::string_view text,
                                                  const LanguageProfile& language,
                                                  const ReferenceInstant& reference) const = 0;
};

/**
 * @brief Keyword and pattern based recognizer driven by the language profile
 *
 * Understands relative day words, "now", weekdays, "next <weekday|period>",
 * "in N <period>", ISO dates, month name dates, numeric dates and clock
 * times, optionally combined ("tomorrow at 3pm", "3pm friday").
 */
class RuleBasedDateRecognizer : public DatePhraseRecognizer {
 public:
  std::vector<RecognizedPhrase> recognize(std::string_view text,
                                          const LanguageProfile& language,
                                          const ReferenceInstant& reference) const override;

 private:
  struct DateMatch {
    size_t end;
    core::CalendarDate date;
    std::optional<core::TimeOfDay> time;  // Set by "now"
  };

  struct TimeMatch {
    size_t end;
    core::TimeOfDay time;
  };

  class Scanner;
};

}  // namespace tasklex::nlp
