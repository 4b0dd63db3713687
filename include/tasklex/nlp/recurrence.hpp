#pragma once

#include <optional>
#include <string>
#include <string_view>

#include "tasklex/nlp/language.hpp"
#include "tasklex/util/text.hpp"

namespace tasklex::nlp {

struct RecurrenceMatch {
  std::string rule;  // RFC 5545 RRULE body, e.g. "FREQ=WEEKLY;INTERVAL=2"
  util::TextRange span;
};

/**
 * @brief Recognizes recurrence wording and turns it into an RRULE string
 *
 * Pattern families are tried in a fixed order, most specific first:
 * "every <ordinal> <weekday>", "every <N> <period>", "every other <period>",
 * "every <weekday>", plural weekdays ("mondays") and frequency words
 * ("daily", "every week"). Within a family the leftmost match wins.
 */
class RecurrenceExtractor {
 public:
  static std::optional<RecurrenceMatch> extract(std::string_view text,
                                                const LanguageProfile& language);

  /**
   * @brief Check that a rule names a frequency and has no empty BYDAY
   */
  static bool isValidRule(std::string_view rule);
};

}  // namespace tasklex::nlp
