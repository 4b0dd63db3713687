#pragma once

#include <memory>
#include <string>
#include <string_view>

#include "tasklex/core/extraction_result.hpp"
#include "tasklex/core/lexicon.hpp"
#include "tasklex/core/trigger_config.hpp"
#include "tasklex/nlp/date_phrase.hpp"
#include "tasklex/nlp/date_time_extractor.hpp"
#include "tasklex/nlp/language.hpp"

namespace tasklex::nlp {

/**
 * @brief Everything a parser needs, fixed at construction
 */
struct ParserSettings {
  core::Lexicon statuses;      // Empty selects the language's built-in keywords
  core::Lexicon priorities;
  core::TriggerConfig triggers = core::TriggerConfig::defaults();
  std::string language = "en";
  bool default_to_scheduled = false;
  std::shared_ptr<const DatePhraseRecognizer> recognizer;  // Null selects the rule-based one
};

/**
 * @brief Pipeline stages, in the only order they can run
 */
enum class ParseStage {
  kRaw,
  kStatusStripped,
  kPriorityStripped,
  kDateTimeStripped,
  kRecurrenceStripped,
  kEstimateStripped,
  kTokensStripped,
  kFinalized
};

std::string_view parseStageToString(ParseStage stage);

/**
 * @brief Turns one line of free text into an ExtractionResult
 *
 * Phases run in a fixed order: status, priority, date/time, recurrence,
 * estimate and finally the token lists (contexts, tags, projects). Each phase
 * removes what it consumed, so later phases never see text claimed by an
 * earlier one. Whatever is left becomes the title. Anything after the first
 * line of input is returned untouched as details.
 *
 * A parser is immutable after construction and can be shared between
 * threads.
 */
class TaskParser {
 public:
  explicit TaskParser(ParserSettings settings);

  // Parse relative to the current local time
  core::ExtractionResult parse(std::string_view input) const;

  core::ExtractionResult parse(std::string_view input, const ReferenceInstant& reference) const;

  const ParserSettings& settings() const { return settings_; }
  const LanguageProfile& language() const { return *language_; }

 private:
  struct State {
    ParseStage stage = ParseStage::kRaw;
    std::string text;
    core::ExtractionResult result;
  };

  void stripStatus(State& state) const;
  void stripPriority(State& state) const;
  void stripDateTime(State& state, const ReferenceInstant& reference) const;
  void stripRecurrence(State& state) const;
  void stripEstimate(State& state) const;
  void stripTokens(State& state) const;
  void finalize(State& state) const;

  static void advance(State& state, ParseStage next);

  ParserSettings settings_;
  const LanguageProfile* language_;
  core::Lexicon statuses_;
  core::Lexicon priorities_;
  DateTimeExtractor date_time_;
};

}  // namespace tasklex::nlp
