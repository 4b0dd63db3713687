#include "tasklex/nlp/task_parser.hpp"

#include <spdlog/spdlog.h>

#include "tasklex/nlp/estimate.hpp"
#include "tasklex/nlp/lexicon_matcher.hpp"
#include "tasklex/nlp/recurrence.hpp"
#include "tasklex/nlp/token_list.hpp"
#include "tasklex/util/text.hpp"

namespace tasklex::nlp {

using core::PropertyKind;
using util::Text;

std::string_view parseStageToString(ParseStage stage) {
  switch (stage) {
    case ParseStage::kRaw:
      return "raw";
    case ParseStage::kStatusStripped:
      return "status-stripped";
    case ParseStage::kPriorityStripped:
      return "priority-stripped";
    case ParseStage::kDateTimeStripped:
      return "date-time-stripped";
    case ParseStage::kRecurrenceStripped:
      return "recurrence-stripped";
    case ParseStage::kEstimateStripped:
      return "estimate-stripped";
    case ParseStage::kTokensStripped:
      return "tokens-stripped";
    case ParseStage::kFinalized:
      return "finalized";
  }
  return "unknown";
}

TaskParser::TaskParser(ParserSettings settings)
    : settings_(std::move(settings)),
      language_(&languageProfile(settings_.language)),
      statuses_(settings_.statuses),
      priorities_(settings_.priorities),
      date_time_(settings_.recognizer, settings_.default_to_scheduled) {
  if (!isSupportedLanguage(settings_.language)) {
    spdlog::debug("Unsupported language '{}', using {}", settings_.language, language_->code);
  }
  settings_.triggers = settings_.triggers.normalized();

  if (statuses_.empty()) {
    statuses_ = fallbackLexicon(language_->fallback_statuses);
  }
  if (priorities_.empty()) {
    priorities_ = fallbackLexicon(language_->fallback_priorities);
  }
}

core::ExtractionResult TaskParser::parse(std::string_view input) const {
  return parse(input, ReferenceInstant::now());
}

core::ExtractionResult TaskParser::parse(std::string_view input,
                                         const ReferenceInstant& reference) const {
  State state;

  std::string_view trimmed = Text::trim(input);
  auto line_break = trimmed.find('\n');
  if (line_break != std::string_view::npos) {
    auto details = Text::trim(trimmed.substr(line_break + 1));
    if (!details.empty()) {
      state.result.details = std::string(details);
    }
    trimmed = Text::trim(trimmed.substr(0, line_break));
  }
  state.text = Text::collapseWhitespace(trimmed);

  stripStatus(state);
  stripPriority(state);
  stripDateTime(state, reference);
  stripRecurrence(state);
  stripEstimate(state);
  stripTokens(state);
  finalize(state);

  return std::move(state.result);
}

void TaskParser::advance(State& state, ParseStage next) {
  state.stage = next;
  spdlog::debug("[{}] '{}'", parseStageToString(next), state.text);
}

void TaskParser::stripStatus(State& state) const {
  auto match = LexiconMatcher::findBestMatch(state.text, statuses_,
                                             settings_.triggers.activeTrigger(PropertyKind::kStatus));
  if (match) {
    state.result.status = match->canonical_id;
    state.text = Text::removeRanges(state.text, {match->range()});
  }
  advance(state, ParseStage::kStatusStripped);
}

void TaskParser::stripPriority(State& state) const {
  auto match = LexiconMatcher::findBestMatch(
      state.text, priorities_, settings_.triggers.activeTrigger(PropertyKind::kPriority));
  if (match) {
    state.result.priority = match->canonical_id;
    state.text = Text::removeRanges(state.text, {match->range()});
  }
  advance(state, ParseStage::kPriorityStripped);
}

void TaskParser::stripDateTime(State& state, const ReferenceInstant& reference) const {
  auto extraction = date_time_.extract(state.text, *language_, reference);
  state.result.due_date = extraction.due_date;
  state.result.due_time = extraction.due_time;
  state.result.scheduled_date = extraction.scheduled_date;
  state.result.scheduled_time = extraction.scheduled_time;
  state.text = std::move(extraction.remaining);
  advance(state, ParseStage::kDateTimeStripped);
}

void TaskParser::stripRecurrence(State& state) const {
  if (auto match = RecurrenceExtractor::extract(state.text, *language_)) {
    state.result.recurrence_rule = match->rule;
    state.text = Text::removeRanges(state.text, {match->span});
  }
  advance(state, ParseStage::kRecurrenceStripped);
}

void TaskParser::stripEstimate(State& state) const {
  auto extraction = EstimateExtractor::extract(state.text, *language_);
  state.result.estimate_minutes = extraction.minutes;
  state.text = std::move(extraction.remaining);
  advance(state, ParseStage::kEstimateStripped);
}

void TaskParser::stripTokens(State& state) const {
  struct TokenTarget {
    PropertyKind kind;
    std::vector<std::string>* tokens;
  };

  for (const auto& target : {TokenTarget{PropertyKind::kContext, &state.result.contexts},
                             TokenTarget{PropertyKind::kTag, &state.result.tags},
                             TokenTarget{PropertyKind::kProject, &state.result.projects}}) {
    auto trigger = settings_.triggers.activeTrigger(target.kind);
    if (!trigger) {
      continue;
    }
    auto extraction = TokenListExtractor::extract(state.text, *trigger);
    *target.tokens = std::move(extraction.tokens);
    state.text = std::move(extraction.remaining);
  }
  advance(state, ParseStage::kTokensStripped);
}

void TaskParser::finalize(State& state) const {
  state.result.title = Text::collapseWhitespace(state.text);
  advance(state, ParseStage::kFinalized);
}

}  // namespace tasklex::nlp
