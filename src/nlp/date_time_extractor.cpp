#include "tasklex/nlp/date_time_extractor.hpp"

#include <algorithm>

#include <spdlog/spdlog.h>

#include "tasklex/util/text.hpp"

namespace tasklex::nlp {

using util::Text;
using util::TextRange;

namespace {

enum class Slot { kDue, kScheduled };

bool isCodePointBoundary(std::string_view text, size_t pos) {
  if (pos == 0 || pos >= text.size()) {
    return pos <= text.size();
  }
  // UTF-8 continuation bytes look like 10xxxxxx
  return (static_cast<unsigned char>(text[pos]) & 0xC0) != 0x80;
}

}  // namespace

DateTimeExtractor::DateTimeExtractor(std::shared_ptr<const DatePhraseRecognizer> recognizer,
                                     bool default_to_scheduled)
    : recognizer_(recognizer ? std::move(recognizer)
                             : std::make_shared<RuleBasedDateRecognizer>()),
      default_to_scheduled_(default_to_scheduled) {}

std::vector<RecognizedPhrase> DateTimeExtractor::recognize(
    std::string_view text, const LanguageProfile& language,
    const ReferenceInstant& reference) const {
  std::vector<RecognizedPhrase> phrases;
  try {
    phrases = recognizer_->recognize(text, language, reference);
  } catch (const std::exception& e) {
    spdlog::debug("Date recognizer failed, skipping date phase: {}", e.what());
    return {};
  } catch (...) {
    spdlog::debug("Date recognizer failed with an unknown error, skipping date phase");
    return {};
  }

  // Keep well-formed, non-overlapping phrases in text order
  std::erase_if(phrases, [&](const RecognizedPhrase& phrase) {
    return phrase.start >= phrase.end || phrase.end > text.size() || !phrase.date.ok() ||
           (phrase.time && !phrase.time->valid()) || !isCodePointBoundary(text, phrase.start) ||
           !isCodePointBoundary(text, phrase.end);
  });
  for (auto& phrase : phrases) {
    if (phrase.time_start && (!phrase.time || *phrase.time_start <= phrase.start ||
                              *phrase.time_start >= phrase.end ||
                              !isCodePointBoundary(text, *phrase.time_start))) {
      phrase.time_start.reset();
    }
  }
  std::stable_sort(phrases.begin(), phrases.end(),
                   [](const RecognizedPhrase& a, const RecognizedPhrase& b) {
                     return a.start < b.start;
                   });

  std::vector<RecognizedPhrase> result;
  for (auto& phrase : phrases) {
    if (!result.empty() && phrase.start < result.back().end) {
      continue;
    }
    result.push_back(std::move(phrase));
  }
  return result;
}

DateTimeExtraction DateTimeExtractor::extract(std::string_view text,
                                              const LanguageProfile& language,
                                              const ReferenceInstant& reference) const {
  DateTimeExtraction extraction;
  extraction.remaining = std::string(text);

  auto phrases = recognize(text, language, reference);
  if (phrases.empty()) {
    return extraction;
  }

  KeywordSet due_cues = KeywordSet::single(language.cues.due);
  KeywordSet scheduled_cues = KeywordSet::single(language.cues.scheduled);
  KeywordSet range_start_cues = KeywordSet::single(language.cues.range_start);
  KeywordSet range_end_cues = KeywordSet::single(language.cues.range_end);

  std::vector<WordList> recurrence_words = {language.recurrence.every, language.recurrence.other};
  for (const auto& ordinal : language.recurrence.ordinals) {
    recurrence_words.push_back(ordinal);
  }
  KeywordSet recurrence_anchors(recurrence_words);

  const Slot default_slot = default_to_scheduled_ ? Slot::kScheduled : Slot::kDue;
  auto slot_filled = [&](Slot slot) {
    return slot == Slot::kDue ? extraction.due_date.has_value()
                              : extraction.scheduled_date.has_value();
  };
  auto fill = [&](Slot slot, const RecognizedPhrase& phrase) {
    if (slot == Slot::kDue) {
      extraction.due_date = phrase.date;
      extraction.due_time = phrase.time;
    } else {
      extraction.scheduled_date = phrase.date;
      extraction.scheduled_time = phrase.time;
    }
  };

  std::vector<TextRange> consumed;
  // Earlier phrases may have consumed the cue already
  auto cue_start = [&](const KeywordSet& cues, size_t pos) -> std::optional<size_t> {
    auto start = cues.matchBefore(text, pos);
    if (start && !consumed.empty() && *start < consumed.back().end) {
      return std::nullopt;
    }
    return start;
  };

  for (size_t i = 0; i < phrases.size(); ++i) {
    const auto& phrase = phrases[i];

    // "every monday at 9am": the weekday belongs to the recurrence, the time
    // to the first occurrence
    if (recurrence_anchors.matchBefore(text, phrase.start)) {
      if (!phrase.time_start) {
        spdlog::debug("Leaving '{}' to the recurrence phase",
                      text.substr(phrase.start, phrase.end - phrase.start));
        continue;
      }
      if (!slot_filled(default_slot)) {
        fill(default_slot, phrase);
      }
      spdlog::debug("Taking time '{}' of a recurring date",
                    text.substr(*phrase.time_start, phrase.end - *phrase.time_start));
      consumed.push_back({*phrase.time_start, phrase.end});
      continue;
    }

    // "from monday to friday" spans scheduled to due
    if (i + 1 < phrases.size() && !extraction.due_date && !extraction.scheduled_date) {
      const auto& last = phrases[i + 1];
      auto range_start = cue_start(range_start_cues, phrase.start);
      auto range_end = range_end_cues.matchBefore(text, last.start);
      if (range_start && range_end && *range_end >= phrase.end &&
          Text::skipWhitespace(text, phrase.end) == *range_end &&
          !recurrence_anchors.matchBefore(text, last.start)) {
        fill(Slot::kScheduled, phrase);
        fill(Slot::kDue, last);
        spdlog::debug("Date range '{}' -> scheduled {} due {}",
                      text.substr(*range_start, last.end - *range_start),
                      core::formatDate(phrase.date), core::formatDate(last.date));
        consumed.push_back({*range_start, last.end});
        ++i;
        continue;
      }
    }

    Slot slot = default_slot;
    size_t start = phrase.start;
    auto due_cue = cue_start(due_cues, phrase.start);
    auto scheduled_cue = cue_start(scheduled_cues, phrase.start);
    // The cue that starts first wins, so "due on friday" is a due date
    if (due_cue && (!scheduled_cue || *due_cue <= *scheduled_cue)) {
      slot = Slot::kDue;
      start = *due_cue;
    } else if (scheduled_cue) {
      slot = Slot::kScheduled;
      start = *scheduled_cue;
    }

    if (slot_filled(slot)) {
      spdlog::debug("Discarding '{}', the {} slot is taken",
                    text.substr(start, phrase.end - start),
                    slot == Slot::kDue ? "due" : "scheduled");
    } else {
      fill(slot, phrase);
      spdlog::debug("Date phrase '{}' -> {} {}",
                    text.substr(start, phrase.end - start),
                    slot == Slot::kDue ? "due" : "scheduled", core::formatDate(phrase.date));
    }
    consumed.push_back({start, phrase.end});
  }

  if (!consumed.empty()) {
    extraction.remaining = Text::removeRanges(text, consumed);
  }
  return extraction;
}

}  // namespace tasklex::nlp
