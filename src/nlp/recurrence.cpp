#include "tasklex/nlp/recurrence.hpp"

#include <array>
#include <functional>

#include <spdlog/spdlog.h>

#include "tasklex/nlp/keyword_set.hpp"

namespace tasklex::nlp {

using util::Text;

namespace {

constexpr std::array<const char*, 7> kWeekdayCodes = {"MO", "TU", "WE", "TH", "FR", "SA", "SU"};
constexpr std::array<const char*, 4> kFrequencies = {"DAILY", "WEEKLY", "MONTHLY", "YEARLY"};
constexpr std::array<int, 5> kSetPositions = {1, 2, 3, 4, -1};

struct PatternHit {
  size_t end;
  std::string rule;
};

using Pattern = std::function<std::optional<PatternHit>(size_t)>;

class RecurrencePatterns {
 public:
  RecurrencePatterns(std::string_view text, const LanguageProfile& language)
      : text_(text),
        every_(KeywordSet::single(language.recurrence.every)),
        other_(KeywordSet::single(language.recurrence.other)),
        ordinals_(language.recurrence.ordinals),
        weekdays_(language.weekdays),
        plural_weekdays_(language.recurrence.plural_weekdays),
        periods_(language.recurrence.periods),
        frequencies_(language.recurrence.frequencies) {}

  std::vector<Pattern> families() const {
    return {
      [this](size_t pos) { return ordinalWeekday(pos); },
      [this](size_t pos) { return interval(pos); },
      [this](size_t pos) { return everyOther(pos); },
      [this](size_t pos) { return everyWeekday(pos); },
      [this](size_t pos) { return pluralWeekday(pos); },
      [this](size_t pos) { return frequency(pos); },
    };
  }

 private:
  // Offset after "every" and the whitespace that follows it
  std::optional<size_t> afterEvery(size_t pos) const {
    auto every = every_.matchAt(text_, pos);
    if (!every) {
      return std::nullopt;
    }
    return spaceAfter(every->end);
  }

  std::optional<size_t> spaceAfter(size_t pos) const {
    size_t next = Text::skipWhitespace(text_, pos);
    if (next == pos || next >= text_.size()) {
      return std::nullopt;
    }
    return next;
  }

  // every second monday
  std::optional<PatternHit> ordinalWeekday(size_t pos) const {
    auto ordinal_pos = afterEvery(pos);
    if (!ordinal_pos) return std::nullopt;
    auto ordinal = ordinals_.matchAt(text_, *ordinal_pos);
    if (!ordinal) return std::nullopt;
    auto weekday_pos = spaceAfter(ordinal->end);
    if (!weekday_pos) return std::nullopt;
    auto weekday = weekdays_.matchAt(text_, *weekday_pos);
    if (!weekday) return std::nullopt;

    return PatternHit{weekday->end,
                      std::string("FREQ=MONTHLY;BYDAY=") + kWeekdayCodes[weekday->group] +
                          ";BYSETPOS=" + std::to_string(kSetPositions[ordinal->group])};
  }

  // every 3 weeks
  std::optional<PatternHit> interval(size_t pos) const {
    auto number_pos = afterEvery(pos);
    if (!number_pos) return std::nullopt;
    auto count = matchNumber(text_, *number_pos, 3);
    if (!count || count->first == 0) return std::nullopt;
    auto period_pos = spaceAfter(count->second);
    if (!period_pos) return std::nullopt;
    auto period = periods_.matchAt(text_, *period_pos);
    if (!period) return std::nullopt;

    return PatternHit{period->end, std::string("FREQ=") + kFrequencies[period->group] +
                                       ";INTERVAL=" + std::to_string(count->first)};
  }

  // every other week
  std::optional<PatternHit> everyOther(size_t pos) const {
    auto other_pos = afterEvery(pos);
    if (!other_pos) return std::nullopt;
    auto other = other_.matchAt(text_, *other_pos);
    if (!other) return std::nullopt;
    auto period_pos = spaceAfter(other->end);
    if (!period_pos) return std::nullopt;
    auto period = periods_.matchAt(text_, *period_pos);
    if (!period) return std::nullopt;

    return PatternHit{period->end,
                      std::string("FREQ=") + kFrequencies[period->group] + ";INTERVAL=2"};
  }

  // every monday
  std::optional<PatternHit> everyWeekday(size_t pos) const {
    auto weekday_pos = afterEvery(pos);
    if (!weekday_pos) return std::nullopt;
    auto weekday = weekdays_.matchAt(text_, *weekday_pos);
    if (!weekday) return std::nullopt;

    return PatternHit{weekday->end,
                      std::string("FREQ=WEEKLY;BYDAY=") + kWeekdayCodes[weekday->group]};
  }

  // mondays
  std::optional<PatternHit> pluralWeekday(size_t pos) const {
    auto weekday = plural_weekdays_.matchAt(text_, pos);
    if (!weekday) return std::nullopt;

    return PatternHit{weekday->end,
                      std::string("FREQ=WEEKLY;BYDAY=") + kWeekdayCodes[weekday->group]};
  }

  // daily, every week
  std::optional<PatternHit> frequency(size_t pos) const {
    auto match = frequencies_.matchAt(text_, pos);
    if (!match) return std::nullopt;

    return PatternHit{match->end, std::string("FREQ=") + kFrequencies[match->group]};
  }

  std::string_view text_;
  KeywordSet every_;
  KeywordSet other_;
  KeywordSet ordinals_;
  KeywordSet weekdays_;
  KeywordSet plural_weekdays_;
  KeywordSet periods_;
  KeywordSet frequencies_;
};

}  // namespace

std::optional<RecurrenceMatch> RecurrenceExtractor::extract(std::string_view text,
                                                            const LanguageProfile& language) {
  RecurrencePatterns patterns(text, language);

  for (const auto& family : patterns.families()) {
    size_t pos = 0;
    while (pos < text.size()) {
      if (Text::isBoundaryBefore(text, pos)) {
        if (auto hit = family(pos)) {
          if (isValidRule(hit->rule)) {
            spdlog::debug("Recurrence '{}' -> {}", text.substr(pos, hit->end - pos), hit->rule);
            return RecurrenceMatch{hit->rule, {pos, hit->end}};
          }
          spdlog::debug("Rejected malformed recurrence rule {}", hit->rule);
        }
      }
      Text::nextCodePoint(text, pos);
    }
  }

  return std::nullopt;
}

bool RecurrenceExtractor::isValidRule(std::string_view rule) {
  if (rule.find("FREQ=") == std::string_view::npos) {
    return false;
  }

  auto by_day = rule.find("BYDAY=");
  if (by_day != std::string_view::npos) {
    auto value_start = by_day + 6;
    auto value_end = rule.find(';', value_start);
    auto value = rule.substr(value_start, value_end == std::string_view::npos
                                              ? std::string_view::npos
                                              : value_end - value_start);
    if (Text::isBlank(value) || value == "undefined") {
      return false;
    }
  }

  return true;
}

}  // namespace tasklex::nlp
