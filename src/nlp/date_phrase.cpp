#include "tasklex/nlp/date_phrase.hpp"

#include <ctime>

#include "tasklex/util/text.hpp"

namespace tasklex::nlp {

using core::CalendarDate;
using core::TimeOfDay;
using util::Text;

namespace {

enum Period { kDay = 0, kWeek = 1, kMonth = 2, kYear = 3 };

CalendarDate addDays(const CalendarDate& date, int count) {
  return CalendarDate{std::chrono::sys_days{date} + std::chrono::days{count}};
}

CalendarDate addMonths(const CalendarDate& date, int count) {
  CalendarDate result = date + std::chrono::months{count};
  if (!result.ok()) {
    // Jan 31 + 1 month lands on the last day of February
    result = CalendarDate{std::chrono::year_month_day_last{
        result.year(), std::chrono::month_day_last{result.month()}}};
  }
  return result;
}

CalendarDate addPeriods(const CalendarDate& date, int period, int count) {
  switch (period) {
    case kDay:
      return addDays(date, count);
    case kWeek:
      return addDays(date, count * 7);
    case kMonth:
      return addMonths(date, count);
    default:
      return addMonths(date, count * 12);
  }
}

// Monday = 0
int weekdayIndex(const CalendarDate& date) {
  return static_cast<int>(std::chrono::weekday{std::chrono::sys_days{date}}.iso_encoding()) - 1;
}

std::optional<CalendarDate> makeDate(int year, int month, int day) {
  if (month < 1 || month > 12 || day < 1 || day > 31) {
    return std::nullopt;
  }
  CalendarDate date{std::chrono::year{year}, std::chrono::month{static_cast<unsigned>(month)},
                    std::chrono::day{static_cast<unsigned>(day)}};
  if (!date.ok()) {
    return std::nullopt;
  }
  return date;
}

std::vector<WordList> toGroups(const std::vector<std::pair<std::string, int>>& words) {
  std::vector<WordList> groups;
  for (const auto& [word, offset] : words) {
    groups.push_back({word});
  }
  return groups;
}

}  // namespace

ReferenceInstant ReferenceInstant::now() {
  std::time_t now = std::time(nullptr);
  std::tm local{};
  localtime_r(&now, &local);

  ReferenceInstant instant;
  instant.date = CalendarDate{std::chrono::year{local.tm_year + 1900},
                              std::chrono::month{static_cast<unsigned>(local.tm_mon + 1)},
                              std::chrono::day{static_cast<unsigned>(local.tm_mday)}};
  instant.time = TimeOfDay{local.tm_hour, local.tm_min};
  return instant;
}

/**
 * @brief Matches phrase patterns at a given offset of one text
 */
class RuleBasedDateRecognizer::Scanner {
 public:
  Scanner(std::string_view text, const LanguageProfile& language,
          const ReferenceInstant& reference)
      : text_(text),
        language_(language),
        reference_(reference),
        relative_days_(toGroups(language.dates.relative_days)),
        now_(KeywordSet::single(language.dates.now)),
        next_(KeywordSet::single(language.dates.next)),
        next_after_(KeywordSet::single(language.dates.next_after)),
        in_(KeywordSet::single(language.dates.in)),
        at_(KeywordSet::single(language.dates.at)),
        noon_(KeywordSet::single(language.dates.noon)),
        midnight_(KeywordSet::single(language.dates.midnight)),
        am_(KeywordSet::single(language.dates.am)),
        pm_(KeywordSet::single(language.dates.pm)),
        hour_suffix_(KeywordSet::single(language.dates.hour_suffix)),
        ordinal_suffix_(KeywordSet::single(language.dates.ordinal_suffixes)),
        connector_(KeywordSet::single(language.dates.day_month_connectors)),
        weekdays_(language.weekdays),
        months_(language.dates.months),
        periods_(language.recurrence.periods) {}

  std::optional<RecognizedPhrase> phraseAt(size_t pos) const {
    // Time first: "at 3pm tomorrow", "15:00"
    if (auto time = timeAt(pos)) {
      size_t after = Text::skipWhitespace(text_, time->end);
      if (after > time->end) {
        if (auto date = dateAt(after); date && !date->time) {
          return RecognizedPhrase{pos, date->end, date->date, time->time};
        }
      }
      return RecognizedPhrase{pos, time->end, dateForTime(time->time), time->time};
    }

    // Date, optionally followed by a time: "tomorrow at 3pm"
    if (auto date = dateAt(pos)) {
      if (!date->time) {
        size_t after = Text::skipWhitespace(text_, date->end);
        if (after > date->end) {
          if (auto time = timeAt(after)) {
            return RecognizedPhrase{pos, time->end, date->date, time->time, after};
          }
        }
      }
      return RecognizedPhrase{pos, date->end, date->date, date->time};
    }

    return std::nullopt;
  }

 private:
  // Offset after a mandatory whitespace run
  std::optional<size_t> spaceAfter(size_t pos) const {
    size_t next = Text::skipWhitespace(text_, pos);
    if (next == pos || next >= text_.size()) {
      return std::nullopt;
    }
    return next;
  }

  bool endsNumber(size_t pos) const {
    return Text::isBoundaryAfter(text_, pos);
  }

  std::optional<TimeMatch> timeAt(size_t pos) const {
    if (auto at = at_.matchAt(text_, pos)) {
      if (auto next = spaceAfter(at->end)) {
        if (auto clock = clockAt(*next)) {
          return clock;
        }
      }
    }
    return clockAt(pos);
  }

  std::optional<TimeMatch> clockAt(size_t pos) const {
    if (auto match = noon_.matchAt(text_, pos)) {
      return TimeMatch{match->end, {12, 0}};
    }
    if (auto match = midnight_.matchAt(text_, pos)) {
      return TimeMatch{match->end, {0, 0}};
    }

    auto hour = matchNumber(text_, pos, 2);
    if (!hour) {
      return std::nullopt;
    }

    size_t end = hour->second;
    int minute = 0;
    bool has_minutes = false;
    if (end < text_.size() && text_[end] == ':') {
      auto minutes = matchNumber(text_, end + 1, 2);
      if (!minutes || minutes->second - (end + 1) != 2) {
        return std::nullopt;
      }
      minute = minutes->first;
      end = minutes->second;
      has_minutes = true;
    }

    size_t suffix = Text::skipWhitespace(text_, end);
    if (auto am = am_.matchAt(text_, suffix)) {
      return twelveHour(hour->first, minute, false, am->end);
    }
    if (auto pm = pm_.matchAt(text_, suffix)) {
      return twelveHour(hour->first, minute, true, pm->end);
    }
    if (auto uhr = hour_suffix_.matchAt(text_, suffix)) {
      TimeOfDay time{hour->first, minute};
      if (!time.valid()) return std::nullopt;
      return TimeMatch{uhr->end, time};
    }

    if (has_minutes && endsNumber(end)) {
      TimeOfDay time{hour->first, minute};
      if (!time.valid()) return std::nullopt;
      return TimeMatch{end, time};
    }
    return std::nullopt;
  }

  static std::optional<TimeMatch> twelveHour(int hour, int minute, bool pm, size_t end) {
    if (hour < 1 || hour > 12 || minute > 59) {
      return std::nullopt;
    }
    if (pm && hour != 12) hour += 12;
    if (!pm && hour == 12) hour = 0;
    return TimeMatch{end, {hour, minute}};
  }

  std::optional<DateMatch> dateAt(size_t pos) const {
    if (auto match = relativeAt(pos)) return match;
    if (auto match = now_.matchAt(text_, pos)) {
      return DateMatch{match->end, reference_.date, reference_.time};
    }
    if (auto match = nextAt(pos)) return match;
    if (auto match = weekdayAt(pos)) return match;
    if (auto match = inPeriodAt(pos)) return match;
    if (auto match = isoAt(pos)) return match;
    if (auto match = numericAt(pos)) return match;
    if (auto match = monthFirstAt(pos)) return match;
    return dayFirstAt(pos);
  }

  std::optional<DateMatch> relativeAt(size_t pos) const {
    auto match = relative_days_.matchAt(text_, pos);
    if (!match) {
      return std::nullopt;
    }
    int offset = language_.dates.relative_days[static_cast<size_t>(match->group)].second;
    return DateMatch{match->end, addDays(reference_.date, offset), std::nullopt};
  }

  std::optional<DateMatch> nextAt(size_t pos) const {
    auto next = next_.matchAt(text_, pos);
    if (!next) {
      return std::nullopt;
    }
    auto unit = spaceAfter(next->end);
    if (!unit) {
      return std::nullopt;
    }
    if (auto weekday = weekdays_.matchAt(text_, *unit)) {
      return DateMatch{weekday->end, upcomingWeekday(weekday->group, false), std::nullopt};
    }
    if (auto period = periods_.matchAt(text_, *unit)) {
      return DateMatch{period->end, addPeriods(reference_.date, period->group, 1), std::nullopt};
    }
    return std::nullopt;
  }

  std::optional<DateMatch> weekdayAt(size_t pos) const {
    auto weekday = weekdays_.matchAt(text_, pos);
    if (!weekday) {
      return std::nullopt;
    }
    if (auto after = spaceAfter(weekday->end)) {
      if (auto next = next_after_.matchAt(text_, *after)) {
        return DateMatch{next->end, upcomingWeekday(weekday->group, false), std::nullopt};
      }
    }
    return DateMatch{weekday->end, upcomingWeekday(weekday->group, true), std::nullopt};
  }

  std::optional<DateMatch> inPeriodAt(size_t pos) const {
    auto in = in_.matchAt(text_, pos);
    if (!in) {
      return std::nullopt;
    }
    auto number_pos = spaceAfter(in->end);
    if (!number_pos) {
      return std::nullopt;
    }
    auto count = matchNumber(text_, *number_pos, 3);
    if (!count) {
      return std::nullopt;
    }
    auto unit = spaceAfter(count->second);
    if (!unit) {
      return std::nullopt;
    }
    auto period = periods_.matchAt(text_, *unit);
    if (!period) {
      return std::nullopt;
    }
    return DateMatch{period->end, addPeriods(reference_.date, period->group, count->first),
                     std::nullopt};
  }

  // 2025-03-15
  std::optional<DateMatch> isoAt(size_t pos) const {
    auto year = matchNumber(text_, pos, 4);
    if (!year || year->second - pos != 4 || !isChar(year->second, '-')) {
      return std::nullopt;
    }
    auto month = matchNumber(text_, year->second + 1, 2);
    if (!month || !isChar(month->second, '-')) {
      return std::nullopt;
    }
    auto day = matchNumber(text_, month->second + 1, 2);
    if (!day || !endsNumber(day->second)) {
      return std::nullopt;
    }
    auto date = makeDate(year->first, month->first, day->first);
    if (!date) {
      return std::nullopt;
    }
    return DateMatch{day->second, *date, std::nullopt};
  }

  // 3/15, 3/15/2025, 15.03.2025
  std::optional<DateMatch> numericAt(size_t pos) const {
    auto first = matchNumber(text_, pos, 2);
    if (!first || first->second >= text_.size()) {
      return std::nullopt;
    }
    char separator = text_[first->second];
    bool dotted = separator == '.' && !language_.dates.month_first_numeric;
    if (separator != '/' && !dotted) {
      return std::nullopt;
    }

    auto second = matchNumber(text_, first->second + 1, 2);
    if (!second) {
      return std::nullopt;
    }

    size_t end = second->second;
    std::optional<int> year;
    if (isChar(end, separator)) {
      if (auto parsed = matchNumber(text_, end + 1, 4)) {
        size_t digits = parsed->second - (end + 1);
        if (digits == 4) {
          year = parsed->first;
        } else if (digits == 2) {
          year = 2000 + parsed->first;
        } else {
          return std::nullopt;
        }
        end = parsed->second;
      }
    }
    // "3.5" reads as a decimal number, dotted dates need a year
    if (dotted && !year) {
      return std::nullopt;
    }
    if (!endsNumber(end)) {
      return std::nullopt;
    }

    int month = language_.dates.month_first_numeric ? first->first : second->first;
    int day = language_.dates.month_first_numeric ? second->first : first->first;
    return resolveDate(end, year, month, day);
  }

  // March 15, March 15th, 2025
  std::optional<DateMatch> monthFirstAt(size_t pos) const {
    auto month = months_.matchAt(text_, pos);
    if (!month) {
      return std::nullopt;
    }
    auto day_pos = spaceAfter(month->end);
    if (!day_pos) {
      return std::nullopt;
    }
    auto day = matchNumber(text_, *day_pos, 2);
    if (!day) {
      return std::nullopt;
    }

    size_t end = day->second;
    if (auto suffix = ordinal_suffix_.matchAt(text_, end)) {
      end = suffix->end;
    } else if (!endsNumber(end)) {
      return std::nullopt;
    }

    auto year = yearAfter(end, true);
    if (year) {
      end = year->second;
    }
    return resolveDate(end, year ? std::optional<int>(year->first) : std::nullopt,
                       month->group + 1, day->first);
  }

  // 15 March, 15th of March 2025, 15 de marzo de 2025, 15. März
  std::optional<DateMatch> dayFirstAt(size_t pos) const {
    auto day = matchNumber(text_, pos, 2);
    if (!day) {
      return std::nullopt;
    }

    size_t end = day->second;
    if (auto suffix = ordinal_suffix_.matchAt(text_, end, false)) {
      end = suffix->end;
    }

    auto month_pos = spaceAfter(end);
    if (!month_pos) {
      return std::nullopt;
    }
    if (auto connector = connector_.matchAt(text_, *month_pos)) {
      month_pos = spaceAfter(connector->end);
      if (!month_pos) {
        return std::nullopt;
      }
    }

    auto month = months_.matchAt(text_, *month_pos);
    if (!month) {
      return std::nullopt;
    }
    end = month->end;

    auto year = yearAfter(end, false);
    if (year) {
      end = year->second;
    }
    return resolveDate(end, year ? std::optional<int>(year->first) : std::nullopt,
                       month->group + 1, day->first);
  }

  // Four digit year after optional ",", whitespace and connector
  std::optional<std::pair<int, size_t>> yearAfter(size_t pos, bool allow_comma) const {
    size_t cursor = pos;
    if (allow_comma && isChar(cursor, ',')) {
      ++cursor;
    }
    auto year_pos = spaceAfter(cursor);
    if (!year_pos) {
      return std::nullopt;
    }
    if (auto connector = connector_.matchAt(text_, *year_pos)) {
      year_pos = spaceAfter(connector->end);
      if (!year_pos) {
        return std::nullopt;
      }
    }
    auto year = matchNumber(text_, *year_pos, 4);
    if (!year || year->second - *year_pos != 4 || !endsNumber(year->second)) {
      return std::nullopt;
    }
    return year;
  }

  std::optional<DateMatch> resolveDate(size_t end, std::optional<int> year, int month,
                                       int day) const {
    if (year) {
      auto date = makeDate(*year, month, day);
      if (!date) return std::nullopt;
      return DateMatch{end, *date, std::nullopt};
    }

    int reference_year = static_cast<int>(reference_.date.year());
    auto date = makeDate(reference_year, month, day);
    if (!date || *date < reference_.date) {
      // Year-less dates always point forward
      date = makeDate(reference_year + 1, month, day);
    }
    if (!date) {
      return std::nullopt;
    }
    return DateMatch{end, *date, std::nullopt};
  }

  CalendarDate upcomingWeekday(int weekday, bool include_today) const {
    int today = weekdayIndex(reference_.date);
    int delta = (weekday - today + 7) % 7;
    if (delta == 0 && !include_today) {
      delta = 7;
    }
    return addDays(reference_.date, delta);
  }

  CalendarDate dateForTime(const TimeOfDay& time) const {
    if (time < reference_.time) {
      return addDays(reference_.date, 1);
    }
    return reference_.date;
  }

  bool isChar(size_t pos, char c) const {
    return pos < text_.size() && text_[pos] == c;
  }

  std::string_view text_;
  const LanguageProfile& language_;
  const ReferenceInstant& reference_;
  KeywordSet relative_days_;
  KeywordSet now_;
  KeywordSet next_;
  KeywordSet next_after_;
  KeywordSet in_;
  KeywordSet at_;
  KeywordSet noon_;
  KeywordSet midnight_;
  KeywordSet am_;
  KeywordSet pm_;
  KeywordSet hour_suffix_;
  KeywordSet ordinal_suffix_;
  KeywordSet connector_;
  KeywordSet weekdays_;
  KeywordSet months_;
  KeywordSet periods_;
};

std::vector<RecognizedPhrase> RuleBasedDateRecognizer::recognize(
    std::string_view text, const LanguageProfile& language,
    const ReferenceInstant& reference) const {
  Scanner scanner(text, language, reference);
  std::vector<RecognizedPhrase> phrases;

  size_t pos = 0;
  while (pos < text.size()) {
    if (Text::isBoundaryBefore(text, pos) && !Text::isWhitespace(Text::codePointAt(text, pos))) {
      if (auto phrase = scanner.phraseAt(pos)) {
        pos = phrase->end;
        phrases.push_back(*phrase);
        continue;
      }
    }
    Text::nextCodePoint(text, pos);
  }

  return phrases;
}

}  // namespace tasklex::nlp
