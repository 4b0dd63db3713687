#pragma once

#include <chrono>
#include <compare>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

namespace tasklex::core {

using CalendarDate = std::chrono::year_month_day;

/**
 * @brief Floating time of day (no timezone)
 */
struct TimeOfDay {
  int hour = 0;
  int minute = 0;

  int totalMinutes() const { return hour * 60 + minute; }
  bool valid() const { return hour >= 0 && hour < 24 && minute >= 0 && minute < 60; }

  // "HH:MM"
  std::string toString() const;
  static std::optional<TimeOfDay> parse(std::string_view text);

  auto operator<=>(const TimeOfDay&) const = default;
};

// "YYYY-MM-DD"
std::string formatDate(const CalendarDate& date);
std::optional<CalendarDate> parseDate(std::string_view text);

/**
 * @brief Structured task data extracted from one line of input
 */
struct ExtractionResult {
  std::string title;
  std::optional<std::string> details;          // Lines after the first one
  std::optional<std::string> status;           // Lexicon entry id
  std::optional<std::string> priority;         // Lexicon entry id
  std::optional<CalendarDate> due_date;
  std::optional<TimeOfDay> due_time;
  std::optional<CalendarDate> scheduled_date;
  std::optional<TimeOfDay> scheduled_time;
  std::optional<int> estimate_minutes;
  std::optional<std::string> recurrence_rule;  // e.g. "FREQ=WEEKLY;BYDAY=MO"
  std::vector<std::string> contexts;
  std::vector<std::string> tags;
  std::vector<std::string> projects;

  // True when nothing besides the title was extracted
  bool hasNoFields() const;
};

/**
 * @brief JSON view of a result; absent optional fields are omitted
 */
nlohmann::json toJson(const ExtractionResult& result);

/**
 * @brief One line of a human readable result summary
 *
 * Icons are names for a UI layer to interpret.
 */
struct PreviewPart {
  std::string icon;
  std::string text;
};

std::vector<PreviewPart> previewParts(const ExtractionResult& result);

// Preview parts joined with " • "
std::string previewText(const ExtractionResult& result);

/**
 * @brief Plain English description of a recurrence rule
 * @return "every 2 weeks on Monday", or "Invalid recurrence" when the rule has no FREQ
 */
std::string describeRecurrence(std::string_view rule);

}  // namespace tasklex::core
