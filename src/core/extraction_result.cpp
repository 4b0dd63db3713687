#include "tasklex/core/extraction_result.hpp"

#include <map>
#include <regex>
#include <sstream>

#include <fmt/format.h>

namespace tasklex::core {

namespace {

std::string joinWithPrefix(const std::vector<std::string>& items, const std::string& prefix) {
  std::ostringstream oss;
  for (size_t i = 0; i < items.size(); ++i) {
    if (i > 0) oss << ", ";
    oss << prefix << items[i];
  }
  return oss.str();
}

std::string formatWhen(const CalendarDate& date, const std::optional<TimeOfDay>& time) {
  std::string text = formatDate(date);
  if (time) {
    text += " at " + time->toString();
  }
  return text;
}

std::string weekdayName(const std::string& code) {
  static const std::map<std::string, std::string> kNames = {
    {"MO", "Monday"}, {"TU", "Tuesday"}, {"WE", "Wednesday"}, {"TH", "Thursday"},
    {"FR", "Friday"}, {"SA", "Saturday"}, {"SU", "Sunday"},
  };
  auto it = kNames.find(code);
  return it != kNames.end() ? it->second : code;
}

std::string ordinalName(int position) {
  switch (position) {
    case 1: return "first";
    case 2: return "second";
    case 3: return "third";
    case 4: return "fourth";
    case -1: return "last";
    default: return std::to_string(position) + "th";
  }
}

}  // namespace

std::string TimeOfDay::toString() const {
  return fmt::format("{:02}:{:02}", hour, minute);
}

std::optional<TimeOfDay> TimeOfDay::parse(std::string_view text) {
  static const std::regex time_regex(R"(^(\d{1,2}):(\d{2})$)");
  std::string value(text);
  std::smatch match;
  if (!std::regex_match(value, match, time_regex)) {
    return std::nullopt;
  }
  TimeOfDay time{std::stoi(match[1]), std::stoi(match[2])};
  if (!time.valid()) {
    return std::nullopt;
  }
  return time;
}

std::string formatDate(const CalendarDate& date) {
  return fmt::format("{:04}-{:02}-{:02}", static_cast<int>(date.year()),
                     static_cast<unsigned>(date.month()), static_cast<unsigned>(date.day()));
}

std::optional<CalendarDate> parseDate(std::string_view text) {
  static const std::regex date_regex(R"(^(\d{4})-(\d{2})-(\d{2})$)");
  std::string value(text);
  std::smatch match;
  if (!std::regex_match(value, match, date_regex)) {
    return std::nullopt;
  }
  CalendarDate date{std::chrono::year{std::stoi(match[1])},
                    std::chrono::month{static_cast<unsigned>(std::stoi(match[2]))},
                    std::chrono::day{static_cast<unsigned>(std::stoi(match[3]))}};
  if (!date.ok()) {
    return std::nullopt;
  }
  return date;
}

bool ExtractionResult::hasNoFields() const {
  return !status && !priority && !due_date && !due_time && !scheduled_date &&
         !scheduled_time && !estimate_minutes && !recurrence_rule &&
         contexts.empty() && tags.empty() && projects.empty();
}

nlohmann::json toJson(const ExtractionResult& result) {
  nlohmann::json json;
  json["title"] = result.title;
  if (result.details) json["details"] = *result.details;
  if (result.status) json["status"] = *result.status;
  if (result.priority) json["priority"] = *result.priority;
  if (result.due_date) json["due_date"] = formatDate(*result.due_date);
  if (result.due_time) json["due_time"] = result.due_time->toString();
  if (result.scheduled_date) json["scheduled_date"] = formatDate(*result.scheduled_date);
  if (result.scheduled_time) json["scheduled_time"] = result.scheduled_time->toString();
  if (result.estimate_minutes) json["estimate_minutes"] = *result.estimate_minutes;
  if (result.recurrence_rule) json["recurrence"] = *result.recurrence_rule;
  json["contexts"] = result.contexts;
  json["tags"] = result.tags;
  json["projects"] = result.projects;
  return json;
}

std::vector<PreviewPart> previewParts(const ExtractionResult& result) {
  std::vector<PreviewPart> parts;

  if (!result.title.empty()) {
    parts.push_back({"edit-3", "\"" + result.title + "\""});
  }
  if (result.details) {
    std::string excerpt = result.details->substr(0, 50);
    if (result.details->size() > 50) excerpt += "...";
    parts.push_back({"file-text", "Details: \"" + excerpt + "\""});
  }
  if (result.due_date) {
    parts.push_back({"calendar", "Due: " + formatWhen(*result.due_date, result.due_time)});
  }
  if (result.scheduled_date) {
    parts.push_back({"calendar-clock",
                     "Scheduled: " + formatWhen(*result.scheduled_date, result.scheduled_time)});
  }
  if (result.priority) {
    parts.push_back({"alert-triangle", "Priority: " + *result.priority});
  }
  if (result.status) {
    parts.push_back({"activity", "Status: " + *result.status});
  }
  if (!result.contexts.empty()) {
    parts.push_back({"map-pin", "Contexts: " + joinWithPrefix(result.contexts, "@")});
  }
  if (!result.projects.empty()) {
    parts.push_back({"folder", "Projects: " + joinWithPrefix(result.projects, "+")});
  }
  if (!result.tags.empty()) {
    parts.push_back({"tag", "Tags: " + joinWithPrefix(result.tags, "#")});
  }
  if (result.recurrence_rule) {
    parts.push_back({"repeat", "Recurrence: " + describeRecurrence(*result.recurrence_rule)});
  }
  if (result.estimate_minutes) {
    parts.push_back({"clock", "Estimate: " + std::to_string(*result.estimate_minutes) + " min"});
  }

  return parts;
}

std::string previewText(const ExtractionResult& result) {
  std::string text;
  for (const auto& part : previewParts(result)) {
    if (!text.empty()) text += " • ";
    text += part.text;
  }
  return text;
}

std::string describeRecurrence(std::string_view rule) {
  std::map<std::string, std::string> fields;
  std::istringstream stream{std::string(rule)};
  std::string item;
  while (std::getline(stream, item, ';')) {
    auto eq = item.find('=');
    if (eq != std::string::npos) {
      fields[item.substr(0, eq)] = item.substr(eq + 1);
    }
  }

  static const std::map<std::string, std::pair<std::string, std::string>> kUnits = {
    {"DAILY", {"day", "days"}},
    {"WEEKLY", {"week", "weeks"}},
    {"MONTHLY", {"month", "months"}},
    {"YEARLY", {"year", "years"}},
  };
  auto unit = kUnits.find(fields["FREQ"]);
  if (unit == kUnits.end()) {
    return "Invalid recurrence";
  }

  int interval = 1;
  if (!fields["INTERVAL"].empty()) {
    try {
      interval = std::stoi(fields["INTERVAL"]);
    } catch (const std::exception&) {
      return "Invalid recurrence";
    }
  }

  std::string text = interval > 1
      ? "every " + std::to_string(interval) + " " + unit->second.second
      : "every " + unit->second.first;

  if (!fields["BYDAY"].empty()) {
    text += " on ";
    if (!fields["BYSETPOS"].empty()) {
      try {
        text += "the " + ordinalName(std::stoi(fields["BYSETPOS"])) + " ";
      } catch (const std::exception&) {
        return "Invalid recurrence";
      }
    }
    text += weekdayName(fields["BYDAY"]);
  }

  return text;
}

}  // namespace tasklex::core
