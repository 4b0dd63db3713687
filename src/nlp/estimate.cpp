#include "tasklex/nlp/estimate.hpp"

#include <functional>

#include <spdlog/spdlog.h>

#include "tasklex/nlp/keyword_set.hpp"
#include "tasklex/util/text.hpp"

namespace tasklex::nlp {

using util::Text;

namespace {

struct Amount {
  size_t end;
  int minutes;
};

// <number>[ ]<unit>
std::optional<std::pair<int, size_t>> quantity(std::string_view text, size_t pos,
                                               const KeywordSet& units,
                                               bool require_end_boundary) {
  auto number = matchNumber(text, pos, 4);
  if (!number) {
    return std::nullopt;
  }
  size_t unit_pos = Text::skipWhitespace(text, number->second);
  auto unit = units.matchAt(text, unit_pos, require_end_boundary);
  if (!unit) {
    return std::nullopt;
  }
  return std::make_pair(number->first, unit->end);
}

std::optional<util::TextRange> findFirst(std::string_view text,
                                         const std::function<std::optional<Amount>(size_t)>& match,
                                         int& minutes) {
  size_t pos = 0;
  while (pos < text.size()) {
    if (Text::isBoundaryBefore(text, pos)) {
      if (auto amount = match(pos)) {
        minutes = amount->minutes;
        return util::TextRange{pos, amount->end};
      }
    }
    Text::nextCodePoint(text, pos);
  }
  return std::nullopt;
}

}  // namespace

EstimateExtraction EstimateExtractor::extract(std::string_view text,
                                              const LanguageProfile& language) {
  KeywordSet hours = KeywordSet::single(language.estimate.hours);
  KeywordSet minutes = KeywordSet::single(language.estimate.minutes);

  std::vector<std::function<std::optional<Amount>(size_t)>> patterns;

  // 1h30m, 2 hours 30 minutes
  patterns.push_back([&](size_t pos) -> std::optional<Amount> {
    auto h = quantity(text, pos, hours, false);
    if (!h) return std::nullopt;
    auto m = quantity(text, Text::skipWhitespace(text, h->second), minutes, true);
    if (!m) return std::nullopt;
    return Amount{m->second, h->first * 60 + m->first};
  });
  // 2hrs, 3 hours
  patterns.push_back([&](size_t pos) -> std::optional<Amount> {
    auto h = quantity(text, pos, hours, true);
    if (!h) return std::nullopt;
    return Amount{h->second, h->first * 60};
  });
  // 45min
  patterns.push_back([&](size_t pos) -> std::optional<Amount> {
    auto m = quantity(text, pos, minutes, true);
    if (!m) return std::nullopt;
    return Amount{m->second, m->first};
  });

  EstimateExtraction extraction;
  extraction.remaining = std::string(text);

  int total = 0;
  for (const auto& pattern : patterns) {
    int found = 0;
    if (auto range = findFirst(text, pattern, found)) {
      spdlog::debug("Estimate '{}' -> {} min", text.substr(range->start, range->length()), found);
      total += found;
      extraction.remaining = Text::removeRanges(text, {*range});
      // Later patterns search what is left
      text = extraction.remaining;
    }
  }

  if (total > 0) {
    extraction.minutes = total;
  }
  return extraction;
}

}  // namespace tasklex::nlp
