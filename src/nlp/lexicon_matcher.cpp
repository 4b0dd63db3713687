#include "tasklex/nlp/lexicon_matcher.hpp"

#include <spdlog/spdlog.h>

#include "tasklex/util/text.hpp"

namespace tasklex::nlp {

using util::Text;

std::optional<core::MatchSpan> LexiconMatcher::findBestMatch(
    std::string_view text, const core::Lexicon& entries,
    std::optional<std::string_view> trigger) {
  if (entries.empty() || text.empty()) {
    return std::nullopt;
  }

  if (trigger && !trigger->empty()) {
    if (auto best = bestTriggered(text, entries, *trigger)) {
      spdlog::debug("Lexicon match via trigger: '{}' -> {}", best->span.matched_source,
                    best->span.canonical_id);
      return best->span;
    }
  }

  if (auto best = bestBare(text, entries)) {
    spdlog::debug("Lexicon match: '{}' -> {}", best->span.matched_source,
                  best->span.canonical_id);
    return best->span;
  }
  return std::nullopt;
}

std::optional<LexiconMatcher::Candidate> LexiconMatcher::bestTriggered(
    std::string_view text, const core::Lexicon& entries, std::string_view trigger) {
  std::optional<Candidate> best;

  for (const auto& entry : entries) {
    for (const std::string* surface : {&entry.value, &entry.label}) {
      if (Text::isBlank(*surface)) {
        continue;
      }

      std::string needle = std::string(trigger) + *surface;
      for (const auto& range : Text::findAll(text, needle)) {
        if (!Text::isBoundaryAfter(text, range.end)) {
          continue;
        }
        Candidate candidate{
          {range.start, range.end, std::string(text.substr(range.start, range.length())),
           entry.canonicalId(), true},
          surface->size(), entry.order};
        if (!best || ranksBefore(candidate, *best)) {
          best = std::move(candidate);
        }
      }
    }
  }

  return best;
}

std::optional<LexiconMatcher::Candidate> LexiconMatcher::bestBare(
    std::string_view text, const core::Lexicon& entries) {
  std::optional<Candidate> best;

  for (const auto& entry : entries) {
    for (const std::string* surface : {&entry.value, &entry.label}) {
      if (Text::isBlank(*surface)) {
        continue;
      }

      for (const auto& range : Text::findAll(text, *surface)) {
        if (!Text::isBoundaryBefore(text, range.start) || !Text::isBoundaryAfter(text, range.end)) {
          continue;
        }
        Candidate candidate{
          {range.start, range.end, std::string(text.substr(range.start, range.length())),
           entry.canonicalId(), false},
          surface->size(), entry.order};
        if (!best || ranksBefore(candidate, *best)) {
          best = std::move(candidate);
        }
      }
    }
  }

  return best;
}

bool LexiconMatcher::ranksBefore(const Candidate& a, const Candidate& b) {
  if (a.surface_length != b.surface_length) {
    return a.surface_length > b.surface_length;
  }
  if (a.order != b.order) {
    return a.order < b.order;
  }
  return a.span.start < b.span.start;
}

}  // namespace tasklex::nlp
