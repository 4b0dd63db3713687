#include "tasklex/nlp/keyword_set.hpp"

#include <algorithm>

#include "tasklex/util/text.hpp"

namespace tasklex::nlp {

using util::Text;

namespace {

std::optional<size_t> matchPhrase(std::string_view text, size_t pos, std::string_view phrase) {
  size_t text_pos = pos;
  size_t phrase_pos = 0;

  while (phrase_pos < phrase.size()) {
    size_t word_end = Text::findWhitespace(phrase, phrase_pos);
    if (word_end == std::string_view::npos) {
      word_end = phrase.size();
    }

    auto end = Text::matchAt(text, text_pos, phrase.substr(phrase_pos, word_end - phrase_pos));
    if (!end) {
      return std::nullopt;
    }
    text_pos = *end;

    if (word_end == phrase.size()) {
      break;
    }
    size_t after_space = Text::skipWhitespace(text, text_pos);
    if (after_space == text_pos) {
      return std::nullopt;
    }
    text_pos = after_space;
    phrase_pos = Text::skipWhitespace(phrase, word_end);
  }

  return text_pos;
}

}  // namespace

KeywordSet::KeywordSet(const std::vector<WordList>& groups) {
  for (size_t group = 0; group < groups.size(); ++group) {
    for (const auto& word : groups[group]) {
      std::string_view trimmed = Text::trim(word);
      if (!trimmed.empty()) {
        keywords_.push_back({std::string(trimmed), static_cast<int>(group)});
      }
    }
  }

  std::stable_sort(keywords_.begin(), keywords_.end(), [](const Keyword& a, const Keyword& b) {
    return a.text.size() > b.text.size();
  });
}

KeywordSet KeywordSet::single(const WordList& words) {
  return KeywordSet(std::vector<WordList>{words});
}

std::optional<KeywordMatch> KeywordSet::matchAt(std::string_view text, size_t pos,
                                                bool require_end_boundary) const {
  for (const auto& keyword : keywords_) {
    auto end = matchPhrase(text, pos, keyword.text);
    if (!end) {
      continue;
    }
    if (require_end_boundary && !Text::isBoundaryAfter(text, *end)) {
      continue;
    }
    return KeywordMatch{*end, keyword.group};
  }
  return std::nullopt;
}

std::optional<size_t> KeywordSet::matchBefore(std::string_view text, size_t pos) const {
  if (keywords_.empty()) {
    return std::nullopt;
  }

  // Leftmost start wins, which is also the longest keyword
  size_t start = 0;
  while (start < pos) {
    if (Text::isBoundaryBefore(text, start)) {
      for (const auto& keyword : keywords_) {
        auto end = matchPhrase(text, start, keyword.text);
        if (end && *end <= pos && Text::isBoundaryAfter(text, *end) &&
            Text::skipWhitespace(text, *end) >= pos) {
          return start;
        }
      }
    }
    Text::nextCodePoint(text, start);
  }
  return std::nullopt;
}

std::optional<std::pair<int, size_t>> matchNumber(std::string_view text, size_t pos,
                                                  size_t max_digits) {
  size_t end = pos;
  int value = 0;
  while (end < text.size() && end - pos < max_digits && text[end] >= '0' && text[end] <= '9') {
    value = value * 10 + (text[end] - '0');
    ++end;
  }
  if (end == pos) {
    return std::nullopt;
  }
  // A longer digit run is not a number of the requested width
  if (end < text.size() && text[end] >= '0' && text[end] <= '9') {
    return std::nullopt;
  }
  return std::make_pair(value, end);
}

}  // namespace tasklex::nlp
