#include "tasklex/nlp/token_list.hpp"

#include <algorithm>

#include "tasklex/util/text.hpp"

namespace tasklex::nlp {

using util::Text;
using util::TextRange;

namespace {

bool isTriggerRun(std::string_view token, std::string_view trigger) {
  while (token.starts_with(trigger)) {
    token.remove_prefix(trigger.size());
  }
  return token.empty();
}

}  // namespace

TokenExtraction TokenListExtractor::extract(std::string_view text, std::string_view trigger) {
  TokenExtraction extraction;
  if (trigger.empty()) {
    extraction.remaining = std::string(text);
    return extraction;
  }

  std::vector<TextRange> consumed;
  std::vector<std::string> folded;

  size_t pos = 0;
  while (pos < text.size()) {
    if (text.compare(pos, trigger.size(), trigger) != 0) {
      Text::nextCodePoint(text, pos);
      continue;
    }

    size_t token_start = pos + trigger.size();
    size_t token_end = std::string_view::npos;

    // +[[Note with spaces]]
    if (text.compare(token_start, 2, "[[") == 0) {
      auto close = text.find("]]", token_start + 2);
      if (close != std::string_view::npos && close > token_start + 2) {
        token_end = close + 2;
      }
    }
    if (token_end == std::string_view::npos) {
      token_end = Text::findWhitespace(text, token_start);
      if (token_end == std::string_view::npos) {
        token_end = text.size();
      }
    }

    if (token_end == token_start) {
      // Lone trigger character
      pos = token_start;
      continue;
    }

    // "C++", "##": a run of triggers is not a token
    if (isTriggerRun(text.substr(token_start, token_end - token_start), trigger)) {
      pos = token_end;
      continue;
    }

    std::string token(text.substr(token_start, token_end - token_start));
    std::string key = Text::foldCase(token);
    if (std::find(folded.begin(), folded.end(), key) == folded.end()) {
      folded.push_back(key);
      extraction.tokens.push_back(std::move(token));
    }
    consumed.push_back({pos, token_end});
    pos = token_end;
  }

  extraction.remaining = consumed.empty() ? std::string(text) : Text::removeRanges(text, consumed);
  return extraction;
}

}  // namespace tasklex::nlp
