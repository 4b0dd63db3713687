#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace tasklex::nlp {

struct TokenExtraction {
  std::vector<std::string> tokens;
  std::string remaining;
};

/**
 * @brief Pulls "<trigger><token>" words out of text
 *
 * A token is the run of non-whitespace right after the trigger, kept in its
 * original case. Duplicates (case-insensitive) keep their first occurrence
 * but every occurrence is removed from the text. A trigger followed by
 * "[[" captures up to the closing "]]", spaces included.
 */
class TokenListExtractor {
 public:
  static TokenExtraction extract(std::string_view text, std::string_view trigger);
};

}  // namespace tasklex::nlp
