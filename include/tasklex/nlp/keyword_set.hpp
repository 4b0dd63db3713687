#pragma once

#include <array>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace tasklex::nlp {

using WordList = std::vector<std::string>;

struct KeywordMatch {
  size_t end = 0;
  int group = 0;
};

/**
 * @brief Case-insensitive keyword lookup over groups of synonyms
 *
 * A match reports the index of the group the keyword came from, so a set
 * built from {{"monday", "mon"}, {"tuesday", "tue"}} maps "Tue" to 1.
 * Keywords are tried longest first. Whitespace inside a keyword matches any
 * non-empty whitespace run in the text.
 */
class KeywordSet {
 public:
  KeywordSet() = default;
  explicit KeywordSet(const std::vector<WordList>& groups);

  template <size_t N>
  explicit KeywordSet(const std::array<WordList, N>& groups)
      : KeywordSet(std::vector<WordList>(groups.begin(), groups.end())) {}

  // All words in group 0
  static KeywordSet single(const WordList& words);

  /**
   * @brief Match a keyword starting exactly at pos
   * @param require_end_boundary Reject matches followed by a word character
   * @return Longest matching keyword, nullopt if none
   */
  std::optional<KeywordMatch> matchAt(std::string_view text, size_t pos,
                                      bool require_end_boundary = true) const;

  /**
   * @brief Find a keyword that ends right before pos, whitespace in between allowed
   * @return Start offset of the longest such keyword, nullopt if none
   */
  std::optional<size_t> matchBefore(std::string_view text, size_t pos) const;

  bool empty() const { return keywords_.empty(); }

 private:
  struct Keyword {
    std::string text;
    int group;
  };

  std::vector<Keyword> keywords_;
};

/**
 * @brief Parse a run of ASCII digits starting at pos
 * @return The value and the offset after the last digit
 */
std::optional<std::pair<int, size_t>> matchNumber(std::string_view text, size_t pos,
                                                  size_t max_digits = 4);

}  // namespace tasklex::nlp
