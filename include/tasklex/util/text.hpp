#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <unicode/umachine.h>

namespace tasklex::util {

/**
 * @brief Half-open byte range [start, end) into a UTF-8 string
 */
struct TextRange {
  size_t start = 0;
  size_t end = 0;

  size_t length() const { return end - start; }
  bool overlaps(const TextRange& other) const {
    return start < other.end && other.start < end;
  }
  bool operator==(const TextRange&) const = default;
};

/**
 * @brief UTF-8 text primitives backed by ICU
 *
 * All offsets are byte offsets. Functions that return offsets only ever
 * return code point boundaries. Case-insensitive comparisons use ICU simple
 * case folding one code point at a time, so a match keeps the byte extent it
 * has in the searched text.
 */
class Text {
 public:
  /**
   * @brief Decode the code point at pos and advance pos past it
   * @return Code point, U+FFFD for malformed input
   */
  static UChar32 nextCodePoint(std::string_view text, size_t& pos);

  /**
   * @brief Code point that ends right before pos, U_SENTINEL at the start
   */
  static UChar32 codePointBefore(std::string_view text, size_t pos);

  /**
   * @brief Code point starting at pos, U_SENTINEL at the end
   */
  static UChar32 codePointAt(std::string_view text, size_t pos);

  // Letters, digits, combining marks and underscore
  static bool isWordCodePoint(UChar32 c);
  static bool isWhitespace(UChar32 c);

  // True at a string edge or when the neighbouring code point is not a word character
  static bool isBoundaryBefore(std::string_view text, size_t pos);
  static bool isBoundaryAfter(std::string_view text, size_t pos);

  /**
   * @brief Case-insensitive match of needle at pos
   * @return Offset in text where the match ends, nullopt if no match
   */
  static std::optional<size_t> matchAt(std::string_view text, size_t pos, std::string_view needle);

  /**
   * @brief All case-insensitive occurrences of needle, left to right
   *
   * Occurrences may overlap. An empty needle yields no occurrences.
   */
  static std::vector<TextRange> findAll(std::string_view text, std::string_view needle);

  static bool containsIgnoreCase(std::string_view haystack, std::string_view needle);
  static bool equalsIgnoreCase(std::string_view a, std::string_view b);
  static std::string foldCase(std::string_view text);

  /**
   * @brief Collapse whitespace runs into a single space and trim both ends
   */
  static std::string collapseWhitespace(std::string_view text);

  /**
   * @brief Remove the given ranges and normalize the whitespace left behind
   * @param ranges Non-overlapping ranges, in any order
   */
  static std::string removeRanges(std::string_view text, std::vector<TextRange> ranges);

  static size_t skipWhitespace(std::string_view text, size_t pos);

  // First whitespace at or after pos, std::string_view::npos if none
  static size_t findWhitespace(std::string_view text, size_t pos);

  static bool containsWhitespace(std::string_view text);
  static bool isBlank(std::string_view text);
  static std::string_view trim(std::string_view text);
};

}  // namespace tasklex::util
