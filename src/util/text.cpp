#include "tasklex/util/text.hpp"

#include <algorithm>
#include <cstdint>

#include <unicode/uchar.h>
#include <unicode/utf8.h>

namespace tasklex::util {

namespace {

const uint8_t* bytes(std::string_view text) {
  return reinterpret_cast<const uint8_t*>(text.data());
}

int32_t length32(std::string_view text) {
  return static_cast<int32_t>(text.size());
}

UChar32 fold(UChar32 c) {
  return u_foldCase(c, U_FOLD_CASE_DEFAULT);
}

void appendCodePoint(std::string& out, UChar32 c) {
  uint8_t buffer[U8_MAX_LENGTH];
  int32_t written = 0;
  U8_APPEND_UNSAFE(buffer, written, c);
  out.append(reinterpret_cast<const char*>(buffer), static_cast<size_t>(written));
}

}  // namespace

UChar32 Text::nextCodePoint(std::string_view text, size_t& pos) {
  if (pos >= text.size()) {
    return U_SENTINEL;
  }
  int32_t i = static_cast<int32_t>(pos);
  UChar32 c = 0;
  U8_NEXT_OR_FFFD(bytes(text), i, length32(text), c);
  pos = static_cast<size_t>(i);
  return c;
}

UChar32 Text::codePointBefore(std::string_view text, size_t pos) {
  if (pos == 0 || pos > text.size()) {
    return U_SENTINEL;
  }
  int32_t i = static_cast<int32_t>(pos);
  UChar32 c = 0;
  U8_PREV_OR_FFFD(bytes(text), 0, i, c);
  return c;
}

UChar32 Text::codePointAt(std::string_view text, size_t pos) {
  size_t cursor = pos;
  return nextCodePoint(text, cursor);
}

bool Text::isWordCodePoint(UChar32 c) {
  if (c < 0) {
    return false;
  }
  if (c == '_' || u_isalnum(c)) {
    return true;
  }
  auto category = u_charType(c);
  return category == U_NON_SPACING_MARK || category == U_COMBINING_SPACING_MARK;
}

bool Text::isWhitespace(UChar32 c) {
  return c >= 0 && u_isUWhiteSpace(c);
}

bool Text::isBoundaryBefore(std::string_view text, size_t pos) {
  return pos == 0 || !isWordCodePoint(codePointBefore(text, pos));
}

bool Text::isBoundaryAfter(std::string_view text, size_t pos) {
  return pos >= text.size() || !isWordCodePoint(codePointAt(text, pos));
}

std::optional<size_t> Text::matchAt(std::string_view text, size_t pos, std::string_view needle) {
  if (needle.empty() || pos > text.size()) {
    return std::nullopt;
  }

  size_t text_pos = pos;
  size_t needle_pos = 0;
  while (needle_pos < needle.size()) {
    if (text_pos >= text.size()) {
      return std::nullopt;
    }
    UChar32 tc = nextCodePoint(text, text_pos);
    UChar32 nc = nextCodePoint(needle, needle_pos);
    if (tc != nc && fold(tc) != fold(nc)) {
      return std::nullopt;
    }
  }
  return text_pos;
}

std::vector<TextRange> Text::findAll(std::string_view text, std::string_view needle) {
  std::vector<TextRange> ranges;
  if (needle.empty()) {
    return ranges;
  }

  size_t pos = 0;
  while (pos < text.size()) {
    if (auto end = matchAt(text, pos, needle)) {
      ranges.push_back({pos, *end});
    }
    nextCodePoint(text, pos);
  }
  return ranges;
}

bool Text::containsIgnoreCase(std::string_view haystack, std::string_view needle) {
  if (needle.empty()) {
    return true;
  }
  size_t pos = 0;
  while (pos < haystack.size()) {
    if (matchAt(haystack, pos, needle)) {
      return true;
    }
    nextCodePoint(haystack, pos);
  }
  return false;
}

bool Text::equalsIgnoreCase(std::string_view a, std::string_view b) {
  if (a.empty() || b.empty()) {
    return a.empty() && b.empty();
  }
  auto end = matchAt(a, 0, b);
  return end.has_value() && *end == a.size();
}

std::string Text::foldCase(std::string_view text) {
  std::string folded;
  folded.reserve(text.size());
  size_t pos = 0;
  while (pos < text.size()) {
    appendCodePoint(folded, fold(nextCodePoint(text, pos)));
  }
  return folded;
}

std::string Text::collapseWhitespace(std::string_view text) {
  std::string result;
  result.reserve(text.size());

  bool pending_space = false;
  size_t pos = 0;
  while (pos < text.size()) {
    size_t start = pos;
    UChar32 c = nextCodePoint(text, pos);
    if (isWhitespace(c)) {
      pending_space = true;
      continue;
    }
    if (pending_space && !result.empty()) {
      result.push_back(' ');
    }
    pending_space = false;
    result.append(text.substr(start, pos - start));
  }
  return result;
}

std::string Text::removeRanges(std::string_view text, std::vector<TextRange> ranges) {
  std::sort(ranges.begin(), ranges.end(),
            [](const TextRange& a, const TextRange& b) { return a.start < b.start; });

  std::string kept;
  kept.reserve(text.size());
  size_t cursor = 0;
  for (const auto& range : ranges) {
    if (range.start < cursor || range.end > text.size()) {
      continue;
    }
    kept.append(text.substr(cursor, range.start - cursor));
    // Keep words on either side of the removed span apart
    kept.push_back(' ');
    cursor = range.end;
  }
  kept.append(text.substr(cursor));

  return collapseWhitespace(kept);
}

size_t Text::skipWhitespace(std::string_view text, size_t pos) {
  while (pos < text.size()) {
    size_t next = pos;
    if (!isWhitespace(nextCodePoint(text, next))) {
      break;
    }
    pos = next;
  }
  return pos;
}

size_t Text::findWhitespace(std::string_view text, size_t pos) {
  while (pos < text.size()) {
    size_t next = pos;
    if (isWhitespace(nextCodePoint(text, next))) {
      return pos;
    }
    pos = next;
  }
  return std::string_view::npos;
}

bool Text::containsWhitespace(std::string_view text) {
  return findWhitespace(text, 0) != std::string_view::npos;
}

bool Text::isBlank(std::string_view text) {
  return skipWhitespace(text, 0) == text.size();
}

std::string_view Text::trim(std::string_view text) {
  size_t start = skipWhitespace(text, 0);
  size_t end = text.size();
  while (end > start) {
    int32_t i = static_cast<int32_t>(end);
    UChar32 c = 0;
    U8_PREV_OR_FFFD(bytes(text), 0, i, c);
    if (!isWhitespace(c)) {
      break;
    }
    end = static_cast<size_t>(i);
  }
  return text.substr(start, end - start);
}

}  // namespace tasklex::util
