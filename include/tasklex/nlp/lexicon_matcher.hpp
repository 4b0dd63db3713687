#pragma once

#include <optional>
#include <string_view>

#include "tasklex/core/lexicon.hpp"

namespace tasklex::nlp {

/**
 * @brief Finds the single best lexicon entry mentioned in a piece of text
 *
 * Each entry contributes its value and its label as match surfaces. With a
 * trigger, "<trigger><surface>" is searched first and wins over any bare
 * mention. Candidates are ranked by surface length (longest first), then
 * entry order, then leftmost position. Bare mentions must sit on word
 * boundaries on both sides; trigger mentions only need one after the
 * surface.
 */
class LexiconMatcher {
 public:
  /**
   * @brief Best match of any entry in text
   * @param text Text to search
   * @param entries Lexicon to match against
   * @param trigger Optional trigger prefix; consumed as part of the span
   * @return Span of the winning mention, nullopt if nothing qualifies
   */
  static std::optional<core::MatchSpan> findBestMatch(
      std::string_view text, const core::Lexicon& entries,
      std::optional<std::string_view> trigger = std::nullopt);

 private:
  struct Candidate {
    core::MatchSpan span;
    size_t surface_length;
    int order;
  };

  static std::optional<Candidate> bestTriggered(std::string_view text,
                                                const core::Lexicon& entries,
                                                std::string_view trigger);
  static std::optional<Candidate> bestBare(std::string_view text, const core::Lexicon& entries);
  static bool ranksBefore(const Candidate& a, const Candidate& b);
};

}  // namespace tasklex::nlp
