#pragma once

#include <optional>
#include <string>
#include <string_view>

#include "tasklex/nlp/language.hpp"

namespace tasklex::nlp {

struct EstimateExtraction {
  std::optional<int> minutes;
  std::string remaining;
};

/**
 * @brief Time estimates such as "1h30m", "2 hours" or "45min"
 *
 * The combined, hours-only and minutes-only patterns are each applied at
 * most once, in that order, and their minutes are added up.
 */
class EstimateExtractor {
 public:
  static EstimateExtraction extract(std::string_view text, const LanguageProfile& language);
};

}  // namespace tasklex::nlp
