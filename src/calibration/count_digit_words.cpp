/***
 * Name: trebuchet::calibration::CountDigitWords
 * Purpose: Count digit-word matches in a line without rewriting it.
 * Inputs:
 *   - line: text line
 * Outputs:
 *   - std::size_t: matches, overlaps included; equals DigitizeWords' inserted count
 */
#include "trebuchet/calibration/word_digitizer.h"

#include <cstddef>
#include <string_view>

#include "trebuchet/calibration/digit_words.h"

namespace trebuchet::calibration {

auto CountDigitWords(std::string_view line) -> std::size_t {
  std::size_t count = 0;
  for (const auto& entry : kDigitWords) {
    for (auto pos = line.find(entry.word); pos != std::string_view::npos; pos = line.find(entry.word, pos + 1)) {
      ++count;
    }
  }
  return count;
}

}  // namespace trebuchet::calibration
