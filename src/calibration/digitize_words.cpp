/***
 * Name: trebuchet::calibration::DigitizeWords
 * Purpose: Insert a marker-delimited numeral in front of every digit word match.
 * Inputs:
 *   - line: text line
 *   - inserted: optional out count of injected numerals
 * Outputs:
 *   - std::string: line with injected tokens; identical to line when nothing matched
 * Theory of Operation: Walk the input positions left to right; at each one, loop
 *   over kDigitWords and emit "<marker><digit><marker>" for every word starting
 *   there, then copy the original character through.
 */
#include "trebuchet/calibration/word_digitizer.h"

#include <cstddef>
#include <string>
#include <string_view>

#include "trebuchet/calibration/digit_words.h"

namespace trebuchet::calibration {

static void AppendToken(std::string& out, int value) {
  out += kDigitMarker;
  out += static_cast<char>('0' + value);
  out += kDigitMarker;
}

auto DigitizeWords(std::string_view line, std::size_t* inserted) -> std::string {
  std::string out;
  out.reserve(line.size());
  std::size_t count = 0;
  for (std::size_t pos = 0; pos < line.size(); ++pos) {
    const std::string_view rest = line.substr(pos);
    for (const auto& entry : kDigitWords) {
      if (rest.compare(0, entry.word.size(), entry.word) == 0) {
        AppendToken(out, entry.value);
        ++count;
      }
    }
    out += line[pos];
  }
  if (inserted != nullptr) {
    *inserted = count;
  }
  return out;
}

}  // namespace trebuchet::calibration
