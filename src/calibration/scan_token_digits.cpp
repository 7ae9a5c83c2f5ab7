/***
 * Name: trebuchet::calibration::ScanTokenDigits
 * Purpose: Edge digits over numeral and digit-word tokens of an unmodified line.
 * Inputs:
 *   - line: raw text
 * Outputs:
 *   - std::optional<EdgeDigits>: nullopt when no token exists
 * Theory of Operation: TokenAt tests one start position against the numerals and
 *   every kDigitWords entry. The forward scan stops at the first hit; the backward
 *   scan walks start positions from the end so a word like "eight" in "...eightwo"
 *   loses to the later-starting "two".
 */
#include "trebuchet/calibration/token_scan.h"

#include <cstddef>
#include <optional>
#include <string_view>

#include "trebuchet/calibration/digit_words.h"

namespace trebuchet::calibration {

static std::optional<int> TokenAt(std::string_view line, std::size_t pos) {
  if (IsNumeral(line[pos])) {
    return line[pos] - '0';
  }
  const std::string_view rest = line.substr(pos);
  for (const auto& entry : kDigitWords) {
    if (rest.compare(0, entry.word.size(), entry.word) == 0) {
      return entry.value;
    }
  }
  return std::nullopt;
}

auto ScanTokenDigits(std::string_view line) -> std::optional<EdgeDigits> {
  std::optional<int> first;
  std::size_t first_pos = 0;
  for (; first_pos < line.size(); ++first_pos) {
    first = TokenAt(line, first_pos);
    if (first) {
      break;
    }
  }
  if (!first) {
    return std::nullopt;
  }
  for (std::size_t pos = line.size(); pos-- > first_pos;) {
    if (const auto last = TokenAt(line, pos)) {
      return EdgeDigits{*first, *last};
    }
  }
  return std::nullopt;  // unreachable: first_pos itself holds a token
}

}  // namespace trebuchet::calibration
