/***
 * Name: trebuchet::calibration::FindEdgeDigits
 * Purpose: Return the first and last numeral of a line.
 * Inputs:
 *   - line: raw or digitized text
 * Outputs:
 *   - std::optional<EdgeDigits>: nullopt when the line has no numeral
 * Theory of Operation: Strip non-numerals from both ends; the surviving ends are
 *   the edge digits (the same character when only one numeral exists).
 */
#include "trebuchet/calibration/edge_digits.h"

#include <cstddef>
#include <optional>
#include <string_view>

#include "trebuchet/calibration/digit_words.h"

namespace trebuchet::calibration {

auto FindEdgeDigits(std::string_view line) -> std::optional<EdgeDigits> {
  std::size_t head = 0;
  while (head < line.size() && !IsNumeral(line[head])) {
    ++head;
  }
  if (head == line.size()) {
    return std::nullopt;
  }
  std::size_t tail = line.size() - 1;
  while (!IsNumeral(line[tail])) {
    --tail;
  }
  return EdgeDigits{line[head] - '0', line[tail] - '0'};
}

}  // namespace trebuchet::calibration
