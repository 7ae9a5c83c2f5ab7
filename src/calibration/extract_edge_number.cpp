/***
 * Name: trebuchet::calibration::ExtractEdgeNumber
 * Purpose: Two-digit calibration value of a line, failing loudly on digit-less input.
 * Inputs:
 *   - line: raw or digitized text
 * Outputs:
 *   - int: first*10+last in [0, 99]
 * Theory of Operation: Wraps FindEdgeDigits; an empty result raises NoDigitsError
 *   without a line number (callers that know the position report it themselves).
 */
#include "trebuchet/calibration/edge_digits.h"

#include <string>
#include <string_view>

#include "trebuchet/exceptions/no_digits_error.h"

namespace trebuchet::calibration {

auto ExtractEdgeNumber(std::string_view line) -> int {
  const auto edges = FindEdgeDigits(line);
  if (!edges) {
    throw exceptions::NoDigitsError(0, std::string(line));
  }
  return edges->Value();
}

}  // namespace trebuchet::calibration
