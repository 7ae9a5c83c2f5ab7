/***
 * Name: trebuchet::stages::Calibrator::LineValue
 * Purpose: Two-digit value of one line for the requested part.
 * Inputs:
 *   - line: raw line text
 *   - part: Digits (numerals only) or Words (numerals and digit words)
 *   - line_number: 1-based position used in the error
 * Outputs:
 *   - int: first*10+last
 * Theory of Operation: Dispatches to FindEdgeDigits, DigitizeWords+FindEdgeDigits
 *   or ScanTokenDigits. Both Words strategies count every digit-word match for
 *   metrics; the scan path only pays for the count while metrics are enabled.
 */
#include "trebuchet/stages/calibrator.h"

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

#include "trebuchet/calibration/edge_digits.h"
#include "trebuchet/calibration/token_scan.h"
#include "trebuchet/calibration/word_digitizer.h"
#include "trebuchet/exceptions/no_digits_error.h"

namespace trebuchet::stages {

auto Calibrator::LineValue(std::string_view line, Part part, std::size_t line_number) const -> int {
  std::optional<calibration::EdgeDigits> edges;
  if (part == Part::Digits) {
    edges = calibration::FindEdgeDigits(line);
  } else if (strategy_ == Strategy::Scan) {
    edges = calibration::ScanTokenDigits(line);
    if (GetRegistry().enabled) {
      CountWordTokens(calibration::CountDigitWords(line));
    }
  } else {
    std::size_t inserted = 0;
    const std::string digitized = calibration::DigitizeWords(line, &inserted);
    CountWordTokens(inserted);
    edges = calibration::FindEdgeDigits(digitized);
  }
  if (!edges) {
    throw exceptions::NoDigitsError(line_number, std::string(line));
  }
  return edges->Value();
}

}  // namespace trebuchet::stages
