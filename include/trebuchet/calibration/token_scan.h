/***
 * Name: trebuchet::calibration::ScanTokenDigits
 * Purpose: Find edge digits counting both numerals and digit words, without rewriting.
 * Inputs: A raw line
 * Outputs: EdgeDigits, or nullopt when the line holds no token
 * Theory of Operation: A token is a numeral or a kDigitWords entry. The first
 *   token is the one starting leftmost, found by a forward scan; the last token
 *   is the one starting rightmost, found by a backward scan over start positions.
 *   Yields the same values as DigitizeWords followed by FindEdgeDigits.
 */
#pragma once

#include <optional>
#include <string_view>

#include "trebuchet/calibration/edge_digits.h"

namespace trebuchet {
namespace calibration {

std::optional<EdgeDigits> ScanTokenDigits(std::string_view line);

}  // namespace calibration
}  // namespace trebuchet
