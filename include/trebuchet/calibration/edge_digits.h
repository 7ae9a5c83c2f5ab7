/***
 * Name: trebuchet::calibration (edge digits)
 * Purpose: Locate the first and last numeral of a line and combine them.
 * Inputs: A raw or digitized line
 * Outputs: EdgeDigits or the two-digit calibration value
 * Theory of Operation: Scan from the left for the first numeral and from the
 *   right for the last; every non-numeral (markers included) is skipped.
 *   A single numeral serves as both edges.
 */
#pragma once

#include <optional>
#include <string_view>

namespace trebuchet {
namespace calibration {

struct EdgeDigits {
  int first{0};
  int last{0};

  int Value() const { return first * 10 + last; }
};

/*** FindEdgeDigits: Edge numerals of line, or nullopt when it has none. */
std::optional<EdgeDigits> FindEdgeDigits(std::string_view line);

/*** ExtractEdgeNumber: first*10+last; throws exceptions::NoDigitsError when there is no numeral. */
int ExtractEdgeNumber(std::string_view line);

}  // namespace calibration
}  // namespace trebuchet
