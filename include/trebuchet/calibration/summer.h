/***
 * Name: trebuchet::calibration::SumValues
 * Purpose: Fold per-line calibration values into a total.
 * Inputs: Sequence of two-digit values
 * Outputs: Their sum (0 for an empty sequence)
 * Theory of Operation: Left fold in a 64-bit accumulator.
 */
#pragma once

#include <cstdint>
#include <vector>

namespace trebuchet {
namespace calibration {

std::int64_t SumValues(const std::vector<int>& values);

}  // namespace calibration
}  // namespace trebuchet
