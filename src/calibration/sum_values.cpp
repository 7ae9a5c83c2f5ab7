/***
 * Name: trebuchet::calibration::SumValues
 * Purpose: Total a sequence of calibration values.
 * Inputs:
 *   - values: per-line two-digit values
 * Outputs:
 *   - std::int64_t: sum, 0 for an empty sequence
 * Theory of Operation: std::accumulate with a 64-bit initial value.
 */
#include "trebuchet/calibration/summer.h"

#include <cstdint>
#include <numeric>
#include <vector>

namespace trebuchet::calibration {

auto SumValues(const std::vector<int>& values) -> std::int64_t {
  return std::accumulate(values.begin(), values.end(), std::int64_t{0});
}

}  // namespace trebuchet::calibration
