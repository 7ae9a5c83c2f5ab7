/***
 * Name: trebuchet::stages::Calibrator::Run
 * Purpose: Fold the values of all lines for one part into a total.
 * Inputs:
 *   - lines: input lines in file order
 *   - part: which total to compute
 *   - sink: optional observer of each line's value
 * Outputs:
 *   - std::int64_t: the total (0 for no lines)
 * Theory of Operation: Times itself under the part's phase, maps lines through
 *   LineValue, then sums with calibration::SumValues. The first failing line
 *   propagates its NoDigitsError; no partial total is returned.
 */
#include "trebuchet/stages/calibrator.h"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "trebuchet/calibration/summer.h"
#include "trebuchet/metrics/metrics.h"

namespace trebuchet::stages {

auto Calibrator::Run(const std::vector<std::string>& lines, Part part, const Sink& sink) const
    -> std::int64_t {
  const metrics::Metrics::ScopedTimer timer(part == Part::Digits ? Phase::Digits : Phase::Words);
  std::vector<int> values;
  values.reserve(lines.size());
  for (std::size_t i = 0; i < lines.size(); ++i) {
    const int value = LineValue(lines[i], part, i + 1);
    if (sink) {
      sink(LineContribution{i + 1, value});
    }
    values.push_back(value);
  }
  return calibration::SumValues(values);
}

}  // namespace trebuchet::stages
