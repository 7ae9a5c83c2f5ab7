/***
 * Name: trebuchet::stages::Calibrator
 * Purpose: Stage class computing one calibration total over a sequence of lines.
 * Inputs: Lines, the part to compute, and the word strategy for part two
 * Outputs: The total; optional per-line contributions through a sink
 * Theory of Operation: Each line is mapped to its two-digit value and the values
 *   are folded with calibration::SumValues. Part one reads numerals only. Part two
 *   either rewrites the line with DigitizeWords before extracting numerals or scans
 *   numeral and word tokens directly. A line without a digit aborts the run with a
 *   NoDigitsError carrying its 1-based position.
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <string_view>
#include <vector>

#include "trebuchet/metrics/metrics.h"

namespace trebuchet {
namespace stages {

enum class Part { Digits, Words };
enum class Strategy { Rewrite, Scan };

struct LineContribution {
  std::size_t line_number;
  int value;
};

class Calibrator : public metrics::Metrics {
 public:
  using Sink = std::function<void(const LineContribution&)>;

  explicit Calibrator(Strategy strategy = Strategy::Rewrite) : strategy_(strategy) {}

  /*** Run: Total of the line values for part; throws exceptions::NoDigitsError. */
  std::int64_t Run(const std::vector<std::string>& lines, Part part, const Sink& sink = nullptr) const;

  /*** LineValue: Value of a single line with line_number used for error reporting. */
  int LineValue(std::string_view line, Part part, std::size_t line_number) const;

 private:
  Strategy strategy_;
};

}  // namespace stages
}  // namespace trebuchet
