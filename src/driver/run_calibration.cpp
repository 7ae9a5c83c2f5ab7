/***
 * Name: trebuchet::driver::RunCalibration
 * Purpose: Execute one end-to-end run (read -> part one -> part two -> report).
 * Inputs:
 *   - opts: CLI options
 *   - input_path: Path to the input text file
 *   - out: receives the "Part N:\t<sum>" lines
 *   - err: receives diagnostics
 * Outputs:
 *   - int: 0 on success; 2 on error with message printed
 * Theory of Operation: Both totals are computed before anything is printed, so a
 *   digit-less line yields a diagnostic and no partial output. The per-line log
 *   is best effort and never changes the status.
 */
#include "trebuchet/driver/app.h"

#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

#include "trebuchet/diagnostics/diagnostic.h"
#include "trebuchet/exceptions/file_read_error.h"
#include "trebuchet/exceptions/no_digits_error.h"
#include "trebuchet/stages/calibrator.h"
#include "trebuchet/stages/file_reader.h"

namespace trebuchet::driver {

static void ReportNoDigits(const exceptions::NoDigitsError& ex,
                           const std::string& input_path,
                           stages::Part part,
                           std::ostream& err) {
  diagnostics::Diagnostic diag;
  diag.file = input_path;
  diag.line = static_cast<int>(ex.line_number());
  diag.col = 1;
  diag.message = part == stages::Part::Digits ? "no numeral found in line"
                                              : "no numeral or digit word found in line";
  diag.source_line = ex.line_text();
  diagnostics::PrintDiagnostic(err, diag, diagnostics::UseEnvColor());
}

auto RunCalibration(const driver::CliOptions& opts,
                    const std::string& input_path,
                    std::ostream& out,
                    std::ostream& err) -> int {
  std::vector<std::string> lines;
  try {
    lines = stages::FileReader::ReadLines(input_path);
  } catch (const exceptions::FileReadError& ex) {
    err << "trebuchet: " << ex.what() << '\n';
    return 2;
  }

  const bool log_lines = !opts.log_path.empty();
  std::vector<LineLogRow> rows(log_lines ? lines.size() : 0U);
  const stages::Calibrator calibrator(opts.strategy);
  std::optional<std::int64_t> part1;
  std::optional<std::int64_t> part2;
  stages::Part current = stages::Part::Digits;
  try {
    if (opts.parts != CliOptions::Parts::Two) {
      current = stages::Part::Digits;
      part1 = calibrator.Run(lines, current, [&](const stages::LineContribution& contrib) {
        if (log_lines) {
          rows[contrib.line_number - 1].line_number = contrib.line_number;
          rows[contrib.line_number - 1].part1 = contrib.value;
        }
      });
    }
    if (opts.parts != CliOptions::Parts::One) {
      current = stages::Part::Words;
      part2 = calibrator.Run(lines, current, [&](const stages::LineContribution& contrib) {
        if (log_lines) {
          rows[contrib.line_number - 1].line_number = contrib.line_number;
          rows[contrib.line_number - 1].part2 = contrib.value;
        }
      });
    }
  } catch (const exceptions::NoDigitsError& ex) {
    ReportNoDigits(ex, input_path, current, err);
    return 2;
  }

  if (part1) {
    out << "Part 1:\t" << *part1 << '\n';
  }
  if (part2) {
    out << "Part 2:\t" << *part2 << '\n';
  }
  if (log_lines) {
    // A failed log write has already printed its warning; the totals stand.
    static_cast<void>(WriteLineLog(opts.log_path, rows, err));
  }
  return 0;
}

}  // namespace trebuchet::driver
