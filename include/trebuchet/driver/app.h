/***
 * Name: trebuchet::driver (app API)
 * Purpose: Declarations for top-level driver helpers used by main().
 * Inputs: CLI options and paths
 * Outputs: Printed totals, diagnostics, metrics, logs and status codes
 * Theory of Operation: Keep main() minimal by factoring helpers into separate
 *   translation units; one function per .cpp file.
 */
#pragma once

#include <cstddef>
#include <iosfwd>
#include <optional>
#include <string>
#include <vector>

#include "trebuchet/driver/cli.h"

namespace trebuchet {
namespace driver {

/***
 * Name: trebuchet::driver::LineLogRow
 * Purpose: One entry of the per-line log: a line's value for each computed part.
 */
struct LineLogRow {
  std::size_t line_number{0};
  std::optional<int> part1;
  std::optional<int> part2;
};

/***
 * Name: trebuchet::driver::FormatLineLog
 * Purpose: Render log rows as "line <n>: part1=<v> part2=<v>" text.
 * Inputs: rows
 * Outputs: Log file contents; parts that were not computed are omitted
 */
std::string FormatLineLog(const std::vector<LineLogRow>& rows);

/***
 * Name: trebuchet::driver::WriteLineLog
 * Purpose: Write the per-line log into a timestamped file under log_dir.
 * Inputs: log_dir, rows, err (warnings)
 * Outputs: true on success; false after printing a warning
 * Theory of Operation: Creates the directory when missing and names the file
 *   "<YYYYmmdd-HHMMSS>-calibration.lines.log". Failures never abort the run.
 */
bool WriteLineLog(const std::string& log_dir, const std::vector<LineLogRow>& rows, std::ostream& err);

/***
 * Name: trebuchet::driver::ReportMetricsIfRequested
 * Purpose: Emit metrics in the requested format if enabled.
 * Inputs: opts (CLI options), out (destination)
 * Outputs: None
 * Theory of Operation: Reads the global Metrics registry and prints either JSON or text.
 *   Called whatever RunCalibration returned.
 */
void ReportMetricsIfRequested(const driver::CliOptions& opts, std::ostream& out);

/***
 * Name: trebuchet::driver::RunCalibration
 * Purpose: Compute and print the requested totals for one input file.
 * Inputs: opts (CLI options), input_path, out (results), err (diagnostics)
 * Outputs: POSIX status code (0 success, 2 error)
 * Theory of Operation: Runs read -> part one -> part two; prints totals only when
 *   every requested part succeeded.
 */
int RunCalibration(const driver::CliOptions& opts,
                   const std::string& input_path,
                   std::ostream& out,
                   std::ostream& err);

}  // namespace driver
}  // namespace trebuchet
