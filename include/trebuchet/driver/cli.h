/***
 * Name: trebuchet::driver (cli)
 * Purpose: Declarations for CLI options, parsing, and usage printing.
 * Inputs: N/A (declarations only)
 * Outputs: Types and functions for CLI handling.
 * Theory of Operation: One positional input file plus a few long options that
 *   select the parts to print, the word strategy, metrics and per-line logs.
 *   Definitions live in .cpp files.
 */
#pragma once

#include <iosfwd>
#include <string>
#include <vector>

#include "trebuchet/stages/calibrator.h"

namespace trebuchet {
namespace driver {

/***
 * Name: trebuchet::driver::CliOptions
 * Purpose: Hold parsed command-line options for a trebuchet invocation.
 * Inputs: Values are populated by ParseCli.
 * Outputs: Consumed by the driver to control which totals are computed and reported.
 */
struct CliOptions {
  std::vector<std::string> inputs;  // Input text file (exactly one after parsing)
  bool show_help = false;           // -h, --help
  enum class Parts { Both, One, Two };
  Parts parts = Parts::Both;        // --part=1|2
  stages::Strategy strategy = stages::Strategy::Rewrite;  // --strategy=rewrite|scan
  bool metrics = false;             // --metrics
  enum class MetricsFormat { Text, Json };
  MetricsFormat metrics_format = MetricsFormat::Text; // --metrics[=json|text]
  std::string log_path;             // --log-path=<dir>; empty disables line logs
};

/***
 * Name: trebuchet::driver::detail::OptResult
 * Purpose: Tri-state result for option handlers.
 * Outputs: Indicates whether an argument was handled, not matched, or invalid.
 */
namespace detail {
enum class OptResult { NotMatched, Handled, Error };
}

/***
 * Name: trebuchet::driver::ParseCli
 * Purpose: Parse command-line arguments into a CliOptions structure.
 * Inputs:
 *   - argc: Argument count
 *   - argv: Argument vector
 *   - dst: Output options structure to populate
 *   - err: Stream for diagnostics on parse errors
 * Outputs:
 *   - bool: true on successful parse, false if an error occurs
 * Theory of Operation: Iterates arguments left-to-right through the handler table
 *   and requires exactly one input file unless help was requested.
 */
bool ParseCli(int argc, const char* const* argv, CliOptions& dst, std::ostream& err);

/***
 * Name: trebuchet::driver::PrintUsage
 * Purpose: Print CLI usage information for trebuchet.
 * Inputs:
 *   - out: Destination stream
 *   - argv0: Program name used in usage examples
 * Outputs: None
 */
void PrintUsage(std::ostream& out, const char* argv0);

}  // namespace driver
}  // namespace trebuchet
