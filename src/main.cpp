/***
 * Name: trebuchet::main
 * Purpose: Entry point for the trebuchet CLI.
 * Inputs:
 *   - argc, argv: Standard process arguments.
 * Outputs:
 *   - int: POSIX process status code (0 on success, 2 on usage or input errors).
 * Theory of Operation:
 *   Parses CLI flags, enables metrics when requested, runs the calibration
 *   for the single input file and reports metrics after the totals. Metrics
 *   are reported for failed runs too, covering the phases that completed.
 */
#include <exception>
#include <iostream>

#include "trebuchet/driver/app.h"
#include "trebuchet/driver/cli.h"
#include "trebuchet/exceptions/trebuchet_exception.h"
#include "trebuchet/metrics/metrics.h"

using trebuchet::driver::CliOptions;

int main(int argc, char** argv) {
    try {
    using trebuchet::driver::ParseCli;
    using trebuchet::driver::PrintUsage;
    CliOptions opts;
    if (!ParseCli(argc, (const char* const*)argv, opts, std::cerr)) {
        PrintUsage(std::cerr, argv[0]); // NOLINT(*-pro-bounds-pointer-arithmetic)
        return 2;
    }
    if (opts.show_help) {
        PrintUsage(std::cout, argv[0]); // NOLINT(*-pro-bounds-pointer-arithmetic)
        return 0;
    }
    trebuchet::metrics::Metrics::Enable(opts.metrics);
    const int ret_code = trebuchet::driver::RunCalibration(opts, opts.inputs[0], std::cout, std::cerr);
    trebuchet::driver::ReportMetricsIfRequested(opts, std::cout);
    return ret_code;
    }
    catch (const trebuchet::exceptions::TrebuchetException& ex) {
        std::cerr << "trebuchet: " << ex.what() << '\n';
        return 2;
    }
    catch (const std::exception& ex) {
        std::cerr << "trebuchet: internal error: " << ex.what() << '\n';
        return 2;
    }
}
