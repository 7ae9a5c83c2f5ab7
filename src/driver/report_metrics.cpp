/***
 * Name: trebuchet::driver::ReportMetricsIfRequested
 * Purpose: Print the run's metrics when --metrics was given.
 * Inputs:
 *   - opts: CLI options (metrics flag and format)
 *   - out: destination stream (stdout in main, after any totals)
 * Outputs: None
 * Theory of Operation: main calls this whatever RunCalibration returned, so a
 *   failed run still shows the phases that completed before the error.
 */
#include "trebuchet/driver/app.h"
#include "trebuchet/metrics/metrics.h"

#include <ostream>

namespace trebuchet::driver {

auto ReportMetricsIfRequested(const driver::CliOptions& opts, std::ostream& out) -> void {
  if (!opts.metrics) {
    return;
  }
  using metrics::Metrics;
  switch (opts.metrics_format) {
    case CliOptions::MetricsFormat::Json:
      Metrics::PrintMetricsJson(Metrics::GetRegistry(), out);
      break;
    case CliOptions::MetricsFormat::Text:
      Metrics::PrintMetrics(Metrics::GetRegistry(), out);
      break;
  }
}

}  // namespace trebuchet::driver
