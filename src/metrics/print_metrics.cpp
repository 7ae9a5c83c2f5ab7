/***
 * Name: trebuchet::metrics::PrintMetrics
 * Purpose: Pretty-print collected metrics (durations and counters).
 * Inputs:
 *   - reg: metrics registry
 *   - out: destination stream
 * Outputs: None
 * Theory of Operation: Formats timings in milliseconds and lists counters.
 */
#include "trebuchet/metrics/metrics.h"

#include <iomanip>
#include <ios>
#include <ostream>

namespace trebuchet::metrics {

auto Metrics::PrintMetrics(const Registry& reg, std::ostream& out) -> void {
  if (!reg.enabled) {
    return;
  }
  out << "== Metrics ==\n";
  for (const auto& entry : reg.durations_ns) {
    const auto phase = entry.first;
    const auto nanoseconds = entry.second;
    const double milliseconds = static_cast<double>(nanoseconds) / 1'000'000.0;
    out << "  " << PhaseName(phase) << ": " << std::fixed << std::setprecision(3) << milliseconds << " ms\n";
  }
  out << "  Lines: " << reg.lines << "\n";
  out << "  Word tokens: " << reg.word_tokens << "\n";
}

}  // namespace trebuchet::metrics
