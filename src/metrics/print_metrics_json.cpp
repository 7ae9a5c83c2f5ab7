/***
 * Name: trebuchet::metrics::PrintMetricsJson
 * Purpose: Print metrics in JSON for consumption by tools.
 * Inputs:
 *   - reg: metrics registry
 *   - out: destination stream
 * Outputs: None
 * Theory of Operation: Simple JSON writer; phase names are fixed identifiers and
 *   need no escaping.
 */
#include "trebuchet/metrics/metrics.h"

#include <cstddef>
#include <ostream>

namespace trebuchet::metrics {

auto Metrics::PrintMetricsJson(const Registry& reg, std::ostream& out) -> void {
  if (!reg.enabled) {
    return;
  }
  out << "{";
  // durations
  out << "\n  \"durations_ns\": [";
  for (std::size_t i = 0; i < reg.durations_ns.size(); ++i) {
    const auto& item = reg.durations_ns[i];
    out << (i != 0U ? ",\n    {" : "\n    {")
        << R"("phase": ")" << PhaseName(item.first) << R"(", "ns": )" << item.second << "}";
  }
  out << "\n  ],";
  // counters
  out << "\n  \"counters\": { \"lines\": " << reg.lines
      << ", \"word_tokens\": " << reg.word_tokens << " }\n}\n";
}

}  // namespace trebuchet::metrics
