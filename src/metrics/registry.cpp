/***
 * Name: trebuchet::metrics::Metrics (registry)
 * Purpose: Process-wide registry storage and its mutators.
 * Inputs: Enable flag, counter increments
 * Outputs: The registry read by PrintMetrics/PrintMetricsJson.
 * Theory of Operation: Stages write, the driver reads once at exit. Counters are
 *   gated on enabled so a run without --metrics leaves the registry empty.
 */
#include "trebuchet/metrics/metrics.h"

#include <cstdint>

namespace trebuchet::metrics {

Metrics::Registry Metrics::reg_{};

auto Metrics::Enable(bool on) -> void { reg_.enabled = on; }

auto Metrics::Reset() -> void { reg_ = Registry{}; }

auto Metrics::GetRegistry() -> Registry& { return reg_; }

auto Metrics::CountLines(std::uint64_t n) -> void {
  if (reg_.enabled) {
    reg_.lines += n;
  }
}

auto Metrics::CountWordTokens(std::uint64_t n) -> void {
  if (reg_.enabled) {
    reg_.word_tokens += n;
  }
}

}  // namespace trebuchet::metrics
