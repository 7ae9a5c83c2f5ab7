/***
 * Name: trebuchet::metrics::Metrics::PhaseName
 * Purpose: Stable display name for a metrics phase.
 * Inputs: phase
 * Outputs: Static C string
 */
#include "trebuchet/metrics/metrics.h"

namespace trebuchet::metrics {

auto Metrics::PhaseName(Phase phase) -> const char* {
  switch (phase) {
    case Phase::ReadFile: return "ReadFile";
    case Phase::SplitLines: return "SplitLines";
    case Phase::Digits: return "Digits";
    case Phase::Words: return "Words";
  }
  return "Unknown";
}

}  // namespace trebuchet::metrics
