/***
 * Name: trebuchet::metrics::Metrics
 * Purpose: OO metrics interface with static registry. Pipeline stages inherit
 *   this class and use ScopedTimer plus helper methods to record metrics.
 * Inputs: Phase identifiers and counter increments
 * Outputs: A static registry accessible by the application for reporting.
 * Theory of Operation: All instances share a static Registry and enabled flag.
 */
#pragma once

#include <chrono>
#include <cstdint>
#include <ostream>
#include <utility>
#include <vector>

namespace trebuchet {

namespace metrics {

class Metrics {
 public:
  enum class Phase { ReadFile, SplitLines, Digits, Words };

  struct Registry {
    bool enabled{false};
    std::vector<std::pair<Phase, std::uint64_t>> durations_ns;  // in completion order
    std::uint64_t lines{0};        // lines produced by SplitLines
    std::uint64_t word_tokens{0};  // digit-word matches seen by Part 2, either strategy
  };

  class ScopedTimer {
   public:
    explicit ScopedTimer(Phase phase)
        : phase_(phase), start_(std::chrono::steady_clock::now()) {}
    ~ScopedTimer() noexcept {
      if (!reg_.enabled) return;
      auto end = std::chrono::steady_clock::now();
      auto ns = std::chrono::duration_cast<std::chrono::nanoseconds>(end - start_).count();
      reg_.durations_ns.emplace_back(phase_, static_cast<std::uint64_t>(ns));
    }

   private:
    Phase phase_;
    std::chrono::time_point<std::chrono::steady_clock> start_;
  };

  /*** Enable: Turn recording on or off; existing entries are kept. */
  static void Enable(bool on);
  /*** Reset: Drop all entries and disable recording. */
  static void Reset();
  static Registry& GetRegistry();
  /*** CountLines: Add input lines read by FileReader. No-op while disabled. */
  static void CountLines(std::uint64_t n);
  /*** CountWordTokens: Add digit-word matches (overlaps included). No-op while disabled. */
  static void CountWordTokens(std::uint64_t n);

  static const char* PhaseName(Phase phase);
  static void PrintMetrics(const Registry& reg, std::ostream& out);
  static void PrintMetricsJson(const Registry& reg, std::ostream& out);

 protected:
  Metrics() = default;

 private:
  static Registry reg_;
};

}  // namespace metrics
}  // namespace trebuchet
