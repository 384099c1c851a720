/***
 * Name: jflow::metrics::Metrics
 * Purpose: OO metrics interface with static registry. Pipeline stages inherit
 *   this class and use ScopedTimer plus helper methods to record metrics.
 * Inputs: Phase identifiers and payloads (flow geometry, notes)
 * Outputs: A static registry accessible by the application for reporting.
 * Theory of Operation: All instances share a static Registry and enabled flag.
 *   Only stage classes record into it; the library entry points never do.
 */
#pragma once

#include <chrono>
#include <cstdint>
#include <ostream>
#include <string>
#include <utility>
#include <vector>

#include "jflow/observability/flow_geometry.h"

namespace jflow {

namespace metrics {

class Metrics {
 public:
  enum class Phase { ReadFile, Parse, Render, WriteOutput };

  struct Registry {
    bool enabled{false};
    std::vector<std::pair<Phase, std::uint64_t>> durations_ns;
    observability::FlowGeometry flow_geom{};
    std::vector<std::string> notes;
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

  static void Enable(bool on) { reg_.enabled = on; }
  static Registry& GetRegistry() { return reg_; }
  /*** Reset: Drop recorded data; keeps the enabled flag. */
  static void Reset() { reg_ = Registry{reg_.enabled, {}, {}, {}}; }
  static void RecordNote(std::string note) { if (reg_.enabled) reg_.notes.emplace_back(std::move(note)); }
  static void SetFlowGeometry(const observability::FlowGeometry& g) { if (reg_.enabled) reg_.flow_geom = g; }

  static const char* PhaseName(Phase phase);
  static void PrintMetrics(const Registry& reg, std::ostream& out);
  static void PrintMetricsJson(const Registry& reg, std::ostream& out);

 protected:
  Metrics() = default;

 private:
  static Registry reg_;
};

inline Metrics::Registry Metrics::reg_{};

}  // namespace metrics
}  // namespace jflow
