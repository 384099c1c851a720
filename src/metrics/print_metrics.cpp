/***
 * Name: jflow::metrics::PrintMetrics
 * Purpose: Pretty-print collected metrics (durations, flow geometry, notes).
 * Inputs:
 *   - reg: metrics registry
 *   - out: destination stream
 * Outputs: None
 * Theory of Operation: Formats timings in milliseconds and lists counters.
 */
#include "jflow/metrics/metrics.h"

#include <iomanip>
#include <ios>
#include <ostream>

namespace jflow::metrics {

auto Metrics::PrintMetrics(const Registry& reg, std::ostream& out) -> void {
  if (!reg.enabled) {
    return;
  }
  out << "== Metrics ==\n";
  for (const auto& [phase, nanoseconds] : reg.durations_ns) {
    const double milliseconds = static_cast<double>(nanoseconds) / 1'000'000.0;
    out << "  " << PhaseName(phase) << ": " << std::fixed << std::setprecision(3) << milliseconds << " ms\n";
  }
  out << "  Flow: methods=" << reg.flow_geom.methods << ", steps=" << reg.flow_geom.steps
      << ", max_depth=" << reg.flow_geom.max_depth << "\n";
  out << "  Notes (" << reg.notes.size() << "):\n";
  for (const auto& note : reg.notes) {
    out << "    - " << note << "\n";
  }
}

}  // namespace jflow::metrics
