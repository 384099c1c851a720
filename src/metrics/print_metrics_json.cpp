/***
 * Name: jflow::metrics::PrintMetricsJson
 * Purpose: Print metrics in JSON for consumption by tools.
 * Inputs:
 *   - reg: metrics registry
 *   - out: destination stream
 * Outputs: None
 * Theory of Operation: Simple JSON writer; strings go through support::JsonEscape.
 */
#include "jflow/metrics/metrics.h"

#include <cstddef>
#include <ostream>

#include "jflow/support/text.h"

namespace jflow::metrics {

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
  // flow geometry
  out << "\n  \"flow\": { \"methods\": " << reg.flow_geom.methods
      << ", \"steps\": " << reg.flow_geom.steps
      << ", \"max_depth\": " << reg.flow_geom.max_depth << " },";
  // notes
  out << "\n  \"notes\": [";
  for (std::size_t i = 0; i < reg.notes.size(); ++i) {
    out << (i != 0U ? ", " : " ") << "\"" << support::JsonEscape(reg.notes[i]) << "\"";
  }
  out << " ]\n}\n";
}

}  // namespace jflow::metrics
