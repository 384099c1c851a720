/***
 * Name: jflow::metrics::Metrics::PhaseName
 * Purpose: Stable display name of a pipeline phase.
 */
#include "jflow/metrics/metrics.h"

namespace jflow::metrics {

auto Metrics::PhaseName(Phase phase) -> const char* {
  switch (phase) {
    case Phase::ReadFile: return "ReadFile";
    case Phase::Parse: return "Parse";
    case Phase::Render: return "Render";
    case Phase::WriteOutput: return "WriteOutput";
  }
  return "Unknown";
}

}  // namespace jflow::metrics
