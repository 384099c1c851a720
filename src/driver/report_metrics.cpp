/***
 * Name: jflow::driver::ReportMetricsIfRequested
 * Purpose: Print the run's metrics when --metrics was given.
 * Inputs:
 *   - opts: CLI options containing metrics flags and the output path
 *   - out, err: process streams
 * Outputs: None
 * Theory of Operation: Stream choice follows the output path; format follows
 *   --metrics=json|text.
 */
#include "jflow/driver/app.h"
#include "jflow/metrics/metrics.h"

#include <ostream>

namespace jflow::driver {

auto ReportMetricsIfRequested(const driver::CliOptions& opts, std::ostream& out, std::ostream& err) -> void {
  if (!opts.metrics) {
    return;
  }
  const bool artifact_on_stdout = opts.output.empty() || opts.output == "-";
  std::ostream& dest = artifact_on_stdout ? err : out;
  const auto& reg = metrics::Metrics::GetRegistry();
  if (opts.metrics_format == driver::CliOptions::MetricsFormat::Json) {
    metrics::Metrics::PrintMetricsJson(reg, dest);
  } else {
    metrics::Metrics::PrintMetrics(reg, dest);
  }
}

}  // namespace jflow::driver
