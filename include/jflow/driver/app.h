/***
 * Name: jflow::driver (app API)
 * Purpose: Declarations for top-level driver helpers used by main().
 * Inputs: CLI options and paths
 * Outputs: Render configuration, status codes
 * Theory of Operation: Keep main() minimal by factoring helpers into separate
 *   translation units; adhere to one function per .cpp file.
 */
#pragma once

#include <ostream>
#include <string>
#include <vector>

#include "jflow/driver/cli.h"
#include "jflow/model/call_graph.h"
#include "jflow/render/render_config.h"

namespace jflow {
namespace driver {

/***
 * Name: jflow::driver::BuildRenderConfig
 * Purpose: Translate CLI switches into a RenderConfig.
 * Inputs: opts (CLI)
 * Outputs: RenderConfig with default console ignores applied unless disabled
 * Theory of Operation: Throws exceptions::ConfigError for an empty ignore name.
 */
render::RenderConfig BuildRenderConfig(const driver::CliOptions& opts);

/***
 * Name: jflow::driver::WriteFileOrReport
 * Purpose: Write output, printing an error to `diag` on failure.
 * Inputs: path ("" or "-" for `out`), data, out, diag
 * Outputs: true on success, false on error (and message printed)
 */
bool WriteFileOrReport(const std::string& path, const std::string& data, std::ostream& out, std::ostream& diag);

/***
 * Name: jflow::driver::WriteFlowLog
 * Purpose: Dump every flow model to <log_path>/<timestamp>-flow.log.
 * Inputs: opts (log_path), graph
 * Outputs: true on success; false with a printed message otherwise
 * Theory of Operation: Creates the directory when missing; FlowPrinter text.
 */
bool WriteFlowLog(const driver::CliOptions& opts, const model::CallGraph& graph);

/***
 * Name: jflow::driver::ReportMetricsIfRequested
 * Purpose: Emit metrics in the requested format if enabled.
 * Inputs: opts, out (stdout), err (stderr)
 * Theory of Operation: When the artifact itself went to stdout ("" or "-") the
 *   report goes to `err` so piped output stays a clean diagram.
 */
void ReportMetricsIfRequested(const driver::CliOptions& opts, std::ostream& out, std::ostream& err);

/*** FormatServices: One external service per line. */
std::string FormatServices(const std::vector<std::string>& services);

/***
 * Name: jflow::driver::AnalyzeOnce
 * Purpose: Execute one end-to-end run from source path to emitted artifact.
 * Inputs: opts (CLI options), input_path
 * Outputs: POSIX status code (0 success, 2 error)
 * Theory of Operation: Runs staged pipeline (read → analyze → render → write).
 */
int AnalyzeOnce(const driver::CliOptions& opts, const std::string& input_path);

}  // namespace driver
}  // namespace jflow
