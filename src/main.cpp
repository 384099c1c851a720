/***
 * Name: jflow::main
 * Purpose: Entry point for the jflow CLI.
 * Inputs:
 *   - argc, argv: Standard process arguments.
 * Outputs:
 *   - int: POSIX process status code (0 on success, 2 on error).
 * Theory of Operation:
 *   Parses CLI flags, enables metrics when requested, runs one analysis, and
 *   reports metrics after the result has been written.
 */
#include <exception>
#include <iostream>

#include "jflow/driver/app.h"
#include "jflow/driver/cli.h"
#include "jflow/exceptions/jflow_exception.h"
#include "jflow/metrics/metrics.h"

using jflow::driver::CliOptions;

int main(int argc, char** argv) {
  try {
    using jflow::driver::ParseCli;
    using jflow::driver::PrintUsage;
    CliOptions opts;
    if (!ParseCli(argc, (const char* const*)argv, opts, std::cerr)) {
      PrintUsage(std::cerr, argv[0]);  // NOLINT(*-pro-bounds-pointer-arithmetic)
      return 2;
    }
    if (opts.show_help) {
      PrintUsage(std::cout, argv[0]);  // NOLINT(*-pro-bounds-pointer-arithmetic)
      return 0;
    }
    jflow::metrics::Metrics::Enable(opts.metrics);
    const int ret_code = jflow::driver::AnalyzeOnce(opts, opts.inputs[0]);
    jflow::driver::ReportMetricsIfRequested(opts, std::cout, std::cerr);
    return ret_code;
  } catch (const jflow::exceptions::JflowException& ex) {
    std::cerr << "jflow: " << ex.category() << ": " << ex.what() << '\n';
    return 2;
  } catch (const std::exception& ex) {
    std::cerr << "jflow: internal error: " << ex.what() << '\n';
    return 2;
  }
}
