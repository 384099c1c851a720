/***
 * Name: jflow::driver (cli)
 * Purpose: Declarations for CLI options, parsing, and usage printing.
 * Inputs: N/A (declarations only)
 * Outputs: Types and functions for CLI handling.
 * Theory of Operation: Small option set mapped onto ParseOptions and
 *   RenderConfig; definitions live in one-function .cpp files.
 */
#pragma once

#include <iosfwd>
#include <optional>
#include <string>
#include <vector>

namespace jflow {
namespace driver {

/***
 * Name: jflow::driver::CliOptions
 * Purpose: Hold parsed command-line options for a jflow invocation.
 * Inputs: Values are populated by ParseCli.
 * Outputs: Consumed by the driver to control analysis and rendering.
 */
struct CliOptions {
  std::vector<std::string> inputs;            // Input source file (.java)
  std::string output;                         // -o <file>; empty writes to stdout
  std::optional<std::string> method;          // -m <name>, --method=<name>
  enum class EmitKind { Mermaid, Graph, Services };
  EmitKind emit = EmitKind::Mermaid;          // --emit=mermaid|graph|services
  std::vector<std::string> ignored_variables; // --ignore-var
  std::vector<std::string> ignored_services;  // --ignore-service
  bool default_ignores = true;                // cleared by --no-default-ignores
  bool collapse = false;                      // --collapse
  bool source_ref = false;                    // --source-ref
  bool strict = false;                        // --strict
  bool show_help = false;                     // -h, --help
  bool metrics = false;                       // --metrics
  enum class MetricsFormat { Text, Json };
  MetricsFormat metrics_format = MetricsFormat::Text; // --metrics[=json|text]
  enum class ColorMode { Auto, Always, Never };
  ColorMode color = ColorMode::Auto;          // --color=auto|always|never
  bool log_flow = false;                      // --log-flow
  std::string log_path = ".";                 // --log-path=<dir>
};

/***
 * Name: jflow::driver::detail::OptResult
 * Purpose: Tri-state result for option handlers.
 * Theory of Operation: Allows the main parser to remain simple while delegating
 *   specific option formats to small helpers.
 */
namespace detail {
enum class OptResult { NotMatched, Handled, Error };
}

/***
 * Name: jflow::driver::ParseCli
 * Purpose: Parse command-line arguments into a CliOptions structure.
 * Inputs:
 *   - argc: Argument count
 *   - argv: Argument vector
 *   - dst: Output options structure to populate
 *   - err: Stream for diagnostics on parse errors
 * Outputs:
 *   - bool: true on successful parse, false if an error occurs
 * Theory of Operation: Iterates arguments left-to-right through the handler
 *   table. Exactly one input file is required unless help was requested.
 */
bool ParseCli(int argc, const char* const* argv, CliOptions& dst, std::ostream& err);

/*** PrintUsage: Print CLI usage information for jflow. */
void PrintUsage(std::ostream& out, const char* argv0);

}  // namespace driver
}  // namespace jflow
