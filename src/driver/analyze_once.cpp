/***
 * Name: jflow::driver::AnalyzeOnce
 * Purpose: Execute one end-to-end run (read → analyze → render → write).
 * Inputs:
 *   - opts: CLI options
 *   - input_path: Path to input Java source
 * Outputs:
 *   - int: 0 on success; 2 on error with message printed
 * Theory of Operation: Orchestrates stages; --emit=graph skips rendering. A flow
 *   log failure is reported but does not fail the run.
 */
#include "jflow/driver/app.h"

#include <iostream>
#include <sstream>
#include <string>

#include "jflow/driver/diagnostic.h"
#include "jflow/serialize/graph_json.h"
#include "jflow/stages/analyzer.h"
#include "jflow/stages/diagram_emitter.h"
#include "jflow/stages/file_reader.h"

namespace jflow::driver {

auto AnalyzeOnce(const driver::CliOptions& opts, const std::string& input_path) -> int {
  std::string source_text;
  std::string error_message;
  if (stages::FileReader reader; !reader.Read(input_path, source_text, error_message)) {
    std::cerr << "jflow: error: " << error_message << '\n';
    return 2;
  }

  model::CallGraph graph;
  stages::AnalysisFailure failure;
  ParseOptions parse_options;
  parse_options.reject_syntax_errors = opts.strict;
  if (stages::Analyzer analyzer; !analyzer.Analyze(source_text, parse_options, graph, failure)) {
    if (failure.line == 0) {
      std::cerr << "jflow: parse error: " << failure.message << '\n';
    } else {
      const std::string shown = input_path == stages::FileReader::kStdinPath ? "<stdin>" : input_path;
      const Diagnostic diag{shown, failure.line, failure.column, failure.message};
      PrintDiagnostic(diag, source_text, ResolveColor(opts.color), std::cerr);
    }
    return 2;
  }

  if (opts.log_flow && !WriteFlowLog(opts, graph)) {
    std::cerr << "jflow: continuing without flow log" << '\n';
  }

  std::string output_text;
  if (opts.emit == CliOptions::EmitKind::Graph) {
    std::ostringstream json;
    serialize::WriteCallGraphJson(graph, json);
    output_text = json.str();
  } else {
    render::DiagramResult result;
    const auto config = BuildRenderConfig(opts);
    if (stages::DiagramEmitter emitter;
        !emitter.Emit(graph, source_text, opts.method, config, result, error_message)) {
      std::cerr << "jflow: render error: " << error_message << '\n';
      return 2;
    }
    output_text = opts.emit == CliOptions::EmitKind::Services ? FormatServices(result.external_services)
                                                              : result.diagram_text;
  }

  return WriteFileOrReport(opts.output, output_text, std::cout, std::cerr) ? 0 : 2;
}

}  // namespace jflow::driver
