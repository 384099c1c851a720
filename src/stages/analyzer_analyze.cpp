/***
 * Name: jflow::stages::Analyzer::Analyze
 * Purpose: Parse and analyze source text, recording timing and flow geometry.
 * Inputs:
 *   - src: Java source text
 *   - options: parse options (strict mode)
 * Outputs:
 *   - out_graph: call graph on success
 *   - failure: message and optional position on failure
 * Theory of Operation: SyntaxError is caught before ParseError so its position
 *   survives.
 */
#include "jflow/stages/analyzer.h"

#include <string>

#include "jflow/exceptions/parse_error.h"
#include "jflow/exceptions/syntax_error.h"
#include "jflow/observability/flow_geometry.h"

namespace jflow::stages {

auto Analyzer::Analyze(const std::string& src, const ParseOptions& options,
                       model::CallGraph& out_graph, AnalysisFailure& failure) -> bool {
  metrics::Metrics::ScopedTimer timer(metrics::Metrics::Phase::Parse);
  try {
    out_graph = jflow::Parse(src, options);
  } catch (const exceptions::SyntaxError& ex) {
    failure = AnalysisFailure{ex.what(), ex.line(), ex.column()};
    return false;
  } catch (const exceptions::ParseError& ex) {
    failure = AnalysisFailure{ex.what(), 0, 0};
    return false;
  }
  metrics::Metrics::SetFlowGeometry(observability::ComputeFlowGeometry(out_graph));
  return true;
}

}  // namespace jflow::stages
