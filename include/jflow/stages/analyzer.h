/***
 * Name: jflow::stages::Analyzer
 * Purpose: Stage class turning source text into a CallGraph.
 * Inputs: Source string and parse options
 * Outputs: CallGraph, flow geometry metrics, or a failure description
 * Theory of Operation: Calls jflow::Parse under the Parse timer and converts its
 *   exceptions into an AnalysisFailure. Syntax errors keep their position so the
 *   driver can print a caret diagnostic.
 */
#pragma once

#include <cstdint>
#include <string>

#include "jflow/jflow.h"
#include "jflow/metrics/metrics.h"
#include "jflow/model/call_graph.h"

namespace jflow {
namespace stages {

struct AnalysisFailure {
  std::string message;
  std::uint32_t line{0};    // 0 when the failure has no source position
  std::uint32_t column{0};
};

class Analyzer : public metrics::Metrics {
 public:
  /*** Analyze: Build the call graph of src. */
  bool Analyze(const std::string& src, const ParseOptions& options, model::CallGraph& out_graph,
               AnalysisFailure& failure);
};

}  // namespace stages
}  // namespace jflow
