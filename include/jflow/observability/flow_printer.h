/***
 * Name: jflow::observability::FlowPrinter
 * Purpose: Indented text dump of flow models for logs and debugging.
 * Inputs: model::CallGraph or a single FlowSequence
 * Outputs: One line per step with its kind and salient fields
 * Theory of Operation: Recursive walk; each nesting level indents two spaces.
 *   Branch, body and case payloads get a header line of their own.
 */
#pragma once

#include <sstream>
#include <string>

#include "jflow/model/call_graph.h"
#include "jflow/model/flow_step.h"

namespace jflow {
namespace observability {

class FlowPrinter {
 public:
  std::string print(const model::CallGraph& graph);
  std::string print(const model::FlowSequence& steps);

 private:
  void sequence(const model::FlowSequence& steps);
  void step(const model::FlowStep& step);
  void indent() { for (int i = 0; i < depth_; ++i) ss_ << "  "; }
  void line(const std::string& s) { indent(); ss_ << s << "\n"; }
  void reset() { ss_.str(""); ss_.clear(); depth_ = 0; }

  std::ostringstream ss_{};
  int depth_{0};
};

}  // namespace observability
}  // namespace jflow
