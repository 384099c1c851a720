/***
 * Name: jflow::analysis::ExtractFlow
 * Purpose: Build the structured flow model and internal call list of one method.
 * Inputs:
 *   - method_declaration: a method_declaration node
 *   - source: source text
 *   - registry: declared methods of the unit
 * Outputs: ExtractedFlow
 *   - steps: top-level FlowSequence of the body (empty without a body)
 *   - internal_calls: registered internal callees in call order, including calls
 *     made inside return expressions, conditions and arguments
 * Theory of Operation: Delegates the statement walk to detail::FlowExtractor and
 *   runs the call classifier once over the body for the adjacency list.
 */
#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "jflow/analysis/method_registry.h"
#include "jflow/model/flow_step.h"
#include "jflow/syntax/syntax_node.h"

namespace jflow {
namespace analysis {

struct ExtractedFlow {
  model::FlowSequence steps;
  std::vector<std::string> internal_calls;
};

ExtractedFlow ExtractFlow(const syntax::SyntaxNode& method_declaration,
                          std::string_view source,
                          const MethodRegistry& registry);

}  // namespace analysis
}  // namespace jflow
