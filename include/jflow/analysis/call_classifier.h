/***
 * Name: jflow::analysis::ClassifyCalls
 * Purpose: List every method invocation in a subtree and classify it as internal
 *   or external.
 * Inputs:
 *   - node: any subtree (statement, expression, whole body)
 *   - source: source text
 *   - registry: declared methods of the unit
 * Outputs: Call steps in document order, nested argument calls included
 * Theory of Operation: Pre-order walk over all children. An invocation is internal
 *   when it has no receiver and its name is registered, or when its receiver is
 *   exactly `this`; everything else is external.
 */
#pragma once

#include <string_view>
#include <vector>

#include "jflow/analysis/method_registry.h"
#include "jflow/model/flow_step.h"
#include "jflow/syntax/syntax_node.h"

namespace jflow {
namespace analysis {

std::vector<model::CallStep> ClassifyCalls(const syntax::SyntaxNode& node,
                                           std::string_view source,
                                           const MethodRegistry& registry);

}  // namespace analysis
}  // namespace jflow
