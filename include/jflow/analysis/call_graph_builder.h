/***
 * Name: jflow::analysis::BuildCallGraph
 * Purpose: Assemble the CallGraph of a parsed source unit.
 * Inputs: syntax tree root and the source it came from
 * Outputs: model::CallGraph (nodes, calls, flows)
 * Theory of Operation: Collect declarations, then extract each declaration's flow
 *   against the complete registry. Later declarations with a repeated name
 *   replace the earlier calls/flows entries, matching the registry.
 */
#pragma once

#include <string_view>

#include "jflow/model/call_graph.h"
#include "jflow/syntax/syntax_node.h"

namespace jflow {
namespace analysis {

model::CallGraph BuildCallGraph(const syntax::SyntaxNode& root, std::string_view source);

}  // namespace analysis
}  // namespace jflow
