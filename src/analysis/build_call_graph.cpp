/***
 * Name: jflow::analysis::BuildCallGraph
 * Purpose: Assemble nodes, adjacency and flows for a source unit.
 */
#include "jflow/analysis/call_graph_builder.h"

#include <utility>

#include "jflow/analysis/declaration_collector.h"
#include "jflow/analysis/flow_extractor.h"

namespace jflow::analysis {

model::CallGraph BuildCallGraph(const syntax::SyntaxNode& root, std::string_view source) {
  auto declarations = CollectDeclarations(root, source);
  model::CallGraph graph;
  for (const auto& declaration : declarations.declarations) {
    auto flow = ExtractFlow(declaration.node, source, declarations.registry);
    graph.flows[declaration.name] = std::move(flow.steps);
    graph.calls[declaration.name] = std::move(flow.internal_calls);
  }
  graph.nodes = std::move(declarations.registry);
  return graph;
}

}  // namespace jflow::analysis
