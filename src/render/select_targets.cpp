/***
 * Name: jflow::render::SelectTargets
 * Purpose: Decide which methods a render covers.
 * Theory of Operation: An unknown target name falls back to the public surface
 *   (public and protected methods, ascending name order via the node map).
 */
#include <optional>
#include <string>

#include "jflow/render/diagram_renderer.h"

namespace jflow::render {

TargetSelection SelectTargets(const model::CallGraph& graph, const std::optional<std::string>& method) {
  TargetSelection selection;
  if (method && graph.nodes.find(*method) != graph.nodes.end()) {
    selection.methods.push_back(*method);
    selection.resolved = true;
    return selection;
  }
  for (const auto& [name, node] : graph.nodes) {
    if (node.HasModifier("public") || node.HasModifier("protected")) {
      selection.methods.push_back(name);
    }
  }
  return selection;
}

}  // namespace jflow::render
