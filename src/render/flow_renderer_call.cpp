/***
 * Name: FlowRenderer::RenderCall
 * Purpose: One node per visible call; internal calls show the method name,
 *   external calls show `External: <call text>`.
 */
#include <string>

#include "jflow/render/detail/flow_renderer.h"
#include "jflow/render/diagram_renderer.h"

namespace jflow::render::detail {

Frontier FlowRenderer::RenderCall(const model::CallStep& call, const Frontier& frontier,
                                  const EdgeLabel& label) {
  if (IsSuppressed(call, config_)) {
    return frontier;
  }
  const auto id = NextId();
  const std::string text = call.is_external ? "External: " + call.raw_text : call.name;
  EmitNode(id, "[", DisplayLabel(text, call.line), "]", call.is_external ? "external" : "internal");
  EmitClick(id, call.offset);
  EmitEdges(frontier, id, label);
  return Frontier{id};
}

}  // namespace jflow::render::detail
