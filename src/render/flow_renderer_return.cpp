/***
 * Name: FlowRenderer::RenderReturn
 * Purpose: Unstyled node carrying the return statement text.
 */
#include "jflow/render/detail/flow_renderer.h"

namespace jflow::render::detail {

Frontier FlowRenderer::RenderReturn(const model::ReturnStep& step, const Frontier& frontier,
                                    const EdgeLabel& label) {
  const auto id = NextId();
  EmitNode(id, "[", DisplayLabel(step.label, step.line), "]", "");
  EmitClick(id, step.offset);
  EmitEdges(frontier, id, label);
  return Frontier{id};
}

}  // namespace jflow::render::detail
