/***
 * Name: FlowRenderer::RenderSwitch
 * Purpose: Diamond node with one labelled branch per case, in source order.
 */
#include "jflow/render/detail/flow_renderer.h"

namespace jflow::render::detail {

Frontier FlowRenderer::RenderSwitch(const model::SwitchStep& step, const Frontier& frontier,
                                    const EdgeLabel& label) {
  const auto id = NextId();
  EmitNode(id, "{", DisplayLabel(step.label, step.line), "}", "decision");
  EmitClick(id, step.offset);
  EmitEdges(frontier, id, label);

  Frontier exits;
  for (const auto& entry : step.cases) {
    MergeFrontier(exits, RenderSequence(entry.steps, Frontier{id}, entry.label));
  }
  if (exits.empty()) {
    exits.push_back(id);
  }
  return exits;
}

}  // namespace jflow::render::detail
