/***
 * Name: FlowRenderer::RenderLoop
 * Purpose: Loop header node, body, and dashed repeat edges back to the header.
 *   Flow continues from the header only.
 */
#include "jflow/render/detail/flow_renderer.h"

namespace jflow::render::detail {

Frontier FlowRenderer::RenderLoop(const model::LoopStep& loop, const Frontier& frontier,
                                  const EdgeLabel& label) {
  const auto id = NextId();
  EmitNode(id, "{{", DisplayLabel(loop.label, loop.line), "}}", "loop");
  EmitClick(id, loop.offset);
  EmitEdges(frontier, id, label);

  const auto exits = RenderSequence(loop.body, Frontier{id}, std::string("loop body"));
  for (const auto& exit : exits) {
    if (exit != id) {
      out_ << "    " << exit << " -.->|repeat| " << id << '\n';
    }
  }
  return Frontier{id};
}

}  // namespace jflow::render::detail
