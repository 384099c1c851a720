/***
 * Name: FlowRenderer::RenderDecision
 * Purpose: Diamond node with Yes/No branches; both branch exits stay live.
 */
#include "jflow/render/detail/flow_renderer.h"

namespace jflow::render::detail {

Frontier FlowRenderer::RenderDecision(const model::DecisionStep& decision, const Frontier& frontier,
                                      const EdgeLabel& label) {
  const auto id = NextId();
  EmitNode(id, "{", DisplayLabel(decision.label, decision.line), "}", "decision");
  EmitClick(id, decision.offset);
  EmitEdges(frontier, id, label);

  auto exits = RenderSequence(decision.yes_branch, Frontier{id}, std::string("Yes"));
  MergeFrontier(exits, RenderSequence(decision.no_branch, Frontier{id}, std::string("No")));
  return exits;
}

}  // namespace jflow::render::detail
