/***
 * Name: FlowRenderer::RenderSequence / RenderStep
 * Purpose: Walk a FlowSequence, threading the frontier through each step.
 * Theory of Operation: The pending label is dropped once a step changes the
 *   frontier; a fully suppressed step leaves both untouched.
 */
#include <utility>

#include "jflow/render/detail/flow_renderer.h"

namespace jflow::render::detail {

Frontier FlowRenderer::RenderSequence(const model::FlowSequence& steps, Frontier frontier,
                                      EdgeLabel label) {
  for (const auto& step : steps) {
    auto next = RenderStep(step, frontier, label);
    if (next != frontier) {
      label.reset();
      frontier = std::move(next);
    }
  }
  return frontier;
}

Frontier FlowRenderer::RenderStep(const model::FlowStep& step, const Frontier& frontier,
                                  const EdgeLabel& label) {
  switch (step.kind()) {
    case model::FlowKind::Call:
      return RenderCall(*step.as<model::CallStep>(), frontier, label);
    case model::FlowKind::Decision:
      return RenderDecision(*step.as<model::DecisionStep>(), frontier, label);
    case model::FlowKind::Loop:
      return RenderLoop(*step.as<model::LoopStep>(), frontier, label);
    case model::FlowKind::Switch:
      return RenderSwitch(*step.as<model::SwitchStep>(), frontier, label);
    case model::FlowKind::Return:
      return RenderReturn(*step.as<model::ReturnStep>(), frontier, label);
  }
  return frontier;
}

}  // namespace jflow::render::detail
