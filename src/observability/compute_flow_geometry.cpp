/***
 * Name: jflow::observability::ComputeFlowGeometry
 * Purpose: Count methods and flow steps and measure nesting depth.
 */
#include <algorithm>
#include <cstdint>

#include "jflow/observability/flow_geometry.h"

namespace jflow::observability {

static void Walk(const model::FlowSequence& steps, std::uint64_t depth, FlowGeometry& geom) {
  for (const auto& step : steps) {
    ++geom.steps;
    geom.max_depth = std::max(geom.max_depth, depth);
    if (const auto* decision = step.as<model::DecisionStep>()) {
      Walk(decision->yes_branch, depth + 1, geom);
      Walk(decision->no_branch, depth + 1, geom);
    } else if (const auto* loop = step.as<model::LoopStep>()) {
      Walk(loop->body, depth + 1, geom);
    } else if (const auto* sw = step.as<model::SwitchStep>()) {
      for (const auto& entry : sw->cases) {
        Walk(entry.steps, depth + 1, geom);
      }
    }
  }
}

FlowGeometry ComputeFlowGeometry(const model::CallGraph& graph) {
  FlowGeometry geom{};
  geom.methods = graph.nodes.size();
  for (const auto& [name, flow] : graph.flows) {
    Walk(flow, 1, geom);
  }
  return geom;
}

}  // namespace jflow::observability
